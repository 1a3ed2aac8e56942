#include "core/Specs.hpp"

#include <algorithm>

#include "utils/StringUtils.hpp"

namespace Linex
{
namespace Core
{

std::string Occurrence::toString() const
{
    return isAll() ? std::string("all") : std::to_string(m_n);
}

std::size_t GroupSelector::highestIndex() const noexcept
{
    if (m_indices.empty())
        return 0;
    return *std::max_element(m_indices.begin(), m_indices.end());
}

std::string GroupSelector::toString() const
{
    switch (m_kind)
    {
    case Kind::WholeLine:  return "line";
    case Kind::WholeMatch: return "0";
    case Kind::AllGroups:  return "all";
    case Kind::Group:
    case Kind::Groups:
    {
        std::vector<std::string> parts;
        parts.reserve(m_indices.size());
        for (std::size_t idx : m_indices)
            parts.push_back(std::to_string(idx));
        return Utils::join(parts, " ");
    }
    }
    return "line";
}

} // namespace Core
} // namespace Linex
