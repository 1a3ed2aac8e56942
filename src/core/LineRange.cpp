#include "core/LineRange.hpp"

#include <optional>

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace Linex
{
namespace Core
{

namespace
{
    [[noreturn]] void badRange(std::string_view text, const std::string& why)
    {
        throw ConfigurationError("invalid line range '" + std::string(text) + "': " + why +
                                 " (expected N, N-M, N-$, $ or $-K)");
    }

    std::size_t parseBound(std::string_view full, std::string_view part)
    {
        const auto value = Utils::parseInteger<std::size_t>(part);
        if (!value)
            badRange(full, "'" + std::string(part) + "' is not a positive integer");
        if (*value == 0)
            badRange(full, "line numbers start at 1");
        return *value;
    }
} // anonymous namespace

LineRange LineRange::single(std::size_t n) { return LineRange(Kind::Single, n, n); }
LineRange LineRange::between(std::size_t first, std::size_t last) { return LineRange(Kind::Between, first, last); }
LineRange LineRange::from(std::size_t first) { return LineRange(Kind::From, first, 0); }
LineRange LineRange::last() { return LineRange(Kind::Last, 1, 0); }
LineRange LineRange::lastN(std::size_t count) { return LineRange(Kind::LastN, count, 0); }

LineRange LineRange::parse(std::string_view text)
{
    const std::string_view t = Utils::trim(text);
    if (t.empty())
        badRange(text, "empty");

    if (t == "$")
        return last();

    const auto dash = t.find('-');
    if (dash == std::string_view::npos)
        return single(parseBound(text, t));

    const std::string_view lhs = Utils::trim(t.substr(0, dash));
    const std::string_view rhs = Utils::trim(t.substr(dash + 1));

    if (lhs == "$")
    {
        if (rhs == "$")
            badRange(text, "'$-$' is not a range");
        return lastN(parseBound(text, rhs));
    }

    const std::size_t first = parseBound(text, lhs);
    if (rhs == "$")
        return from(first);

    return between(first, parseBound(text, rhs));
}

std::size_t LineRange::tailSize() const noexcept
{
    switch (m_kind)
    {
    case Kind::Last:  return 1;
    case Kind::LastN: return m_first;
    default:          return 0;
    }
}

bool LineRange::contains(std::size_t index) const noexcept
{
    switch (m_kind)
    {
    case Kind::Single:
    case Kind::Between:
        return index >= m_first && index <= m_last;
    case Kind::From:
        return index >= m_first;
    default:
        return false;
    }
}

bool LineRange::exhaustedAt(std::size_t index) const noexcept
{
    switch (m_kind)
    {
    case Kind::Single:
    case Kind::Between:
        return index > m_last || m_last < m_first;
    default:
        return false;
    }
}

std::string LineRange::toString() const
{
    switch (m_kind)
    {
    case Kind::Single:  return std::to_string(m_first);
    case Kind::Between: return std::to_string(m_first) + "-" + std::to_string(m_last);
    case Kind::From:    return std::to_string(m_first) + "-$";
    case Kind::Last:    return "$";
    case Kind::LastN:   return "$-" + std::to_string(m_first);
    }
    return "?";
}

} // namespace Core
} // namespace Linex
