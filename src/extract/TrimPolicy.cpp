#include "extract/TrimPolicy.hpp"

namespace Linex
{
    namespace Extract
    {
        std::size_t TrimPolicy::leadingCount(const Core::ExtractResult &result) const noexcept
        {
            if (!m_spec.omitFirst)
                return 0;
            return m_spec.omitFirstCount.value_or(result.startAnchorLength);
        }

        std::size_t TrimPolicy::trailingCount(const Core::ExtractResult &result) const noexcept
        {
            if (!m_spec.omitLast)
                return 0;
            return m_spec.omitLastCount.value_or(result.endAnchorLength);
        }

        std::string TrimPolicy::apply(const Core::ExtractResult &result) const
        {
            const std::size_t size = result.raw.size();
            const std::size_t lead = leadingCount(result);
            const std::size_t tail = trailingCount(result);

            if (lead >= size || tail >= size - lead)
                return lead == 0 && tail == 0 ? result.raw : std::string();

            return result.raw.substr(lead, size - lead - tail);
        }

    } // namespace Extract
} // namespace Linex
