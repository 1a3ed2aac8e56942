#include "extract/AnchorLocator.hpp"

#include <utility>

#include "utils/StringUtils.hpp"

namespace Linex
{
    namespace Extract
    {
        AnchorLocator::AnchorLocator(Core::AnchorSpec start,
                                     std::optional<Core::EndSpec> end,
                                     bool caseInsensitive)
            : m_start(std::move(start)),
              m_end(std::move(end)),
              m_caseInsensitive(caseInsensitive)
        {
            m_startKey = m_caseInsensitive ? Utils::toLower(m_start.token) : m_start.token;
            if (m_end)
            {
                m_endKey = m_caseInsensitive ? Utils::toLower(m_end->token) : m_end->token;
            }
        }

        std::size_t AnchorLocator::findNth(std::string_view haystack,
                                           std::string_view token,
                                           std::size_t n,
                                           std::size_t from) noexcept
        {
            if (token.empty() || n == 0)
            {
                return std::string_view::npos;
            }

            std::size_t pos = haystack.find(token, from);
            for (std::size_t i = 1; i < n && pos != std::string_view::npos; ++i)
            {
                pos = haystack.find(token, pos + token.size());
            }
            return pos;
        }

        std::optional<Core::ExtractResult> AnchorLocator::locate(const Core::Line &line) const
        {
            return locate(line.text, line.index);
        }

        std::optional<Core::ExtractResult> AnchorLocator::locate(std::string_view text,
                                                                 std::size_t sourceLine) const
        {
            // Folding is byte-length preserving, so offsets found in 'haystack' apply to 'text'.
            std::string folded;
            std::string_view haystack = text;
            if (m_caseInsensitive)
            {
                folded = Utils::toLower(text);
                haystack = folded;
            }

            const std::size_t first = haystack.find(m_startKey);
            if (m_startKey.empty() || first == std::string_view::npos)
            {
                return std::nullopt;
            }

            std::size_t regionStart = 0;
            std::size_t startAnchorLength = 0;
            if (!m_start.occurrence.isAll())
            {
                regionStart = findNth(haystack, m_startKey, m_start.occurrence.n(), first);
                if (regionStart == std::string_view::npos)
                {
                    return std::nullopt;
                }
                startAnchorLength = m_startKey.size();
            }

            std::size_t regionEnd = text.size();
            std::size_t endAnchorLength = 0;
            if (m_end && !m_end->occurrence.isAll())
            {
                const std::size_t endPos = findNth(haystack, m_endKey, m_end->occurrence.n(),
                                                   regionStart + startAnchorLength);
                if (endPos == std::string_view::npos)
                {
                    return std::nullopt;
                }
                regionEnd = endPos + m_endKey.size();
                endAnchorLength = m_endKey.size();
            }

            Core::ExtractResult result;
            result.raw = std::string(text.substr(regionStart, regionEnd - regionStart));
            result.startOffset = regionStart;
            result.endOffset = regionEnd;
            result.sourceLine = sourceLine;
            result.startAnchorLength = startAnchorLength;
            result.endAnchorLength = endAnchorLength;
            return result;
        }

    } // namespace Extract
} // namespace Linex
