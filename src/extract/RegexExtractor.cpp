#include "extract/RegexExtractor.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <boost/regex.hpp>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Linex
{
    namespace Extract
    {
        namespace
        {
            boost::regex compile(const std::string &source, bool caseInsensitive)
            {
                boost::regex::flag_type flags = boost::regex::ECMAScript;
                if (caseInsensitive)
                    flags |= boost::regex::icase;

                try
                {
                    return boost::regex(source, flags);
                }
                catch (const boost::regex_error &ex)
                {
                    throw Core::PatternCompileError(source, ex.what());
                }
            }

            using Match = boost::match_results<const char *>;

            std::string groupText(const Match &m, std::size_t index)
            {
                // A non-participating group yields an empty string, not an error.
                return m[index].matched ? m[index].str() : std::string();
            }
        } // anonymous namespace

        // ------------ CompiledPattern ------------

        CompiledPattern::CompiledPattern(std::string source, bool caseInsensitive)
            : m_source(std::move(source)),
              m_caseInsensitive(caseInsensitive),
              m_regex(compile(m_source, caseInsensitive)),
              m_groupCount(m_regex.mark_count())
        {
            Utils::getLogger().debug("Compiled pattern '" + m_source + "' (" +
                                     std::to_string(m_groupCount) + " capture groups" +
                                     (m_caseInsensitive ? ", case-insensitive)" : ")"));
        }

        // ------------ RegexExtractor ------------

        RegexExtractor::RegexExtractor(const CompiledPattern &pattern,
                                       Core::GroupSelector selector,
                                       std::string separator)
            : m_pattern(pattern),
              m_selector(std::move(selector)),
              m_separator(std::move(separator))
        {
            const std::size_t highest = m_selector.highestIndex();
            if (highest > m_pattern.groupCount())
            {
                throw Core::ConfigurationError("group " + std::to_string(highest) +
                                               " requested but pattern '" + m_pattern.source() +
                                               "' has only " + std::to_string(m_pattern.groupCount()) +
                                               " capture groups");
            }
            const auto &indices = m_selector.indices();
            if (m_selector.kind() == Core::GroupSelector::Kind::Groups &&
                std::find(indices.begin(), indices.end(), 0) != indices.end())
            {
                throw Core::ConfigurationError("group lists start at 1");
            }
        }

        std::optional<Core::ExtractResult> RegexExtractor::extract(std::string_view text,
                                                                   std::size_t sourceLine) const
        {
            // A default-constructed string_view has a null data pointer.
            const char *first = text.empty() ? "" : text.data();
            const char *last = first + text.size();

            Match m;
            try
            {
                if (!boost::regex_search(first, last, m, m_pattern.regex()))
                {
                    return std::nullopt;
                }
            }
            catch (const boost::regex_error &ex)
            {
                throw Core::PatternMatchError(m_pattern.source(), sourceLine, ex.what());
            }

            Core::ExtractResult result;
            result.sourceLine = sourceLine;
            result.startOffset = static_cast<std::size_t>(m.position(std::size_t{0}));
            result.endOffset = result.startOffset + static_cast<std::size_t>(m.length(0));

            switch (m_selector.kind())
            {
            case Core::GroupSelector::Kind::WholeLine:
                result.raw = std::string(text);
                result.startOffset = 0;
                result.endOffset = text.size();
                break;

            case Core::GroupSelector::Kind::WholeMatch:
                result.raw = m.str(0);
                break;

            case Core::GroupSelector::Kind::Group:
            {
                const std::size_t idx = m_selector.indices().front();
                result.raw = groupText(m, idx);
                if (m[idx].matched)
                {
                    result.startOffset = static_cast<std::size_t>(m.position(idx));
                    result.endOffset = result.startOffset + static_cast<std::size_t>(m.length(idx));
                }
                break;
            }

            case Core::GroupSelector::Kind::Groups:
            {
                std::vector<std::string> parts;
                parts.reserve(m_selector.indices().size());
                for (std::size_t idx : m_selector.indices())
                    parts.push_back(groupText(m, idx));
                result.raw = Utils::join(parts, m_separator);
                break;
            }

            case Core::GroupSelector::Kind::AllGroups:
            {
                if (m_pattern.groupCount() == 0)
                {
                    result.raw = m.str(0);
                    break;
                }
                std::vector<std::string> parts;
                parts.reserve(m_pattern.groupCount());
                for (std::size_t idx = 1; idx <= m_pattern.groupCount(); ++idx)
                    parts.push_back(groupText(m, idx));
                result.raw = Utils::join(parts, m_separator);
                break;
            }
            }

            return result;
        }

    } // namespace Extract
} // namespace Linex
