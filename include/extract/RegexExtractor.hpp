#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <boost/regex.hpp>

#include "core/Line.hpp"
#include "core/Specs.hpp"

namespace Linex
{
    namespace Extract
    {
        /**
         * CompiledPattern
         *
         * Immutable regular expression compiled once per run (Boost.Regex,
         * ECMAScript/Perl grammar, icase when requested). Constructing it is
         * the only place a pattern is compiled; extractors hold it by
         * reference. Boost's matcher keeps its backtracking state on the heap,
         * so line length is bounded by memory, not by the call stack.
         */
        class CompiledPattern
        {
        public:
            /// Throws Core::PatternCompileError if the expression is invalid.
            CompiledPattern(std::string source, bool caseInsensitive);

            const boost::regex &regex() const noexcept { return m_regex; }
            const std::string &source() const noexcept { return m_source; }
            bool caseInsensitive() const noexcept { return m_caseInsensitive; }

            /// Number of capture groups declared by the pattern.
            std::size_t groupCount() const noexcept { return m_groupCount; }

        private:
            std::string  m_source;
            bool         m_caseInsensitive;
            boost::regex m_regex;
            std::size_t  m_groupCount;
        };

        /**
         * RegexExtractor
         *
         * One leftmost search per input text; emits what the GroupSelector
         * asks for:
         *  - WholeLine:  the input text, unchanged
         *  - WholeMatch: the matched span
         *  - Group(n):   group n, empty when it did not participate
         *  - Groups:     the listed groups joined by the separator
         *  - AllGroups:  every group joined by the separator (the whole match
         *                when the pattern has no groups)
         *
         * No match yields std::nullopt. A search the engine abandons (its
         * complexity or memory limit reached) throws Core::PatternMatchError.
         */
        class RegexExtractor
        {
        public:
            /// Throws Core::ConfigurationError if the selector names a missing group.
            RegexExtractor(const CompiledPattern &pattern,
                           Core::GroupSelector selector,
                           std::string separator = " ");

            std::optional<Core::ExtractResult> extract(std::string_view text,
                                                       std::size_t sourceLine = 0) const;

            const Core::GroupSelector &selector() const noexcept { return m_selector; }
            const std::string &separator() const noexcept { return m_separator; }

        private:
            const CompiledPattern &m_pattern;
            Core::GroupSelector    m_selector;
            std::string            m_separator;
        };

    } // namespace Extract
} // namespace Linex
