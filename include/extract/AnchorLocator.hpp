#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "core/Line.hpp"
#include "core/Specs.hpp"

namespace Linex
{
    namespace Extract
    {
        /**
         * AnchorLocator
         *
         * Finds the region of a line bounded by literal start/end anchors.
         *
         *  - The line must contain the start token; otherwise it is excluded.
         *  - Start Nth(n): the region begins at the n-th occurrence of the
         *    start token and includes it. Start All: the region begins at 0.
         *  - End Nth(m): the end token is searched for right after the matched
         *    start anchor text; the region ends after its m-th occurrence and
         *    includes it. End absent or All: the region runs to end of line.
         *  - Occurrences are counted left to right, non-overlapping.
         *  - Missing occurrences exclude the line (std::nullopt), never throw.
         *
         * Tokens are folded once at construction when case-insensitive, so a
         * locator is built per run and reused for every line.
         */
        class AnchorLocator
        {
        public:
            AnchorLocator(Core::AnchorSpec start,
                          std::optional<Core::EndSpec> end,
                          bool caseInsensitive);

            std::optional<Core::ExtractResult> locate(const Core::Line &line) const;

            /// Same as above for text without a line index (sourceLine = 0).
            std::optional<Core::ExtractResult> locate(std::string_view text,
                                                      std::size_t sourceLine = 0) const;

            /**
             * Offset of the n-th (1-based) non-overlapping occurrence of
             * token in haystack at or after from; npos if there are fewer.
             */
            static std::size_t findNth(std::string_view haystack,
                                       std::string_view token,
                                       std::size_t n,
                                       std::size_t from = 0) noexcept;

            const Core::AnchorSpec &start() const noexcept { return m_start; }
            const std::optional<Core::EndSpec> &end() const noexcept { return m_end; }

        private:
            Core::AnchorSpec              m_start;
            std::optional<Core::EndSpec>  m_end;
            bool                          m_caseInsensitive;

            // Tokens as compared against the (possibly folded) line.
            std::string                   m_startKey;
            std::string                   m_endKey;
        };

    } // namespace Extract
} // namespace Linex
