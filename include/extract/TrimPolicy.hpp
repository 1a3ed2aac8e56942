#pragma once

#include <cstddef>
#include <string>

#include "core/Line.hpp"
#include "core/Specs.hpp"

namespace Linex
{
    namespace Extract
    {
        /**
         * TrimPolicy
         *
         * Drops characters from the two ends of an anchor-bounded extraction.
         * Default counts are the anchor lengths recorded in the result, so a
         * start anchor of "all" (length 0) makes a default omit-first a no-op.
         * Both ends are measured on the same raw text; when they overlap the
         * result is empty.
         */
        class TrimPolicy
        {
        public:
            explicit TrimPolicy(Core::TrimSpec spec) noexcept : m_spec(spec) {}

            std::string apply(const Core::ExtractResult &result) const;

            /// Leading bytes apply() removes from this result.
            std::size_t leadingCount(const Core::ExtractResult &result) const noexcept;

            /// Trailing bytes apply() removes from this result.
            std::size_t trailingCount(const Core::ExtractResult &result) const noexcept;

            const Core::TrimSpec &spec() const noexcept { return m_spec; }

        private:
            Core::TrimSpec m_spec;
        };

    } // namespace Extract
} // namespace Linex
