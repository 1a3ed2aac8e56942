#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/Specs.hpp"

namespace Linex
{
    namespace Aggregate
    {
        /**
         * ResultAggregator
         *
         * Collects the per-line extraction results of a run and writes them
         * to the output stream, one per line.
         *
         *  - Default: pass-through, written immediately in input order.
         *  - unique (no sort/counts): still streaming; repeated values are
         *    suppressed. Memory grows with the number of distinct values.
         *  - counts: value -> occurrence count, written by finish() as
         *    "<value><separator><count>" in first-seen order unless sorted.
         *    Empty values are not tabulated.
         *  - sort: everything is buffered until finish(). By value (byte-wise,
         *    or IPv4-aware) or by count, ties broken by value ascending.
         *
         * With caseInsensitive, unique/counts keys are ASCII-folded and the
         * first spelling seen is the one written.
         */
        class ResultAggregator
        {
        public:
            ResultAggregator(Core::AggregationConfig config,
                             std::ostream &output,
                             std::string countsSeparator = " ");

            ResultAggregator(const ResultAggregator &)            = delete;
            ResultAggregator &operator=(const ResultAggregator &) = delete;

            /// Accept one extracted value.
            void add(std::string value);

            /// Flush buffered modes. Idempotent; add() must not follow.
            void finish();

            /// Values passed to add().
            std::size_t received() const noexcept { return m_received; }

            /// Lines written to the output so far.
            std::size_t written() const noexcept { return m_written; }

            /// Distinct keys seen in unique/counts modes; 0 in other modes.
            std::size_t distinctKeys() const noexcept { return m_index.size(); }

            const Core::AggregationConfig &config() const noexcept { return m_config; }

        private:
            struct Entry
            {
                std::string value;
                std::size_t count = 0;
                std::optional<std::uint32_t> ipv4;   // sort key, filled by finish()
            };

            std::string keyOf(const std::string &value) const;

            /// Count value under its key, creating the entry on first sight.
            void record(std::string value);

            void sortEntries();
            void writeLine(const std::string &line);

        private:
            Core::AggregationConfig m_config;
            std::ostream           &m_output;
            std::string             m_countsSeparator;

            std::vector<Entry>                           m_entries;
            std::unordered_map<std::string, std::size_t> m_index;   // key -> m_entries slot

            std::size_t m_received = 0;
            std::size_t m_written = 0;
            bool        m_finished = false;
        };

        /// Dotted-quad IPv4 address as a 32-bit value, std::nullopt otherwise.
        std::optional<std::uint32_t> parseIpv4(std::string_view text);

    } // namespace Aggregate
} // namespace Linex
