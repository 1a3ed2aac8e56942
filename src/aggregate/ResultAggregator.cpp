#include "aggregate/ResultAggregator.hpp"

#include <algorithm>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Linex
{
    namespace Aggregate
    {
        std::optional<std::uint32_t> parseIpv4(std::string_view text)
        {
            const auto octets = Utils::split(text, '.', /*keepEmpty=*/true);
            if (octets.size() != 4)
                return std::nullopt;

            std::uint32_t value = 0;
            for (std::string_view octet : octets)
            {
                if (octet.size() > 3 || !Utils::isDigits(octet))
                    return std::nullopt;
                const auto part = Utils::parseInteger<unsigned>(octet);
                if (!part || *part > 255)
                    return std::nullopt;
                value = (value << 8) | *part;
            }
            return value;
        }

        ResultAggregator::ResultAggregator(Core::AggregationConfig config,
                                           std::ostream &output,
                                           std::string countsSeparator)
            : m_config(config),
              m_output(output),
              m_countsSeparator(std::move(countsSeparator))
        {
        }

        std::string ResultAggregator::keyOf(const std::string &value) const
        {
            return m_config.caseInsensitive ? Utils::toLower(value) : value;
        }

        void ResultAggregator::record(std::string value)
        {
            std::string key = keyOf(value);
            auto it = m_index.find(key);
            if (it != m_index.end())
            {
                ++m_entries[it->second].count;
                return;
            }

            m_index.emplace(std::move(key), m_entries.size());
            Entry entry;
            entry.value = std::move(value);
            entry.count = 1;
            m_entries.push_back(std::move(entry));
        }

        void ResultAggregator::add(std::string value)
        {
            ++m_received;

            if (m_config.counts)
            {
                if (!value.empty())
                    record(std::move(value));
                return;
            }

            if (m_config.sort != Core::SortOrder::None)
            {
                if (m_config.unique)
                {
                    record(std::move(value));
                }
                else
                {
                    Entry entry;
                    entry.value = std::move(value);
                    entry.count = 1;
                    m_entries.push_back(std::move(entry));
                }
                return;
            }

            // Streaming modes.
            if (m_config.unique)
            {
                const std::string key = keyOf(value);
                if (!m_index.emplace(key, m_index.size()).second)
                    return;
            }
            writeLine(value);
        }

        void ResultAggregator::sortEntries()
        {
            if (m_config.sort == Core::SortOrder::None)
                return;

            // Pre-compute address keys once instead of re-parsing in the comparator.
            if (m_config.ipAware)
            {
                for (auto &e : m_entries)
                    e.ipv4 = parseIpv4(e.value);
            }

            const auto valueLess = [](const Entry &a, const Entry &b) {
                if (a.ipv4 || b.ipv4)
                {
                    if (a.ipv4 && b.ipv4)
                        return *a.ipv4 < *b.ipv4;
                    return static_cast<bool>(a.ipv4);   // addresses before other values
                }
                return a.value < b.value;
            };

            const bool descending = m_config.sort == Core::SortOrder::Descending;

            if (m_config.sortBy == Core::SortKey::Count)
            {
                std::stable_sort(m_entries.begin(), m_entries.end(),
                                 [&](const Entry &a, const Entry &b) {
                                     if (a.count != b.count)
                                         return descending ? a.count > b.count : a.count < b.count;
                                     return a.value < b.value;
                                 });
            }
            else if (descending)
            {
                std::stable_sort(m_entries.begin(), m_entries.end(),
                                 [&](const Entry &a, const Entry &b) { return valueLess(b, a); });
            }
            else
            {
                std::stable_sort(m_entries.begin(), m_entries.end(), valueLess);
            }
        }

        void ResultAggregator::finish()
        {
            if (m_finished)
                return;
            m_finished = true;

            if (!m_config.buffered())
                return;

            sortEntries();

            for (const auto &e : m_entries)
            {
                if (m_config.counts)
                    writeLine(e.value + m_countsSeparator + std::to_string(e.count));
                else
                    writeLine(e.value);
            }

            Utils::getLogger().debug("Aggregator wrote " + std::to_string(m_written) + " lines from " +
                                     std::to_string(m_received) + " values (" +
                                     std::to_string(m_entries.size()) + " buffered)");
        }

        void ResultAggregator::writeLine(const std::string &line)
        {
            m_output << line << '\n';
            if (m_output.bad())
                throw Core::IOError("write to output failed after " + std::to_string(m_written) + " lines");
            ++m_written;
        }

    } // namespace Aggregate
} // namespace Linex
