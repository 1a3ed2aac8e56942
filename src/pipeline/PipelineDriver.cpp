#include "pipeline/PipelineDriver.hpp"

#include <string_view>
#include <utility>

#include "aggregate/ResultAggregator.hpp"
#include "input/LineSource.hpp"
#include "utils/Logger.hpp"

namespace Linex
{
    namespace Pipeline
    {
        namespace
        {
            Core::PipelineConfig validated(Core::PipelineConfig config)
            {
                config.validate();
                return config;
            }
        } // anonymous namespace

        PipelineDriver::PipelineDriver(Core::PipelineConfig config)
            : m_config(validated(std::move(config))),
              m_trim(m_config.trim)
        {
            if (m_config.start)
            {
                m_anchor.emplace(*m_config.start, m_config.end, m_config.caseInsensitive);
            }

            if (m_config.pattern)
            {
                m_pattern = std::make_unique<Extract::CompiledPattern>(*m_config.pattern,
                                                                       m_config.caseInsensitive);
                m_regex = std::make_unique<Extract::RegexExtractor>(*m_pattern,
                                                                    m_config.selector,
                                                                    m_config.groupSeparator);
            }

            Utils::getLogger().debug("Pipeline configured: " + m_config.describe());
        }

        std::optional<std::string> PipelineDriver::processLine(const Core::Line &line) const
        {
            std::string located;
            std::string_view text = line.text;

            if (m_anchor)
            {
                auto result = m_anchor->locate(line);
                if (!result)
                {
                    return std::nullopt;
                }
                located = m_trim.apply(*result);
                text = located;
            }

            if (m_regex)
            {
                auto result = m_regex->extract(text, line.index);
                if (!result)
                {
                    return std::nullopt;
                }
                return std::move(result->raw);
            }

            return std::string(text);
        }

        PipelineDriver::RunStats PipelineDriver::run(std::istream &input, std::ostream &output) const
        {
            auto &logger = Utils::getLogger();

            Input::LineSource source(input, m_config.lineRange, m_config.stripWhitespace);
            Aggregate::ResultAggregator aggregator(m_config.aggregation, output, m_config.countsSeparator);

            RunStats stats;
            while (auto line = source.next())
            {
                ++stats.linesSelected;
                if (auto value = processLine(*line))
                {
                    ++stats.linesMatched;
                    aggregator.add(std::move(*value));
                }
            }
            aggregator.finish();
            output.flush();

            stats.linesRead = source.linesRead();
            stats.stoppedEarly = source.stoppedEarly();
            stats.valuesWritten = aggregator.written();

            logger.debug("Run finished: read=" + std::to_string(stats.linesRead) +
                         " selected=" + std::to_string(stats.linesSelected) +
                         " matched=" + std::to_string(stats.linesMatched) +
                         " written=" + std::to_string(stats.valuesWritten) +
                         (stats.stoppedEarly ? " (stopped at range bound)" : ""));

            if (stats.valuesWritten == 0)
            {
                logger.info("No pattern found");
            }

            return stats;
        }

    } // namespace Pipeline
} // namespace Linex
