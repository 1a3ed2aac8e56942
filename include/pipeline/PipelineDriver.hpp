#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "core/Line.hpp"
#include "core/PipelineConfig.hpp"
#include "extract/AnchorLocator.hpp"
#include "extract/RegexExtractor.hpp"
#include "extract/TrimPolicy.hpp"

namespace Linex
{
    namespace Pipeline
    {
        /**
         * PipelineDriver
         *
         * Wires the stages in their fixed order:
         *   line range -> anchor locator -> trim policy -> regex extractor -> aggregator
         *
         * Construction does all fatal checking up front (configuration
         * predicates, pattern compilation, group selector bounds), so run()
         * can only fail on I/O. A driver is immutable after construction and
         * can run several inputs.
         */
        class PipelineDriver
        {
        public:
            struct RunStats
            {
                std::size_t linesRead = 0;      ///< physical lines consumed from the input
                std::size_t linesSelected = 0;  ///< lines inside the line range
                std::size_t linesMatched = 0;   ///< selected lines that produced a value
                std::size_t valuesWritten = 0;  ///< output lines written
                bool stoppedEarly = false;      ///< upper range bound reached before end of input
            };

            /**
             * Throws Core::ConfigurationError or Core::PatternCompileError.
             */
            explicit PipelineDriver(Core::PipelineConfig config);

            PipelineDriver(const PipelineDriver &)            = delete;
            PipelineDriver &operator=(const PipelineDriver &) = delete;

            /**
             * Value one line contributes, or std::nullopt when an anchor or
             * the pattern does not match. Range filtering is not applied here.
             */
            std::optional<std::string> processLine(const Core::Line &line) const;

            /// Stream input through all stages into output. Throws Core::IOError.
            RunStats run(std::istream &input, std::ostream &output) const;

            const Core::PipelineConfig &config() const noexcept { return m_config; }

        private:
            Core::PipelineConfig                      m_config;
            std::optional<Extract::AnchorLocator>     m_anchor;
            Extract::TrimPolicy                       m_trim;
            std::unique_ptr<Extract::CompiledPattern> m_pattern;
            std::unique_ptr<Extract::RegexExtractor>  m_regex;   // refers to *m_pattern
        };

    } // namespace Pipeline
} // namespace Linex
