#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/PipelineConfig.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

namespace Linex
{
    namespace Cli
    {
        /**
         * Everything the command line (plus an optional config file) asks for.
         */
        struct CliOptions
        {
            Core::PipelineConfig pipeline;

            std::optional<std::string> inputFile;    // -f; standard input otherwise
            std::optional<std::string> configFile;   // --config

            std::optional<Utils::LogLevel> logLevel; // log_level from the config file
            std::optional<std::string>     logFile;  // log_file from the config file

            bool verbose = false;
            bool help = false;
        };

        /**
         * ArgParser
         *
         * Turns argv into CliOptions. Usage errors (unknown flag, missing
         * value, conflicting flags) throw Core::ConfigurationError; an
         * unreadable --config file throws Core::IOError.
         *
         * Several flags take an optional trailing value. The next argument is
         * consumed only when it has the expected shape:
         *   -s/-e TOKEN [N|all]      digits or "all"
         *   -p REGEX [N|all|"N M"]   digits, "all" or a list of digits
         *   -of/-ol [N]              digits
         *
         * Config file values are applied first; command-line flags win.
         */
        class ArgParser
        {
        public:
            explicit ArgParser(std::vector<std::string> args);
            ArgParser(int argc, const char *const *argv);

            CliOptions parse();

            /// Apply recognised config keys to opts without undoing flags already set.
            static void applyConfig(const Utils::ConfigLoader &config, CliOptions &opts);

            static std::string usage(std::string_view progName);

        private:
            bool atEnd() const noexcept { return m_pos >= m_args.size(); }
            const std::string &requireValue(const std::string &flag);
            std::optional<std::string> takeIf(bool (*accept)(std::string_view));

            Core::AnchorSpec parseAnchor(const std::string &flag);
            std::optional<std::size_t> parseCount(const std::string &flag);

        private:
            std::vector<std::string> m_args;
            std::size_t              m_pos = 0;
        };

        /// "N" -> group N ("0" -> whole match), "all" -> all groups, "N M .." -> group list.
        Core::GroupSelector parseGroupSelector(std::string_view text);

    } // namespace Cli
} // namespace Linex
