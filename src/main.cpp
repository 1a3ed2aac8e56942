#include <exception>
#include <iostream>
#include <string>

#include "cli/ArgParser.hpp"
#include "core/Errors.hpp"
#include "input/FileReader.hpp"
#include "pipeline/PipelineDriver.hpp"
#include "utils/Logger.hpp"

namespace
{
    void configureLogger(const Linex::Cli::CliOptions &opts)
    {
        using Linex::Utils::LogLevel;

        LogLevel level = opts.logLevel.value_or(LogLevel::WARN);
        if (opts.verbose)
            level = LogLevel::DEBUG;

        auto &logger = Linex::Utils::getLogger();
        if (opts.logFile)
        {
            logger = Linex::Utils::Logger(*opts.logFile, level);
            if (!logger.hasFile())
                logger.warn("Cannot open log file: " + *opts.logFile);
        }
        else
        {
            logger.setLevel(level);
        }
    }

    int run(int argc, char *argv[])
    {
        auto &logger = Linex::Utils::getLogger();
        logger.setLevel(Linex::Utils::LogLevel::WARN);

        Linex::Cli::ArgParser parser(argc, argv);
        const auto opts = parser.parse();

        if (opts.help)
        {
            std::cout << Linex::Cli::ArgParser::usage(argv[0]);
            return 0;
        }

        configureLogger(opts);
        if (opts.configFile)
            logger.debug("Config file: " + *opts.configFile);

        // Validates the configuration and compiles the pattern before any input is touched.
        const Linex::Pipeline::PipelineDriver driver(opts.pipeline);

        Linex::Input::FileReader reader;
        if (opts.inputFile)
        {
            if (!reader.open(*opts.inputFile))
                throw Linex::Core::IOError("cannot open input file: " + *opts.inputFile);
        }
        else
        {
            reader.useStdin();
            if (reader.stdinIsTerminal())
                throw Linex::Core::IOError("no input: pass -f FILE or pipe data on standard input");
        }

        logger.debug("Input: " + reader.filePath());

        const auto stats = driver.run(reader.stream(), std::cout);

        logger.debug("Processed " + std::to_string(stats.linesRead) + " lines from " + reader.filePath());
        return static_cast<int>(Linex::Core::ExitCode::Success);
    }
} // anonymous namespace

int main(int argc, char *argv[])
{
    std::ios::sync_with_stdio(false);

    try
    {
        return run(argc, argv);
    }
    catch (const Linex::Core::Error &ex)
    {
        Linex::Utils::getLogger().error(ex.what());
        if (ex.exitCode() == Linex::Core::ExitCode::ConfigurationError)
            std::cerr << "Try '" << argv[0] << " --help' for usage.\n";
        return static_cast<int>(ex.exitCode());
    }
    catch (const std::exception &ex)
    {
        Linex::Utils::getLogger().critical(std::string("Unexpected failure: ") + ex.what());
        return static_cast<int>(Linex::Core::ExitCode::InternalError);
    }
}
