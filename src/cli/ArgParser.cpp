#include "cli/ArgParser.hpp"

#include <sstream>
#include <utility>

#include "core/Errors.hpp"
#include "core/LineRange.hpp"
#include "utils/StringUtils.hpp"

namespace Linex
{
    namespace Cli
    {
        namespace
        {
            bool isAll(std::string_view text)
            {
                return Utils::iequals(text, "all");
            }

            bool isCount(std::string_view text)
            {
                return Utils::isDigits(text);
            }

            bool isOccurrence(std::string_view text)
            {
                return isCount(text) || isAll(text);
            }

            bool isSelector(std::string_view text)
            {
                if (isAll(text))
                    return true;
                const auto tokens = Utils::splitWhitespace(text);
                if (tokens.empty())
                    return false;
                for (const auto &t : tokens)
                {
                    if (!Utils::isDigits(t))
                        return false;
                }
                return true;
            }

            std::size_t toCount(const std::string &flag, std::string_view text)
            {
                const auto value = Utils::parseInteger<std::size_t>(text);
                if (!value)
                    throw Core::ConfigurationError("invalid number '" + std::string(text) + "' for " + flag);
                return *value;
            }

            bool toBool(const Utils::ConfigLoader &config, std::string_view key)
            {
                const auto value = config.getBool(key);
                if (!value)
                {
                    throw Core::ConfigurationError("config key '" + std::string(key) + "' expects a boolean, got '" +
                                                   config.getStringOr(key, "") + "'");
                }
                return *value;
            }
        } // anonymous namespace

        Core::GroupSelector parseGroupSelector(std::string_view text)
        {
            if (isAll(Utils::trim(text)))
                return Core::GroupSelector::allGroups();

            const auto tokens = Utils::splitWhitespace(text);
            if (tokens.empty())
                throw Core::ConfigurationError("empty group selector");

            std::vector<std::size_t> indices;
            indices.reserve(tokens.size());
            for (const auto &t : tokens)
                indices.push_back(toCount("group selector", t));

            if (indices.size() == 1)
            {
                return indices.front() == 0 ? Core::GroupSelector::wholeMatch()
                                            : Core::GroupSelector::group(indices.front());
            }
            return Core::GroupSelector::groups(std::move(indices));
        }

        ArgParser::ArgParser(std::vector<std::string> args)
            : m_args(std::move(args))
        {
        }

        ArgParser::ArgParser(int argc, const char *const *argv)
        {
            for (int i = 1; i < argc; ++i)
                m_args.emplace_back(argv[i]);
        }

        const std::string &ArgParser::requireValue(const std::string &flag)
        {
            if (atEnd())
                throw Core::ConfigurationError(flag + " requires a value");
            return m_args[m_pos++];
        }

        std::optional<std::string> ArgParser::takeIf(bool (*accept)(std::string_view))
        {
            if (!atEnd() && accept(m_args[m_pos]))
                return m_args[m_pos++];
            return std::nullopt;
        }

        Core::AnchorSpec ArgParser::parseAnchor(const std::string &flag)
        {
            Core::AnchorSpec anchor;
            anchor.token = requireValue(flag);

            if (auto occ = takeIf(isOccurrence))
            {
                anchor.occurrence = isAll(*occ) ? Core::Occurrence::all()
                                                : Core::Occurrence::nth(toCount(flag, *occ));
            }
            return anchor;
        }

        std::optional<std::size_t> ArgParser::parseCount(const std::string &flag)
        {
            if (auto count = takeIf(isCount))
                return toCount(flag, *count);
            return std::nullopt;
        }

        CliOptions ArgParser::parse()
        {
            CliOptions opts;
            auto &pipeline = opts.pipeline;

            bool omitAll = false;
            bool sortAscending = false;
            bool sortDescending = false;

            while (!atEnd())
            {
                const std::string arg = m_args[m_pos++];

                if (arg == "-s" || arg == "--start")
                {
                    pipeline.start = parseAnchor(arg);
                }
                else if (arg == "-e" || arg == "--end")
                {
                    pipeline.end = parseAnchor(arg);
                }
                else if (arg == "-p" || arg == "--pattern")
                {
                    pipeline.pattern = requireValue(arg);
                    if (auto selector = takeIf(isSelector))
                        pipeline.selector = parseGroupSelector(*selector);
                }
                else if (arg == "-l" || arg == "--lines")
                {
                    pipeline.lineRange = Core::LineRange::parse(requireValue(arg));
                }
                else if (arg == "-i" || arg == "--ignore-case")
                {
                    pipeline.caseInsensitive = true;
                    pipeline.aggregation.caseInsensitive = true;
                }
                else if (arg == "-of" || arg == "--omit-first")
                {
                    pipeline.trim.omitFirst = true;
                    pipeline.trim.omitFirstCount = parseCount(arg);
                }
                else if (arg == "-ol" || arg == "--omit-last")
                {
                    pipeline.trim.omitLast = true;
                    pipeline.trim.omitLastCount = parseCount(arg);
                }
                else if (arg == "-O" || arg == "--omit-all")
                {
                    omitAll = true;
                }
                else if (arg == "-u" || arg == "--unique")
                {
                    pipeline.aggregation.unique = true;
                }
                else if (arg == "-S" || arg == "--sort")
                {
                    sortAscending = true;
                }
                else if (arg == "-r" || arg == "--rev")
                {
                    sortDescending = true;
                }
                else if (arg == "--sort-by")
                {
                    const std::string &key = requireValue(arg);
                    if (Utils::iequals(key, "value"))
                        pipeline.aggregation.sortBy = Core::SortKey::Value;
                    else if (Utils::iequals(key, "count"))
                        pipeline.aggregation.sortBy = Core::SortKey::Count;
                    else
                        throw Core::ConfigurationError("--sort-by expects 'value' or 'count', got '" + key + "'");
                }
                else if (arg == "-c" || arg == "--counts")
                {
                    pipeline.aggregation.counts = true;
                }
                else if (arg == "--ip-sort")
                {
                    pipeline.aggregation.ipAware = true;
                }
                else if (arg == "--strip")
                {
                    pipeline.stripWhitespace = true;
                }
                else if (arg == "-f" || arg == "--file")
                {
                    opts.inputFile = requireValue(arg);
                }
                else if (arg == "--config")
                {
                    opts.configFile = requireValue(arg);
                }
                else if (arg == "-v" || arg == "--verbose")
                {
                    opts.verbose = true;
                }
                else if (arg == "-h" || arg == "--help")
                {
                    opts.help = true;
                }
                else
                {
                    throw Core::ConfigurationError("unknown argument '" + arg + "'");
                }
            }

            if (omitAll)
            {
                if (pipeline.trim.omitFirst || pipeline.trim.omitLast)
                    throw Core::ConfigurationError("-O cannot be combined with -of or -ol");
                pipeline.trim.omitFirst = true;
                pipeline.trim.omitLast = true;
            }

            if (sortDescending)
                pipeline.aggregation.sort = Core::SortOrder::Descending;
            else if (sortAscending)
                pipeline.aggregation.sort = Core::SortOrder::Ascending;

            if (opts.configFile)
            {
                Utils::ConfigLoader config;
                if (!config.loadFromFile(*opts.configFile))
                    throw Core::IOError("cannot open config file: " + *opts.configFile);
                applyConfig(config, opts);
            }

            return opts;
        }

        void ArgParser::applyConfig(const Utils::ConfigLoader &config, CliOptions &opts)
        {
            if (auto level = config.getString("log_level"))
            {
                const auto parsed = Utils::parseLogLevel(*level);
                if (!parsed)
                    throw Core::ConfigurationError("unknown log_level '" + *level + "'");
                opts.logLevel = *parsed;
            }

            if (auto file = config.getString("log_file"))
                opts.logFile = *file;

            if (auto sep = config.getString("group_separator"))
                opts.pipeline.groupSeparator = *sep;

            if (auto sep = config.getString("counts_separator"))
                opts.pipeline.countsSeparator = *sep;

            // Boolean flags can only be switched on from the command line.
            if (config.hasKey("strip_whitespace") && !opts.pipeline.stripWhitespace)
                opts.pipeline.stripWhitespace = toBool(config, "strip_whitespace");

            if (config.hasKey("ip_sort") && !opts.pipeline.aggregation.ipAware)
                opts.pipeline.aggregation.ipAware = toBool(config, "ip_sort");
        }

        std::string ArgParser::usage(std::string_view progName)
        {
            std::ostringstream out;
            out << "Usage: " << progName << " [OPTIONS]\n\n"
                << "Extract text from each input line between anchors and/or by regex.\n\n"
                << "SELECTION:\n"
                << "  -s, --start TOKEN [N|all]   Region starts at the Nth TOKEN (default: all)\n"
                << "  -e, --end TOKEN [N|all]     Region ends after the Nth TOKEN past the start\n"
                << "  -p, --pattern REGEX [SEL]   Apply REGEX; SEL is N, 0 (whole match), all, or \"N M ..\"\n"
                << "  -l, --lines RANGE           N, N-M, N-$, $ or $-K (last K lines)\n"
                << "  -i, --ignore-case           Case-insensitive anchors, pattern and unique/counts keys\n"
                << "  -of, --omit-first [N]       Drop N leading bytes (default: start token length)\n"
                << "  -ol, --omit-last [N]        Drop N trailing bytes (default: end token length)\n"
                << "  -O, --omit-all              Same as -of -ol with default counts\n"
                << "      --strip                 Trim surrounding whitespace from each line\n\n"
                << "OUTPUT:\n"
                << "  -u, --unique                Suppress repeated values\n"
                << "  -S, --sort                  Sort ascending\n"
                << "  -r, --rev                   Sort descending\n"
                << "      --sort-by value|count   Sort key (count requires -c)\n"
                << "  -c, --counts                Print each distinct value with its count\n"
                << "      --ip-sort               Sort IPv4 addresses numerically\n\n"
                << "GENERAL:\n"
                << "  -f, --file FILE             Read FILE instead of standard input\n"
                << "      --config FILE           key = value config file\n"
                << "  -v, --verbose               Debug logging to stderr\n"
                << "  -h, --help                  Show this help\n";
            return out.str();
        }

    } // namespace Cli
} // namespace Linex
