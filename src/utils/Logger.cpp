#include "utils/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

#include "utils/StringUtils.hpp"

namespace Linex
{
    namespace Utils
    {
        namespace
        {
            std::string formatNow()
            {
                const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::tm tm{};
                localtime_r(&t, &tm);

                char buffer[32];
                const std::size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
                return std::string(buffer, n);
            }
        } // anonymous namespace

        std::optional<LogLevel> parseLogLevel(std::string_view text)
        {
            const std::string upper = toUpper(trim(text));
            if (upper == "TRACE") return LogLevel::TRACE;
            if (upper == "DEBUG") return LogLevel::DEBUG;
            if (upper == "INFO") return LogLevel::INFO;
            if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
            if (upper == "ERROR") return LogLevel::ERROR;
            if (upper == "CRITICAL") return LogLevel::CRITICAL;
            return std::nullopt;
        }

        // ------------ Logger implementation ------------

        Logger::Logger()
            : m_level(LogLevel::INFO),
              m_file(),
              m_fileEnabled(false),
              m_console(&std::cerr)
        {
        }

        Logger::Logger(std::string_view filePath, LogLevel level)
            : m_level(level),
              m_file(),
              m_fileEnabled(false),
              m_console(&std::cerr)
        {
            if (!filePath.empty())
            {
                // Open file in append mode; RAII will close it in the destructor.
                m_file.open(std::string(filePath), std::ios::out | std::ios::app);
                if (m_file.is_open())
                {
                    m_fileEnabled = true;
                }
            }
        }

        Logger::Logger(Logger &&other) noexcept
            : m_level(other.m_level),
              m_file(std::move(other.m_file)),
              m_fileEnabled(other.m_fileEnabled),
              m_console(other.m_console)
        {
            other.m_fileEnabled = false;
        }

        Logger &Logger::operator=(Logger &&other) noexcept
        {
            if (this != &other)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_level       = other.m_level;
                m_console     = other.m_console;
                m_fileEnabled = other.m_fileEnabled;

                if (m_file.is_open())
                {
                    m_file.close();
                }
                m_file = std::move(other.m_file);

                other.m_fileEnabled = false;
            }
            return *this;
        }

        Logger::~Logger()
        {
            if (m_file.is_open())
            {
                m_file.flush();
                m_file.close();
            }
        }

        void Logger::setLevel(LogLevel level) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_level = level;
        }

        LogLevel Logger::level() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_level;
        }

        bool Logger::isEnabled(LogLevel level) const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return static_cast<int>(level) >= static_cast<int>(m_level);
        }

        bool Logger::hasFile() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_fileEnabled;
        }

        void Logger::setConsole(std::ostream *console) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_console = console;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            if (!isEnabled(level))
            {
                return;
            }

            // "[timestamp] [LEVEL] message"
            const std::string tsStr = formatNow();
            const char *levelStr = toString(level);

            std::string line;
            line.reserve(tsStr.size() + message.size() + 16);
            line.append("[");
            line.append(tsStr);
            line.append("] [");
            line.append(levelStr);
            line.append("] ");
            line.append(message);

            writeLine(line);
        }

        const char *Logger::toString(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN";
            }
        }

        void Logger::writeLine(std::string_view line)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_console)
            {
                (*m_console) << line << '\n';
                m_console->flush();
            }

            if (m_fileEnabled && m_file.is_open())
            {
                m_file << line << '\n';
                m_file.flush();
            }
        }

        // ------------ Global logger accessor ------------

        Logger &getLogger()
        {
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace Linex
