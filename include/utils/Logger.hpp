#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>

namespace Linex
{
    namespace Utils
    {
        /**
         * Log severity levels used across the tool.
         *
         * Typical usage:
         *  - TRACE: per-line extraction details
         *  - DEBUG: pipeline wiring and run statistics
         *  - INFO: high-level flow ("no pattern found", input opened)
         *  - WARN: unusual situations, not yet errors
         *  - ERROR: fatal configuration / pattern / I/O failures
         *  - CRITICAL: unexpected internal failures
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Parse "TRACE".."CRITICAL" (case-insensitive); std::nullopt if unknown.
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Logger
         *
         * Thread-safe, minimal logging facility. Diagnostics always go to
         * stderr (and optionally a log file) so that standard output carries
         * only extraction results.
         *
         * Features:
         *  - Global log level filtering.
         *  - Optional log file in addition to stderr.
         *  - Timestamps on every message.
         *
         * Non-copyable; owned by the process-wide accessor getLogger().
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only.
            Logger();

            /**
             * Create a logger with optional file output.
             *
             * If filePath is non-empty, the logger attempts to open the file
             * in append mode. If opening fails, logging falls back to stderr
             * only.
             */
            explicit Logger(std::string_view filePath, LogLevel level = LogLevel::INFO);

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            Logger(Logger &&) noexcept;
            Logger &operator=(Logger &&) noexcept;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /// True when the optional log file was opened successfully.
            bool hasFile() const noexcept;

            /// Redirect console output (tests capture into a stringstream).
            void setConsole(std::ostream *console) noexcept;

            /**
             * Log a message with a given severity.
             *
             * Output format: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message"
             */
            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

            static const char *toString(LogLevel level) noexcept;

        private:
            /// Write a fully formatted line to the active sinks.
            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            bool                            m_fileEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all writes
        };

        /**
         * Global logger accessor.
         *
         * Lazily created, stderr only, INFO level. main() reconfigures it
         * from the command line and config file before the pipeline starts:
         *   getLogger() = Logger(logFile, level);
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace Linex
