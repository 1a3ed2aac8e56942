// Fatal error taxonomy for a pipeline run.
//
// Per-line outcomes (no match, group did not participate) are never
// exceptions; they travel as std::optional / empty strings. Only conditions
// that abort the whole run are thrown, and main() maps each type onto a
// distinct process exit status.

#ifndef LINEX_CORE_ERRORS_HPP
#define LINEX_CORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Linex
{
namespace Core
{

/**
 * @brief Process exit statuses reported by the linex executable.
 */
enum class ExitCode : int
{
    Success            = 0,
    InternalError      = 1,
    ConfigurationError = 2,
    PatternError       = 3,
    IoError            = 4
};

/**
 * @brief Base class of every fatal linex error.
 */
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message)
    {
    }

    /// Exit status main() should report for this error.
    virtual ExitCode exitCode() const noexcept = 0;
};

/**
 * @brief Invalid or inconsistent option combination.
 *
 * Raised before any input line is read.
 */
class ConfigurationError : public Error
{
public:
    using Error::Error;

    ExitCode exitCode() const noexcept override { return ExitCode::ConfigurationError; }
};

/**
 * @brief The supplied regular expression does not compile.
 */
class PatternCompileError : public Error
{
public:
    PatternCompileError(const std::string& pattern, const std::string& reason)
        : Error("invalid regular expression '" + pattern + "': " + reason),
          m_pattern(pattern)
    {
    }

    const std::string& pattern() const noexcept { return m_pattern; }

    ExitCode exitCode() const noexcept override { return ExitCode::PatternError; }

private:
    std::string m_pattern;
};

/**
 * @brief The regex engine gave up on a line (complexity or memory limit).
 */
class PatternMatchError : public Error
{
public:
    PatternMatchError(const std::string& pattern, std::size_t line, const std::string& reason)
        : Error("regular expression '" + pattern + "' could not be evaluated on line " +
                std::to_string(line) + ": " + reason),
          m_line(line)
    {
    }

    std::size_t line() const noexcept { return m_line; }

    ExitCode exitCode() const noexcept override { return ExitCode::PatternError; }

private:
    std::size_t m_line;
};

/**
 * @brief Input (or config file) cannot be opened or read.
 */
class IOError : public Error
{
public:
    using Error::Error;

    ExitCode exitCode() const noexcept override { return ExitCode::IoError; }
};

} // namespace Core
} // namespace Linex

#endif // LINEX_CORE_ERRORS_HPP
