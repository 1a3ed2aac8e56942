// Line selection applied before any extraction stage.

#ifndef LINEX_CORE_LINE_RANGE_HPP
#define LINEX_CORE_LINE_RANGE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Linex
{
namespace Core
{

/**
 * @brief Closed selection over 1-based line indices.
 *
 * Accepted textual forms:
 *   - "N"    single line N
 *   - "N-M"  lines N..M (empty when M < N)
 *   - "N-$"  line N to end of input
 *   - "$"    last line
 *   - "$-K"  last K lines
 *
 * Prefix forms are evaluated while streaming and allow early termination.
 * Suffix forms ("$", "$-K") need the whole input and a trailing buffer of
 * tailSize() lines.
 */
class LineRange
{
public:
    enum class Kind : std::uint8_t
    {
        Single,
        Between,
        From,
        Last,
        LastN
    };

    static LineRange single(std::size_t n);
    static LineRange between(std::size_t first, std::size_t last);
    static LineRange from(std::size_t first);
    static LineRange last();
    static LineRange lastN(std::size_t count);

    /// Parse one of the textual forms above; throws ConfigurationError.
    static LineRange parse(std::string_view text);

    Kind kind() const noexcept { return m_kind; }

    /// True for "$" and "$-K".
    bool isSuffix() const noexcept { return m_kind == Kind::Last || m_kind == Kind::LastN; }

    /// Number of trailing lines retained for suffix forms.
    std::size_t tailSize() const noexcept;

    /// Prefix forms only: first selected index (lines before it can be skipped).
    std::size_t lowerBound() const noexcept { return isSuffix() ? 1 : m_first; }

    /// Prefix forms only: is this index inside the range?
    bool contains(std::size_t index) const noexcept;

    /// Prefix forms only: no index >= this one can ever be selected.
    bool exhaustedAt(std::size_t index) const noexcept;

    std::string toString() const;

private:
    LineRange(Kind kind, std::size_t first, std::size_t last)
        : m_kind(kind), m_first(first), m_last(last)
    {
    }

    Kind m_kind;
    std::size_t m_first;   ///< lower bound, or K for LastN
    std::size_t m_last;    ///< upper bound for Single/Between
};

} // namespace Core
} // namespace Linex

#endif // LINEX_CORE_LINE_RANGE_HPP
