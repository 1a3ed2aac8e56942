// Declarative building blocks of a pipeline configuration.

#ifndef LINEX_CORE_SPECS_HPP
#define LINEX_CORE_SPECS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Linex
{
namespace Core
{

/**
 * @brief Which instance of an anchor token to use.
 *
 * Tagged value: either the Nth (1-based) occurrence or "all". For a start
 * anchor "all" means "from the start of the line"; for an end anchor it means
 * "to the end of the line".
 */
class Occurrence
{
public:
    enum class Kind : std::uint8_t
    {
        Nth,
        All
    };

    /// Defaults to All.
    Occurrence() = default;

    static Occurrence nth(std::size_t n) { return Occurrence(Kind::Nth, n); }
    static Occurrence all() { return Occurrence(Kind::All, 0); }

    Kind kind() const noexcept { return m_kind; }
    bool isAll() const noexcept { return m_kind == Kind::All; }

    /// Ordinal for Kind::Nth; 0 for Kind::All.
    std::size_t n() const noexcept { return m_n; }

    /// "all" or the decimal ordinal.
    std::string toString() const;

    bool operator==(const Occurrence& other) const noexcept
    {
        return m_kind == other.m_kind && m_n == other.m_n;
    }
    bool operator!=(const Occurrence& other) const noexcept { return !(*this == other); }

private:
    Occurrence(Kind kind, std::size_t n) : m_kind(kind), m_n(n) {}

    Kind m_kind = Kind::All;
    std::size_t m_n = 0;
};

/**
 * @brief Literal anchor token plus the occurrence to locate.
 *
 * Used for both ends; see Occurrence for the meaning of "all" on each end.
 */
struct AnchorSpec
{
    std::string token;
    Occurrence occurrence;
};

using EndSpec = AnchorSpec;

/**
 * @brief Characters to drop from each end of an anchor-bounded extraction.
 *
 * Without an explicit count, the length of the anchor text actually matched
 * at that end is removed.
 */
struct TrimSpec
{
    bool omitFirst = false;
    std::optional<std::size_t> omitFirstCount;
    bool omitLast = false;
    std::optional<std::size_t> omitLastCount;

    bool active() const noexcept { return omitFirst || omitLast; }
};

/**
 * @brief What a regex match emits for a line.
 */
class GroupSelector
{
public:
    enum class Kind : std::uint8_t
    {
        WholeLine,   ///< the regex input, unchanged
        WholeMatch,  ///< the matched span (group 0)
        Group,       ///< one capture group
        Groups,      ///< a list of capture groups, joined
        AllGroups    ///< every capture group in declaration order, joined
    };

    /// Defaults to WholeLine.
    GroupSelector() = default;

    static GroupSelector wholeLine() { return GroupSelector(Kind::WholeLine, {}); }
    static GroupSelector wholeMatch() { return GroupSelector(Kind::WholeMatch, {}); }
    static GroupSelector group(std::size_t n) { return GroupSelector(Kind::Group, {n}); }
    static GroupSelector groups(std::vector<std::size_t> list) { return GroupSelector(Kind::Groups, std::move(list)); }
    static GroupSelector allGroups() { return GroupSelector(Kind::AllGroups, {}); }

    Kind kind() const noexcept { return m_kind; }

    /// Group numbers for Kind::Group (one entry) and Kind::Groups.
    const std::vector<std::size_t>& indices() const noexcept { return m_indices; }

    /// Highest group number referenced, 0 if none.
    std::size_t highestIndex() const noexcept;

    std::string toString() const;

private:
    GroupSelector(Kind kind, std::vector<std::size_t> indices)
        : m_kind(kind), m_indices(std::move(indices))
    {
    }

    Kind m_kind = Kind::WholeLine;
    std::vector<std::size_t> m_indices;
};

enum class SortOrder : std::uint8_t
{
    None,
    Ascending,
    Descending
};

enum class SortKey : std::uint8_t
{
    Value,
    Count
};

/**
 * @brief Post-processing of the extracted values.
 *
 * sortBy == Count is only meaningful together with counts.
 */
struct AggregationConfig
{
    bool unique = false;
    SortOrder sort = SortOrder::None;
    SortKey sortBy = SortKey::Value;
    bool counts = false;
    bool caseInsensitive = false;
    bool ipAware = false;   ///< dotted IPv4 values sort numerically

    /// True when output can only be produced after end of input.
    bool buffered() const noexcept { return counts || sort != SortOrder::None; }
};

} // namespace Core
} // namespace Linex

#endif // LINEX_CORE_SPECS_HPP
