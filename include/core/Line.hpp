// Core value types flowing between pipeline stages.

#ifndef LINEX_CORE_LINE_HPP
#define LINEX_CORE_LINE_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace Linex
{
namespace Core
{

/**
 * @brief One input line.
 *
 * Indices are 1-based, strictly increasing and contiguous in input order.
 * The text never contains the line terminator.
 */
struct Line
{
    std::size_t index = 0;
    std::string text;

    Line() = default;

    Line(std::size_t idx, std::string txt)
        : index(idx), text(std::move(txt))
    {
    }
};

/**
 * @brief Substring located in a line by the anchor locator or the regex
 *        extractor.
 *
 * Offsets are byte offsets of @c raw inside the text it was located in
 * (the line for anchors, the regex input for patterns). The anchor lengths
 * record how much anchor text was actually matched at each end of @c raw,
 * which is what the trim policy strips by default.
 */
struct ExtractResult
{
    std::string raw;
    std::size_t startOffset = 0;
    std::size_t endOffset = 0;
    std::size_t sourceLine = 0;
    std::size_t startAnchorLength = 0;   ///< 0 when the start anchor is "all"
    std::size_t endAnchorLength = 0;     ///< 0 when there is no end anchor
};

} // namespace Core
} // namespace Linex

#endif // LINEX_CORE_LINE_HPP
