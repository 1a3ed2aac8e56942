// Validated configuration consumed by the pipeline driver.

#ifndef LINEX_CORE_PIPELINE_CONFIG_HPP
#define LINEX_CORE_PIPELINE_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

#include "core/LineRange.hpp"
#include "core/Specs.hpp"

namespace Linex
{
namespace Core
{

/**
 * @brief Everything a pipeline run needs, independent of where it came from
 *        (command line, config file, tests).
 *
 * Option interdependencies are checked by validate() once, before any input
 * is opened. The pattern itself is compiled later by the driver because
 * compile failures have their own error type.
 */
struct PipelineConfig
{
    std::optional<AnchorSpec> start;
    std::optional<EndSpec> end;

    std::optional<std::string> pattern;
    GroupSelector selector;

    std::optional<LineRange> lineRange;

    bool caseInsensitive = false;
    bool stripWhitespace = false;

    TrimSpec trim;
    AggregationConfig aggregation;

    std::string groupSeparator = " ";
    std::string countsSeparator = " ";

    /// Every rule this configuration breaks, in a fixed order. Empty when valid.
    std::vector<std::string> violations() const;

    /// Throws ConfigurationError listing all violations.
    void validate() const;

    /// One-line summary for debug logging.
    std::string describe() const;
};

} // namespace Core
} // namespace Linex

#endif // LINEX_CORE_PIPELINE_CONFIG_HPP
