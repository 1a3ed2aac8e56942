#include "core/PipelineConfig.hpp"

#include <sstream>

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace Linex
{
namespace Core
{

std::vector<std::string> PipelineConfig::violations() const
{
    std::vector<std::string> out;

    if (!start && !pattern)
        out.emplace_back("either a start anchor or a pattern is required");

    if (start)
    {
        if (start->token.empty())
            out.emplace_back("start token must not be empty");
        if (!start->occurrence.isAll() && start->occurrence.n() == 0)
            out.emplace_back("start occurrence must be 1 or greater");
    }

    if (end)
    {
        if (!start)
            out.emplace_back("end anchor requires a start anchor");
        if (end->token.empty())
            out.emplace_back("end token must not be empty");
        if (!end->occurrence.isAll() && end->occurrence.n() == 0)
            out.emplace_back("end occurrence must be 1 or greater");
    }

    if (trim.omitFirst && !start)
        out.emplace_back("omit-first requires a start anchor");
    if (trim.omitLast && !end)
        out.emplace_back("omit-last requires an end anchor");

    if (!pattern && selector.kind() != GroupSelector::Kind::WholeLine)
        out.emplace_back("a group selector requires a pattern");

    if (aggregation.sortBy == SortKey::Count && !aggregation.counts)
        out.emplace_back("sorting by count requires counts");

    return out;
}

void PipelineConfig::validate() const
{
    const auto problems = violations();
    if (!problems.empty())
        throw ConfigurationError(Utils::join(problems, "; "));
}

std::string PipelineConfig::describe() const
{
    std::ostringstream oss;
    oss << "start=";
    if (start)
        oss << '\'' << start->token << "'/" << start->occurrence.toString();
    else
        oss << "-";

    oss << " end=";
    if (end)
        oss << '\'' << end->token << "'/" << end->occurrence.toString();
    else
        oss << "-";

    oss << " pattern=";
    if (pattern)
        oss << '\'' << *pattern << "'/" << selector.toString();
    else
        oss << "-";

    oss << " lines=" << (lineRange ? lineRange->toString() : std::string("-"))
        << " icase=" << caseInsensitive
        << " unique=" << aggregation.unique
        << " counts=" << aggregation.counts
        << " sort=" << static_cast<int>(aggregation.sort)
        << " sortBy=" << (aggregation.sortBy == SortKey::Count ? "count" : "value");
    return oss.str();
}

} // namespace Core
} // namespace Linex
