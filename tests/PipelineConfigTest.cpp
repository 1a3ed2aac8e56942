#include <gtest/gtest.h>

#include <string>

#include "core/Errors.hpp"
#include "core/PipelineConfig.hpp"

using namespace Linex::Core;

namespace
{
    AnchorSpec anchor(const std::string &token, Occurrence occ = Occurrence::all())
    {
        AnchorSpec spec;
        spec.token = token;
        spec.occurrence = occ;
        return spec;
    }

    bool mentions(const std::vector<std::string> &problems, const std::string &needle)
    {
        for (const auto &p : problems)
        {
            if (p.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }
}

TEST(PipelineConfig, StartOrPatternIsRequired)
{
    PipelineConfig config;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config.pattern = "x";
    EXPECT_NO_THROW(config.validate());

    PipelineConfig anchored;
    anchored.start = anchor("root", Occurrence::nth(1));
    EXPECT_NO_THROW(anchored.validate());
}

TEST(PipelineConfig, TrimNeedsMatchingAnchor)
{
    PipelineConfig config;
    config.pattern = "x";
    config.trim.omitFirst = true;
    config.trim.omitLast = true;

    const auto problems = config.violations();
    EXPECT_TRUE(mentions(problems, "omit-first requires a start anchor"));
    EXPECT_TRUE(mentions(problems, "omit-last requires an end anchor"));
}

TEST(PipelineConfig, EndWithoutStartIsRejected)
{
    PipelineConfig config;
    config.pattern = "x";
    config.end = anchor(":", Occurrence::nth(2));
    EXPECT_TRUE(mentions(config.violations(), "end anchor requires a start anchor"));
}

TEST(PipelineConfig, SortByCountNeedsCounts)
{
    PipelineConfig config;
    config.pattern = "x";
    config.aggregation.sortBy = SortKey::Count;
    config.aggregation.sort = SortOrder::Descending;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config.aggregation.counts = true;
    EXPECT_NO_THROW(config.validate());
}

TEST(PipelineConfig, RejectsZeroOccurrenceAndEmptyTokens)
{
    PipelineConfig config;
    config.start = anchor("", Occurrence::nth(0));
    const auto problems = config.violations();
    EXPECT_TRUE(mentions(problems, "start token must not be empty"));
    EXPECT_TRUE(mentions(problems, "start occurrence must be 1 or greater"));
}

TEST(PipelineConfig, SelectorWithoutPatternIsRejected)
{
    PipelineConfig config;
    config.start = anchor("a");
    config.selector = GroupSelector::group(1);
    EXPECT_TRUE(mentions(config.violations(), "group selector requires a pattern"));
}

TEST(PipelineConfig, ValidateReportsEveryViolationAtOnce)
{
    PipelineConfig config;
    config.trim.omitLast = true;
    config.aggregation.sortBy = SortKey::Count;

    try
    {
        config.validate();
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError &ex)
    {
        const std::string what = ex.what();
        EXPECT_NE(what.find("either a start anchor or a pattern"), std::string::npos);
        EXPECT_NE(what.find("omit-last requires an end anchor"), std::string::npos);
        EXPECT_NE(what.find("sorting by count requires counts"), std::string::npos);
        EXPECT_EQ(ex.exitCode(), ExitCode::ConfigurationError);
    }
}

TEST(PipelineConfig, DescribeSummarisesStages)
{
    PipelineConfig config;
    config.start = anchor("root", Occurrence::nth(1));
    config.pattern = "(\\d+)";
    config.selector = GroupSelector::allGroups();
    config.lineRange = LineRange::from(8);

    const std::string text = config.describe();
    EXPECT_NE(text.find("start='root'/1"), std::string::npos);
    EXPECT_NE(text.find("pattern='(\\d+)'/all"), std::string::npos);
    EXPECT_NE(text.find("lines=8-$"), std::string::npos);
}
