#include <gtest/gtest.h>

#include <string>

#include "extract/AnchorLocator.hpp"

using namespace Linex::Core;
using Linex::Extract::AnchorLocator;

namespace
{
    const std::string kPasswd = "root:x:0:0::/root:/bin/bash";

    AnchorSpec anchor(const std::string &token, Occurrence occ)
    {
        AnchorSpec spec;
        spec.token = token;
        spec.occurrence = occ;
        return spec;
    }
}

TEST(AnchorLocator, StartAndFourthEndDelimiter)
{
    AnchorLocator locator(anchor("root", Occurrence::nth(1)), anchor(":", Occurrence::nth(4)), false);

    auto result = locator.locate(kPasswd, 1);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->raw, "root:x:0:0:");
    EXPECT_EQ(result->startOffset, 0u);
    EXPECT_EQ(result->endOffset, 11u);
    EXPECT_EQ(result->startAnchorLength, 4u);
    EXPECT_EQ(result->endAnchorLength, 1u);
    EXPECT_EQ(result->sourceLine, 1u);
}

TEST(AnchorLocator, SecondStartOccurrence)
{
    AnchorLocator locator(anchor("root", Occurrence::nth(2)), std::nullopt, false);

    auto result = locator.locate(kPasswd);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->raw, "root:/bin/bash");
    EXPECT_EQ(result->startOffset, 13u);
    EXPECT_EQ(result->endAnchorLength, 0u);
}

TEST(AnchorLocator, MissingOccurrenceExcludesLine)
{
    AnchorLocator locator(anchor("root", Occurrence::nth(3)), std::nullopt, false);
    EXPECT_FALSE(locator.locate(kPasswd));

    AnchorLocator endMissing(anchor("root", Occurrence::nth(1)), anchor(";", Occurrence::nth(1)), false);
    EXPECT_FALSE(endMissing.locate(kPasswd));
}

TEST(AnchorLocator, StartAllStillRequiresToken)
{
    AnchorLocator locator(anchor("bash", Occurrence::all()), std::nullopt, false);

    auto hit = locator.locate(kPasswd);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->raw, kPasswd);
    EXPECT_EQ(hit->startAnchorLength, 0u);

    EXPECT_FALSE(locator.locate("daemon:x:1:1"));
}

TEST(AnchorLocator, EndAllRunsToEndOfLine)
{
    AnchorLocator locator(anchor("/", Occurrence::nth(1)), anchor(":", Occurrence::all()), false);

    auto result = locator.locate(kPasswd);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->raw, "/root:/bin/bash");
    EXPECT_EQ(result->endAnchorLength, 0u);
}

TEST(AnchorLocator, EndIsSearchedAfterStartToken)
{
    // The end token equals the start token; the start match itself is not reused.
    AnchorLocator locator(anchor("|", Occurrence::nth(1)), anchor("|", Occurrence::nth(1)), false);

    auto result = locator.locate("a|b|c|d");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->raw, "|b|");
}

TEST(AnchorLocator, EndSearchBeginsAfterStartToken)
{
    // The ':' inside the start token "x:" does not count as the end.
    AnchorLocator locator(anchor("x:", Occurrence::nth(1)), anchor(":", Occurrence::nth(1)), false);

    auto result = locator.locate("x:y:z");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->raw, "x:y:");
    EXPECT_EQ(result->startAnchorLength, 2u);
    EXPECT_EQ(result->endAnchorLength, 1u);
}

TEST(AnchorLocator, OccurrencesDoNotOverlap)
{
    EXPECT_EQ(AnchorLocator::findNth("aaaa", "aa", 1), 0u);
    EXPECT_EQ(AnchorLocator::findNth("aaaa", "aa", 2), 2u);
    EXPECT_EQ(AnchorLocator::findNth("aaaa", "aa", 3), std::string::npos);
    EXPECT_EQ(AnchorLocator::findNth("abc", "", 1), std::string::npos);
}

TEST(AnchorLocator, CaseInsensitiveKeepsOriginalBytes)
{
    AnchorLocator locator(anchor("error", Occurrence::nth(1)), anchor(":", Occurrence::nth(1)), true);

    auto result = locator.locate("2024-01-01 ERROR: disk full");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->raw, "ERROR:");

    AnchorLocator sensitive(anchor("error", Occurrence::nth(1)), std::nullopt, false);
    EXPECT_FALSE(sensitive.locate("2024-01-01 ERROR: disk full"));
}
