#include <gtest/gtest.h>

#include <string>

#include "extract/TrimPolicy.hpp"

using namespace Linex::Core;
using Linex::Extract::TrimPolicy;

namespace
{
    ExtractResult located(const std::string &raw, std::size_t startLen, std::size_t endLen)
    {
        ExtractResult r;
        r.raw = raw;
        r.endOffset = raw.size();
        r.startAnchorLength = startLen;
        r.endAnchorLength = endLen;
        return r;
    }

    TrimSpec trimBoth()
    {
        TrimSpec spec;
        spec.omitFirst = true;
        spec.omitLast = true;
        return spec;
    }
}

TEST(TrimPolicy, InactiveSpecReturnsRawText)
{
    TrimPolicy policy{TrimSpec{}};
    EXPECT_EQ(policy.apply(located("root:x:0:0:", 4, 1)), "root:x:0:0:");
}

TEST(TrimPolicy, DefaultCountsAreAnchorLengths)
{
    TrimPolicy policy(trimBoth());
    const auto r = located("root:x:0:0:", 4, 1);

    EXPECT_EQ(policy.leadingCount(r), 4u);
    EXPECT_EQ(policy.trailingCount(r), 1u);
    EXPECT_EQ(policy.apply(r), ":x:0:0");
}

TEST(TrimPolicy, ExplicitCountsOverrideAnchorLengths)
{
    TrimSpec spec = trimBoth();
    spec.omitFirstCount = 5;
    spec.omitLastCount = 1;
    TrimPolicy policy(spec);

    EXPECT_EQ(policy.apply(located("root:x:0:0:", 4, 1)), "x:0:0");
}

TEST(TrimPolicy, DefaultOmitFirstIsNoOpForStartAll)
{
    TrimSpec spec;
    spec.omitFirst = true;
    TrimPolicy policy(spec);

    EXPECT_EQ(policy.apply(located("whole line", 0, 0)), "whole line");
}

TEST(TrimPolicy, EndsAreTrimmedIndependently)
{
    TrimSpec front;
    front.omitFirst = true;
    front.omitFirstCount = 2;

    TrimSpec back;
    back.omitLast = true;
    back.omitLastCount = 2;

    const auto r = located("abcdef", 1, 1);
    EXPECT_EQ(TrimPolicy(front).apply(r), "cdef");
    EXPECT_EQ(TrimPolicy(back).apply(r), "abcd");
}

TEST(TrimPolicy, OverlappingTrimYieldsEmptyString)
{
    TrimSpec spec = trimBoth();
    spec.omitFirstCount = 4;
    spec.omitLastCount = 3;
    TrimPolicy policy(spec);

    EXPECT_EQ(policy.apply(located("abcdef", 0, 0)), "");
    EXPECT_EQ(policy.apply(located("ab", 0, 0)), "");
}

TEST(TrimPolicy, ExactFitLeavesNothing)
{
    TrimSpec spec = trimBoth();
    spec.omitFirstCount = 3;
    spec.omitLastCount = 3;
    TrimPolicy policy(spec);

    EXPECT_EQ(policy.apply(located("abcdef", 0, 0)), "");
}
