#include <gtest/gtest.h>

#include <cstdint>

#include "utils/StringUtils.hpp"

using namespace Linex::Utils;

TEST(StringUtils, TrimRemovesSurroundingWhitespace)
{
    EXPECT_EQ(trim("  \tvalue \r\n"), "value");
    EXPECT_EQ(ltrim("  a b "), "a b ");
    EXPECT_EQ(rtrim("  a b "), "  a b");
    EXPECT_EQ(trim("   "), "");
}

TEST(StringUtils, CaseFoldingPreservesLength)
{
    EXPECT_EQ(toLower("GET /Index.HTML"), "get /index.html");
    EXPECT_EQ(toUpper("warn"), "WARN");
    EXPECT_TRUE(iequals("ALL", "all"));
    EXPECT_FALSE(iequals("all", "al"));
}

TEST(StringUtils, SplitKeepsOrOmitsEmptyFields)
{
    const auto compact = split("a..b.", '.');
    ASSERT_EQ(compact.size(), 2u);
    EXPECT_EQ(compact[0], "a");
    EXPECT_EQ(compact[1], "b");

    const auto full = split("a..b.", '.', true);
    ASSERT_EQ(full.size(), 4u);
    EXPECT_EQ(full[1], "");
    EXPECT_EQ(full[3], "");
}

TEST(StringUtils, SplitWhitespaceAndJoin)
{
    const auto tokens = splitWhitespace("  1 \t 3   4 ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(join(tokens, ","), "1,3,4");
    EXPECT_EQ(join({}, ","), "");
    EXPECT_EQ(join({"solo"}, " | "), "solo");
}

TEST(StringUtils, ParseIntegerRejectsGarbage)
{
    EXPECT_EQ(parseInteger<int>(" 42 "), 42);
    EXPECT_EQ(parseInteger<int>("-7"), -7);
    EXPECT_FALSE(parseInteger<int>("12abc").has_value());
    EXPECT_FALSE(parseInteger<int>("").has_value());
    EXPECT_FALSE(parseInteger<std::size_t>("-1").has_value());
    EXPECT_FALSE(parseInteger<std::uint8_t>("+3").has_value());
}

TEST(StringUtils, IsDigits)
{
    EXPECT_TRUE(isDigits("0123"));
    EXPECT_FALSE(isDigits(""));
    EXPECT_FALSE(isDigits("1 3"));
}
