#include <gtest/gtest.h>

#include <string>

#include "utils/ConfigLoader.hpp"

using Linex::Utils::ConfigLoader;

namespace
{
    const std::string kDataDir = LINEX_TEST_DATA_DIR;
}

TEST(ConfigLoader, LoadsKeyValueFileSkippingCommentsAndJunk)
{
    ConfigLoader config;
    ASSERT_TRUE(config.loadFromFile(kDataDir + "/linex.conf"));

    EXPECT_EQ(config.getStringOr("log_level", "info"), "debug");
    EXPECT_EQ(config.getStringOr("group_separator", " "), ",");
    EXPECT_EQ(config.getStringOr("counts_separator", " "), ":");
    EXPECT_EQ(config.getBool("strip_whitespace"), true);
    EXPECT_EQ(config.getBool("ip_sort"), false);
    EXPECT_FALSE(config.hasKey("not a key value line"));
    EXPECT_FALSE(config.getString("log_file").has_value());
}

TEST(ConfigLoader, MissingFileLeavesValuesUntouched)
{
    ConfigLoader config;
    ASSERT_TRUE(config.loadFromFile(kDataDir + "/base.conf"));

    EXPECT_FALSE(config.loadFromFile(kDataDir + "/does-not-exist.conf"));
    EXPECT_EQ(config.getStringOr("log_level", ""), "error");
    EXPECT_EQ(config.getStringOr("log_file", ""), "/tmp/linex.log");
}

TEST(ConfigLoader, LaterFileOverridesEarlierOne)
{
    ConfigLoader config;
    ASSERT_TRUE(config.loadFromFile(kDataDir + "/base.conf"));
    ASSERT_TRUE(config.loadFromFile(kDataDir + "/linex.conf"));

    EXPECT_EQ(config.getStringOr("log_level", ""), "debug");
    EXPECT_EQ(config.getStringOr("log_file", ""), "/tmp/linex.log");
}

TEST(ConfigLoader, InvalidBooleanIsReportedAsMissing)
{
    ConfigLoader config;
    ASSERT_TRUE(config.loadFromFile(kDataDir + "/bad_bool.conf"));

    EXPECT_TRUE(config.hasKey("strip_whitespace"));
    EXPECT_EQ(config.getString("strip_whitespace"), std::string("maybe"));
    EXPECT_FALSE(config.getBool("strip_whitespace").has_value());
    EXPECT_FALSE(config.getBool("missing").has_value());
}
