#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "core/LineRange.hpp"
#include "input/LineSource.hpp"

using Linex::Core::LineRange;
using Linex::Input::LineSource;

namespace
{
    std::string numberedLines(std::size_t count)
    {
        std::string text;
        for (std::size_t i = 1; i <= count; ++i)
            text += "line " + std::to_string(i) + "\n";
        return text;
    }

    std::vector<std::size_t> indicesOf(LineSource &source)
    {
        std::vector<std::size_t> out;
        while (auto line = source.next())
            out.push_back(line->index);
        return out;
    }
}

TEST(LineSource, YieldsEveryLineWithOneBasedIndex)
{
    std::istringstream in("alpha\nbeta\r\ngamma");
    LineSource source(in);

    auto first = source.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->index, 1u);
    EXPECT_EQ(first->text, "alpha");

    auto second = source.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->text, "beta");

    auto third = source.next();
    ASSERT_TRUE(third);
    EXPECT_EQ(third->index, 3u);
    EXPECT_EQ(third->text, "gamma");

    EXPECT_FALSE(source.next());
    EXPECT_EQ(source.linesRead(), 3u);
}

TEST(LineSource, KeepsEmptyLines)
{
    std::istringstream in("a\n\nb\n");
    LineSource source(in);
    EXPECT_EQ(indicesOf(source), (std::vector<std::size_t>{1, 2, 3}));
}

TEST(LineSource, StripsWhitespaceWhenAsked)
{
    std::istringstream in("   padded\t \n");
    LineSource source(in, std::nullopt, true);
    auto line = source.next();
    ASSERT_TRUE(line);
    EXPECT_EQ(line->text, "padded");
}

TEST(LineSource, FromRangeSelectsTail)
{
    std::istringstream in(numberedLines(10));
    LineSource source(in, LineRange::parse("8-$"));
    EXPECT_EQ(indicesOf(source), (std::vector<std::size_t>{8, 9, 10}));
}

TEST(LineSource, BetweenRangeStopsReadingAtUpperBound)
{
    std::istringstream in(numberedLines(100));
    LineSource source(in, LineRange::parse("3-5"));

    EXPECT_EQ(indicesOf(source), (std::vector<std::size_t>{3, 4, 5}));
    EXPECT_TRUE(source.stoppedEarly());
    EXPECT_EQ(source.linesRead(), 5u);
}

TEST(LineSource, SingleLineRange)
{
    std::istringstream in(numberedLines(4));
    LineSource source(in, LineRange::single(2));

    auto line = source.next();
    ASSERT_TRUE(line);
    EXPECT_EQ(line->text, "line 2");
    EXPECT_FALSE(source.next());
}

TEST(LineSource, RangeBeyondInputIsEmpty)
{
    std::istringstream in(numberedLines(3));
    LineSource source(in, LineRange::parse("7-9"));
    EXPECT_TRUE(indicesOf(source).empty());
    EXPECT_FALSE(source.stoppedEarly());
}

TEST(LineSource, ReversedRangeSelectsNothing)
{
    std::istringstream in(numberedLines(10));
    LineSource source(in, LineRange::parse("5-3"));
    EXPECT_TRUE(indicesOf(source).empty());
    EXPECT_EQ(source.linesRead(), 0u);
}

TEST(LineSource, LastLineAndLastN)
{
    {
        std::istringstream in(numberedLines(6));
        LineSource source(in, LineRange::last());
        EXPECT_EQ(indicesOf(source), (std::vector<std::size_t>{6}));
    }
    {
        std::istringstream in(numberedLines(6));
        LineSource source(in, LineRange::lastN(2));
        EXPECT_EQ(indicesOf(source), (std::vector<std::size_t>{5, 6}));
    }
    {
        std::istringstream in(numberedLines(2));
        LineSource source(in, LineRange::lastN(5));
        EXPECT_EQ(indicesOf(source), (std::vector<std::size_t>{1, 2}));
    }
}

TEST(LineSource, EmptyInputYieldsNothing)
{
    std::istringstream in("");
    LineSource source(in, LineRange::last());
    EXPECT_FALSE(source.next());
}
