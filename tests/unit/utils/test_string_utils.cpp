//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace ppa::string_utils
{
    TEST(StringUtilsTest, Trim) {
        EXPECT_EQ(trim("  hello \t\n"), "hello");
        EXPECT_EQ(trim(""), "");
        EXPECT_EQ(trim("   "), "");
    }

    TEST(StringUtilsTest, SplitKeepsEmptyFields) {
        const auto parts = split("a..b", '.');
        ASSERT_EQ(parts.size(), 3u);
        EXPECT_EQ(parts[0], "a");
        EXPECT_EQ(parts[1], "");
        EXPECT_EQ(parts[2], "b");
    }

    TEST(StringUtilsTest, SplitLinesHandlesAllTerminators) {
        const auto lines = split_lines("one\r\ntwo\rthree\nfour\n");
        ASSERT_EQ(lines.size(), 4u);
        EXPECT_EQ(lines[0], "one");
        EXPECT_EQ(lines[1], "two");
        EXPECT_EQ(lines[2], "three");
        EXPECT_EQ(lines[3], "four");
    }

    TEST(StringUtilsTest, SplitLinesKeepsBlankLines) {
        const auto lines = split_lines("a\n\nb");
        ASSERT_EQ(lines.size(), 3u);
        EXPECT_EQ(lines[1], "");
    }

    TEST(StringUtilsTest, Join) {
        const std::vector<std::string> parts = {"x", "y", "z"};
        EXPECT_EQ(join(parts, ", "), "x, y, z");
        EXPECT_EQ(join(std::vector<std::string>{}, ", "), "");
    }

    TEST(StringUtilsTest, CaseConversion) {
        EXPECT_EQ(to_lower("Session.Query"), "session.query");
        EXPECT_EQ(to_upper("critical"), "CRITICAL");
    }

    TEST(StringUtilsTest, ReplaceAll) {
        EXPECT_EQ(replace_all("a_b_c", "_", "-"), "a-b-c");
        EXPECT_EQ(replace_all("abc", "", "-"), "abc");
    }

    TEST(StringUtilsTest, LastSegment) {
        EXPECT_EQ(last_segment("requests.get"), "get");
        EXPECT_EQ(last_segment("open"), "open");
        EXPECT_EQ(last_segment("a.b."), "");
    }

    TEST(StringUtilsTest, Predicates) {
        EXPECT_TRUE(starts_with("asyncio.sleep", "asyncio"));
        EXPECT_TRUE(ends_with("json.load", ".load"));
        EXPECT_TRUE(contains("User.objects.filter", ".objects."));
        EXPECT_FALSE(contains("User.filter", ".objects."));
    }
}  // namespace ppa::string_utils
