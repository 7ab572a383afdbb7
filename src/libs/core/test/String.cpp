/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Reel.
 *
 * Reel is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Reel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Reel.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include "core/String.hpp"

namespace reel::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        {
            const auto strings{ splitString("a,b,,c", ',') };
            ASSERT_EQ(strings.size(), 4);
            EXPECT_EQ(strings[0], "a");
            EXPECT_EQ(strings[1], "b");
            EXPECT_EQ(strings[2], "");
            EXPECT_EQ(strings[3], "c");
        }

        {
            const auto strings{ splitString("", ',') };
            ASSERT_EQ(strings.size(), 1);
            EXPECT_EQ(strings[0], "");
        }
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim("  foo \t"), "foo");
        EXPECT_EQ(stringTrim("foo"), "foo");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim("out_time_us=42\n"), "out_time_us=42");
    }

    TEST(StringUtils, stringToLower)
    {
        EXPECT_EQ(stringToLower("1080P"), "1080p");
        EXPECT_EQ(stringToLower("4K"), "4k");
        EXPECT_TRUE(stringCaseInsensitiveEqual("720P", "720p"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("720p", "720"));
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<long long>("1234567"), 1234567);
        EXPECT_EQ(readAs<long long>("foo"), std::nullopt);
        EXPECT_EQ(readAs<bool>("true"), true);
        EXPECT_EQ(readAs<bool>("0"), false);
        EXPECT_EQ(readAs<bool>("maybe"), std::nullopt);
        EXPECT_EQ(readAs<std::string>("foo bar"), "foo bar");
    }

    TEST(StringUtils, tailLines)
    {
        EXPECT_EQ(tailLines("short", 64), "short");
        EXPECT_EQ(tailLines("line1\nline2\nline3\n", 12), "line3");
        EXPECT_EQ(tailLines("abcdefghij", 4), "ghij");
    }
} // namespace reel::core::stringUtils::tests
