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

#include <chrono>

#include <gtest/gtest.h>

#include "Utils.hpp"

namespace reel::transcoding::tests
{
    TEST(Utils, dateTimeBefore)
    {
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const Wt::WDateTime oneHourAgo{ utils::getDateTimeBefore(std::chrono::hours{ 1 }) };
        EXPECT_GE(oneHourAgo, now.addSecs(-3600));
        EXPECT_LT(oneHourAgo, now.addSecs(-3500));

        EXPECT_GE(utils::getDateTimeBefore(std::chrono::seconds{ 0 }), now);
    }

    TEST(Utils, dateTimeBeforeSaturates)
    {
        const Wt::WDateTime epoch{ Wt::WDateTime::fromTime_t(0) };

        EXPECT_EQ(utils::getDateTimeBefore(std::chrono::seconds{ 3'000'000'000 }), epoch);
        EXPECT_EQ(utils::getDateTimeBefore(std::chrono::hours{ 600'000 }), epoch);
        EXPECT_EQ(utils::getDateTimeBefore(std::chrono::seconds::max()), epoch);
    }
} // namespace reel::transcoding::tests
