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

#include "Utils.hpp"

namespace reel::transcoding::utils
{
    Wt::WDateTime getDateTimeBefore(std::chrono::seconds age)
    {
        const std::chrono::system_clock::time_point now{ std::chrono::system_clock::now() };
        if (age >= std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()))
            return Wt::WDateTime::fromTime_t(0);

        return Wt::WDateTime{ now - age };
    }
} // namespace reel::transcoding::utils
