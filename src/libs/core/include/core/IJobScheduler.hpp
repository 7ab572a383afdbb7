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

#pragma once

#include <memory>
#include <string_view>

namespace reel::core
{
    class IJob;

    // Runs jobs on a fixed number of threads, extra jobs are queued in FIFO order
    class IJobScheduler
    {
    public:
        virtual ~IJobScheduler() = default;

        virtual std::size_t getThreadCount() const = 0;
        virtual void scheduleJob(std::unique_ptr<IJob> job) = 0;

        // Scheduled jobs, queued or running
        virtual std::size_t getOngoingJobCount() const = 0;

        virtual void waitUntilJobCountAtMost(std::size_t maxOngoingJobs) = 0;
        virtual void wait() = 0;
    };

    std::unique_ptr<IJobScheduler> createJobScheduler(std::string_view name, std::size_t threadCount);
} // namespace reel::core
