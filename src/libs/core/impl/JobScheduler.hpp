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

#include <condition_variable>
#include <mutex>
#include <string>

#include "core/IJobScheduler.hpp"
#include "core/IOContextRunner.hpp"

namespace reel::core
{
    class JobScheduler : public IJobScheduler
    {
    public:
        JobScheduler(std::string_view name, std::size_t threadCount);
        ~JobScheduler() override;
        JobScheduler(const JobScheduler&) = delete;
        JobScheduler& operator=(const JobScheduler&) = delete;

    private:
        std::size_t getThreadCount() const override;
        void scheduleJob(std::unique_ptr<IJob> job) override;
        std::size_t getOngoingJobCount() const override;
        void waitUntilJobCountAtMost(std::size_t maxOngoingJobs) override;
        void wait() override;

        const std::string _name;
        boost::asio::io_context _ioContext;
        IOContextRunner _ioContextRunner;

        mutable std::mutex _mutex;
        std::size_t _ongoingJobCount{};
        std::condition_variable _condVar;
    };
} // namespace reel::core
