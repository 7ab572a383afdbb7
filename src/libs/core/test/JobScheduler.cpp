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

#include <atomic>
#include <chrono>
#include <thread>

#include "core/IJob.hpp"
#include "core/IJobScheduler.hpp"

namespace reel::core
{
    namespace
    {
        class TestJob : public IJob
        {
        public:
            TestJob(std::atomic<std::size_t>& count, std::atomic<std::size_t>& running, std::atomic<std::size_t>& maxRunning)
                : _workCount{ count }
                , _running{ running }
                , _maxRunning{ maxRunning }
            {
            }

        private:
            std::string_view getName() const override { return "test"; };
            void run() override
            {
                const std::size_t running{ ++_running };
                std::size_t expected{ _maxRunning.load() };
                while (running > expected && !_maxRunning.compare_exchange_weak(expected, running))
                {
                }

                // Simulate some work
                std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
                --_running;
                ++_workCount;
            }

            std::atomic<std::size_t>& _workCount;
            std::atomic<std::size_t>& _running;
            std::atomic<std::size_t>& _maxRunning;
        };

        class ThrowingJob : public IJob
        {
        private:
            std::string_view getName() const override { return "throwing"; };
            void run() override { throw std::runtime_error{ "oops" }; }
        };
    } // namespace

    TEST(JobScheduler, basic)
    {
        std::atomic<std::size_t> workCount{};
        std::atomic<std::size_t> running{};
        std::atomic<std::size_t> maxRunning{};

        auto scheduler{ createJobScheduler("TestScheduler", 2) };
        ASSERT_NE(scheduler, nullptr);
        EXPECT_EQ(scheduler->getThreadCount(), 2);

        for (int i = 0; i < 10; ++i)
            scheduler->scheduleJob(std::make_unique<TestJob>(workCount, running, maxRunning));

        // Wait for all jobs to complete
        scheduler->wait();
        EXPECT_EQ(workCount.load(), 10);
        EXPECT_EQ(scheduler->getOngoingJobCount(), 0);
        EXPECT_LE(maxRunning.load(), 2);
    }

    TEST(JobScheduler, throwingJob)
    {
        std::atomic<std::size_t> workCount{};
        std::atomic<std::size_t> running{};
        std::atomic<std::size_t> maxRunning{};

        auto scheduler{ createJobScheduler("TestScheduler", 1) };
        scheduler->scheduleJob(std::make_unique<ThrowingJob>());
        scheduler->scheduleJob(std::make_unique<TestJob>(workCount, running, maxRunning));

        scheduler->wait();
        EXPECT_EQ(workCount.load(), 1);
    }
} // namespace reel::core
