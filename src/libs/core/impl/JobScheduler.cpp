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

#include "JobScheduler.hpp"

#include <boost/asio/post.hpp>

#include "core/IJob.hpp"
#include "core/ILogger.hpp"

namespace reel::core
{
    std::unique_ptr<IJobScheduler> createJobScheduler(std::string_view name, std::size_t threadCount)
    {
        return std::make_unique<JobScheduler>(name, threadCount);
    }

    JobScheduler::JobScheduler(std::string_view name, std::size_t threadCount)
        : _name{ name }
        , _ioContextRunner{ _ioContext, threadCount, name }
    {
    }

    JobScheduler::~JobScheduler() = default;

    std::size_t JobScheduler::getThreadCount() const
    {
        return _ioContextRunner.getThreadCount();
    }

    void JobScheduler::scheduleJob(std::unique_ptr<IJob> job)
    {
        {
            std::scoped_lock lock{ _mutex };
            _ongoingJobCount += 1;
        }

        auto jobHandler{ [job = std::move(job), this]() mutable {
            try
            {
                job->run();
            }
            catch (const std::exception& e)
            {
                REEL_LOG(UTILS, ERROR, "[" << _name << "] job '" << job->getName() << "' failed: " << e.what());
            }

            job.reset();

            {
                std::scoped_lock lock{ _mutex };
                _ongoingJobCount -= 1;
            }

            _condVar.notify_all();
        } };

        boost::asio::post(_ioContext, std::move(jobHandler));
    }

    std::size_t JobScheduler::getOngoingJobCount() const
    {
        std::scoped_lock lock{ _mutex };
        return _ongoingJobCount;
    }

    void JobScheduler::waitUntilJobCountAtMost(std::size_t maxOngoingJobs)
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [=, this] { return _ongoingJobCount <= maxOngoingJobs; });
    }

    void JobScheduler::wait()
    {
        waitUntilJobCountAtMost(0);
    }
} // namespace reel::core
