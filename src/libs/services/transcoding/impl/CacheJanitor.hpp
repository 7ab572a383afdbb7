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

#include <chrono>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace reel::transcoding
{
    class RenditionCache;

    // Periodically evicts the renditions not accessed for more than the TTL
    class CacheJanitor
    {
    public:
        CacheJanitor(boost::asio::io_context& ioContext, RenditionCache& cache, std::chrono::seconds ttl, std::chrono::seconds period);
        ~CacheJanitor();
        CacheJanitor(const CacheJanitor&) = delete;
        CacheJanitor& operator=(const CacheJanitor&) = delete;

        // Runs on the calling thread
        std::size_t sweep(std::chrono::seconds ttl);

    private:
        void scheduleSweep();

        RenditionCache& _cache;
        const std::chrono::seconds _ttl;
        const std::chrono::seconds _period;

        // Shared with the timer handler, which may still be queued once this object is destroyed
        struct State
        {
            std::mutex mutex;
            bool stopped{};
        };
        const std::shared_ptr<State> _state;
        boost::asio::steady_timer _timer;
    };
} // namespace reel::transcoding
