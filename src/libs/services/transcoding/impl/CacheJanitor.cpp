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

#include "CacheJanitor.hpp"

#include "core/ILogger.hpp"
#include "services/transcoding/Exception.hpp"

#include "RenditionCache.hpp"

namespace reel::transcoding
{
    CacheJanitor::CacheJanitor(boost::asio::io_context& ioContext, RenditionCache& cache, std::chrono::seconds ttl, std::chrono::seconds period)
        : _cache{ cache }
        , _ttl{ ttl }
        , _period{ period }
        , _state{ std::make_shared<State>() }
        , _timer{ ioContext }
    {
        if (_period.count() == 0)
        {
            REEL_LOG(JANITOR, INFO, "Periodic sweeps disabled");
            return;
        }

        REEL_LOG(JANITOR, INFO, "Sweeping renditions not accessed for " << _ttl.count() << " seconds, every " << _period.count() << " seconds");
        scheduleSweep();
    }

    CacheJanitor::~CacheJanitor()
    {
        // waits for an ongoing sweep
        const std::scoped_lock lock{ _state->mutex };

        _state->stopped = true;
        _timer.cancel();
    }

    std::size_t CacheJanitor::sweep(std::chrono::seconds ttl)
    {
        REEL_LOG(JANITOR, DEBUG, "Sweep started, ttl = " << ttl.count() << " seconds");

        const auto startTime{ std::chrono::steady_clock::now() };
        const std::size_t evictedCount{ _cache.evictOlderThan(ttl) };

        REEL_LOG(JANITOR, INFO, "Sweep done in " << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime).count() << "ms, " << evictedCount << " renditions evicted");

        return evictedCount;
    }

    void CacheJanitor::scheduleSweep()
    {
        REEL_LOG(JANITOR, DEBUG, "Next sweep in " << _period.count() << " seconds");

        _timer.expires_after(_period);
        _timer.async_wait([this, state = _state](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (ec)
                throw Exception{ "Steady timer failure: " + std::string{ ec.message() } };

            // this is only valid if not stopped
            const std::scoped_lock lock{ state->mutex };
            if (state->stopped)
                return;

            try
            {
                sweep(_ttl);
            }
            catch (const std::exception& e)
            {
                REEL_LOG(JANITOR, ERROR, "Sweep failed: " << e.what());
            }

            scheduleSweep();
        });
    }
} // namespace reel::transcoding
