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

#include "services/transcoding/TranscodingSettings.hpp"

#include "core/IConfig.hpp"
#include "services/transcoding/Exception.hpp"

namespace reel::transcoding
{
    TranscodingSettings loadTranscodingSettings(core::IConfig& config)
    {
        const std::filesystem::path workingDir{ config.getPath("working-dir", "/var/reel") };

        TranscodingSettings settings;
        settings.cachePath = workingDir / "cache";
        settings.tmpPath = workingDir / "tmp";
        settings.maxConcurrentTranscodes = config.getULong("max-concurrent-transcodes", 2);
        settings.transcodeTimeout = std::chrono::seconds{ config.getULong("transcode-timeout-secs", 21'600) };
        settings.progressInterval = std::chrono::milliseconds{ config.getULong("transcode-progress-interval-ms", 2'000) };
        settings.cacheTtl = std::chrono::hours{ config.getULong("cache-ttl-hours", 24) };
        settings.janitorPeriod = std::chrono::minutes{ config.getULong("cache-janitor-period-minutes", 60) };

        if (settings.maxConcurrentTranscodes == 0)
            throw Exception{ "max-concurrent-transcodes must be at least 1" };
        if (settings.transcodeTimeout.count() == 0)
            throw Exception{ "transcode-timeout-secs must be at least 1" };
        if (settings.progressInterval.count() == 0)
            throw Exception{ "transcode-progress-interval-ms must be at least 1" };

        return settings;
    }
} // namespace reel::transcoding
