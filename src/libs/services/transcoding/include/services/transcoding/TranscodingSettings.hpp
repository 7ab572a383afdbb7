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
#include <filesystem>

namespace reel::core
{
    class IConfig;
}

namespace reel::transcoding
{
    struct TranscodingSettings
    {
        std::filesystem::path cachePath; // published renditions
        std::filesystem::path tmpPath;   // encodes in progress, cleared at startup
        std::size_t maxConcurrentTranscodes{ 2 };
        std::chrono::seconds transcodeTimeout{ std::chrono::hours{ 6 } };
        std::chrono::milliseconds progressInterval{ 2'000 };
        std::chrono::seconds cacheTtl{ std::chrono::hours{ 24 } };
        std::chrono::seconds janitorPeriod{ std::chrono::minutes{ 60 } }; // zero disables the janitor
    };

    // Paths are located under "working-dir"
    // throws core::ReelException on bad values
    TranscodingSettings loadTranscodingSettings(core::IConfig& config);
} // namespace reel::transcoding
