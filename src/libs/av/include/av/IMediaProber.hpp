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
#include <memory>
#include <optional>
#include <string>

namespace reel::av
{
    struct VideoStreamInfo
    {
        std::size_t width{};
        std::size_t height{};
        std::size_t bitrate{};
        std::string codecName;
    };

    struct AudioStreamInfo
    {
        std::size_t bitrate{};
        std::size_t channelCount{};
        std::size_t sampleRate{};
        std::string codecName;
    };

    struct MediaInfo
    {
        std::string containerName;
        std::chrono::milliseconds duration{};
        std::size_t bitrate{};
        std::optional<VideoStreamInfo> video; // best video stream, attached pictures excluded
        std::optional<AudioStreamInfo> audio; // best audio stream
    };

    class IMediaProber
    {
    public:
        virtual ~IMediaProber() = default;

        // throws av::Exception if the file cannot be opened or parsed
        virtual MediaInfo probe(const std::filesystem::path& file) const = 0;
    };

    std::unique_ptr<IMediaProber> createMediaProber();
} // namespace reel::av
