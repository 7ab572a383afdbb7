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

namespace reel::core
{
    class IChildProcessManager;
}

namespace reel::av
{
    struct EncodeParameters
    {
        std::filesystem::path inputFile;
        std::filesystem::path outputFile; // mp4, overwritten if it exists
        std::size_t videoBitrate{};       // bits per second
        std::size_t audioBitrate{};       // bits per second
        std::size_t width{};
        std::size_t height{};
        unsigned qualityFactor{}; // x264 CRF, lower is better
    };

    // A running encode
    // Destroying it kills the encoder if still running
    class IEncodeProcess
    {
    public:
        virtual ~IEncodeProcess() = default;

        // Waits at most duration, returns true as soon as the encoder has exited
        virtual bool waitFor(std::chrono::milliseconds duration) = 0;

        // Only set once the encoder exited normally
        virtual std::optional<int> getExitCode() const = 0;

        virtual void kill() = 0;

        // Position reached in the output, none until the encoder reported some progress
        virtual std::optional<std::chrono::milliseconds> getProgressTime() const = 0;

        // Last lines written by the encoder on its error output
        virtual std::string getErrorOutputTail() const = 0;
    };

    class IEncoder
    {
    public:
        virtual ~IEncoder() = default;

        // throws av::Exception if the encoder cannot be started
        virtual std::unique_ptr<IEncodeProcess> encode(const EncodeParameters& parameters) = 0;
    };

    // throws av::Exception if ffmpegPath does not exist
    std::unique_ptr<IEncoder> createFFmpegEncoder(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath);
} // namespace reel::av
