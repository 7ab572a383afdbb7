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

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>

#include "av/IEncoder.hpp"
#include "core/IChildProcess.hpp"

namespace reel::av
{
    class EncodeProcess : public IEncodeProcess
    {
    public:
        EncodeProcess(std::size_t debugId, std::unique_ptr<core::IChildProcess> childProcess);
        ~EncodeProcess() override;
        EncodeProcess(const EncodeProcess&) = delete;
        EncodeProcess& operator=(const EncodeProcess&) = delete;

    private:
        bool waitFor(std::chrono::milliseconds duration) override;
        std::optional<int> getExitCode() const override;
        void kill() override;
        std::optional<std::chrono::milliseconds> getProgressTime() const override;
        std::string getErrorOutputTail() const override;

        void drainOutputs();
        void processProgressLine(std::string_view line);

        const std::size_t _debugId;
        std::unique_ptr<core::IChildProcess> _childProcess;
        bool _exited{};

        mutable std::mutex _mutex;
        std::string _pendingProgressLine;
        std::optional<std::chrono::milliseconds> _progressTime;
        std::string _errorOutput;
    };

    class FFmpegEncoder : public IEncoder
    {
    public:
        FFmpegEncoder(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath);
        ~FFmpegEncoder() override = default;
        FFmpegEncoder(const FFmpegEncoder&) = delete;
        FFmpegEncoder& operator=(const FFmpegEncoder&) = delete;

    private:
        std::unique_ptr<IEncodeProcess> encode(const EncodeParameters& parameters) override;

        core::IChildProcessManager& _childProcessManager;
        const std::filesystem::path _ffmpegPath;
        std::atomic<std::size_t> _nextDebugId{};
    };
} // namespace reel::av
