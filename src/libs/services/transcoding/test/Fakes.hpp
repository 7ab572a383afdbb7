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
#include <condition_variable>
#include <fstream>
#include <map>
#include <mutex>
#include <vector>

#include "av/Exception.hpp"
#include "av/IEncoder.hpp"
#include "av/IMediaProber.hpp"

namespace reel::transcoding::tests
{
    class FakeMediaProber : public av::IMediaProber
    {
    public:
        void setMediaInfo(const std::filesystem::path& file, const av::MediaInfo& info)
        {
            const std::scoped_lock lock{ _mutex };
            _mediaInfos[file] = info;
        }

        std::size_t getProbeCount() const
        {
            const std::scoped_lock lock{ _mutex };
            return _probeCount;
        }

    private:
        av::MediaInfo probe(const std::filesystem::path& file) const override
        {
            const std::scoped_lock lock{ _mutex };

            _probeCount += 1;
            auto it{ _mediaInfos.find(file) };
            if (it == std::cend(_mediaInfos))
                throw av::Exception{ "Cannot open '" + file.string() + "': No such file or directory" };

            return it->second;
        }

        mutable std::mutex _mutex;
        mutable std::size_t _probeCount{};
        std::map<std::filesystem::path, av::MediaInfo> _mediaInfos;
    };

    inline av::MediaInfo makeVideoInfo(std::size_t width, std::size_t height, std::chrono::milliseconds duration)
    {
        av::MediaInfo info;
        info.containerName = "matroska,webm";
        info.duration = duration;
        info.video = av::VideoStreamInfo{ width, height, 8'000'000, "h264" };
        info.audio = av::AudioStreamInfo{ 384'000, 6, 48'000, "ac3" };
        return info;
    }

    // Encode processes exit as configured, writing their output on success
    class FakeEncoder : public av::IEncoder
    {
    public:
        struct Behavior
        {
            int exitCode{};
            std::string errorOutput;
            bool holdUntilReleased{}; // exit only once release() is called
            bool neverExit{};         // exit only when killed
            bool failToStart{};
        };

        void setBehavior(const Behavior& behavior)
        {
            const std::scoped_lock lock{ _mutex };
            _behavior = behavior;
        }

        void release()
        {
            {
                const std::scoped_lock lock{ _mutex };
                _released = true;
            }
            _cv.notify_all();
        }

        std::size_t getEncodeCount() const
        {
            const std::scoped_lock lock{ _mutex };
            return _encodes.size();
        }

        std::size_t getRunningCount() const
        {
            const std::scoped_lock lock{ _mutex };
            return _runningCount;
        }

        std::size_t getMaxRunningCount() const
        {
            const std::scoped_lock lock{ _mutex };
            return _maxRunningCount;
        }

        std::vector<av::EncodeParameters> getEncodes() const
        {
            const std::scoped_lock lock{ _mutex };
            return _encodes;
        }

        bool waitForRunningCount(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds{ 10 })
        {
            std::unique_lock lock{ _mutex };
            return _cv.wait_for(lock, timeout, [&] { return _runningCount == count; });
        }

    private:
        class Process : public av::IEncodeProcess
        {
        public:
            Process(FakeEncoder& encoder, const av::EncodeParameters& parameters, const Behavior& behavior)
                : _encoder{ encoder }
                , _parameters{ parameters }
                , _behavior{ behavior }
            {
            }

            ~Process() override
            {
                {
                    const std::scoped_lock lock{ _encoder._mutex };
                    if (!_exited)
                        _encoder._runningCount -= 1;
                }
                _encoder._cv.notify_all();
            }

            Process(const Process&) = delete;
            Process& operator=(const Process&) = delete;

        private:
            bool waitFor(std::chrono::milliseconds duration) override
            {
                std::unique_lock lock{ _encoder._mutex };
                if (!_encoder._cv.wait_for(lock, duration, [this] { return _killed || canExit(); }))
                    return false;

                if (!_exited)
                {
                    _exited = true;
                    _encoder._runningCount -= 1;
                    if (!_killed)
                    {
                        _exitCode = _behavior.exitCode;
                        if (_behavior.exitCode == 0)
                            std::ofstream{ _parameters.outputFile } << "fake rendition";
                    }
                    _encoder._cv.notify_all();
                }

                return true;
            }

            std::optional<int> getExitCode() const override
            {
                const std::scoped_lock lock{ _encoder._mutex };
                return _exitCode;
            }

            void kill() override
            {
                {
                    const std::scoped_lock lock{ _encoder._mutex };
                    _killed = true;
                }
                _encoder._cv.notify_all();
            }

            std::optional<std::chrono::milliseconds> getProgressTime() const override
            {
                return std::nullopt;
            }

            std::string getErrorOutputTail() const override
            {
                const std::scoped_lock lock{ _encoder._mutex };
                return _exited ? _behavior.errorOutput : std::string{};
            }

            bool canExit() const
            {
                return !_behavior.neverExit && (!_behavior.holdUntilReleased || _encoder._released);
            }

            FakeEncoder& _encoder;
            const av::EncodeParameters _parameters;
            const Behavior _behavior;
            bool _exited{};
            bool _killed{};
            std::optional<int> _exitCode;
        };

        std::unique_ptr<av::IEncodeProcess> encode(const av::EncodeParameters& parameters) override
        {
            const std::scoped_lock lock{ _mutex };

            if (_behavior.failToStart)
                throw av::Exception{ "Cannot execute '/usr/bin/ffmpeg': No such file or directory" };

            _encodes.push_back(parameters);
            _runningCount += 1;
            _maxRunningCount = std::max(_maxRunningCount, _runningCount);
            _cv.notify_all();

            return std::make_unique<Process>(*this, parameters, _behavior);
        }

        mutable std::mutex _mutex;
        std::condition_variable _cv;
        Behavior _behavior;
        bool _released{};
        std::vector<av::EncodeParameters> _encodes;
        std::size_t _runningCount{};
        std::size_t _maxRunningCount{};
    };
} // namespace reel::transcoding::tests
