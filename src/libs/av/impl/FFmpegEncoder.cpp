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

#include "FFmpegEncoder.hpp"

#include <array>
#include <thread>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "av/Exception.hpp"

namespace reel::av
{
#define LOG(severity, message) REEL_LOG(TRANSCODING, severity, "[" << _debugId << "] - " << message)

    namespace
    {
        constexpr std::size_t maxErrorOutputSize{ 64 * 1024 };
        constexpr std::size_t errorOutputTailSize{ 2048 };
        constexpr std::chrono::milliseconds pollPeriod{ 50 };
    } // namespace

    std::unique_ptr<IEncoder> createFFmpegEncoder(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath)
    {
        return std::make_unique<FFmpegEncoder>(childProcessManager, ffmpegPath);
    }

    FFmpegEncoder::FFmpegEncoder(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegPath)
        : _childProcessManager{ childProcessManager }
        , _ffmpegPath{ ffmpegPath }
    {
        std::error_code ec;
        if (!std::filesystem::exists(_ffmpegPath, ec))
            throw Exception{ "File '" + _ffmpegPath.string() + "' does not exist!" };

        REEL_LOG(TRANSCODING, INFO, "Using encoder " << _ffmpegPath);
    }

    std::unique_ptr<IEncodeProcess> FFmpegEncoder::encode(const EncodeParameters& parameters)
    {
        const std::size_t debugId{ _nextDebugId++ };

        REEL_LOG(TRANSCODING, INFO, "[" << debugId << "] - Encoding " << parameters.inputFile << " to " << parameters.outputFile);

        core::IChildProcess::Args args;

        // No interaction, only errors on stderr and machine readable progress on stdout
        args.emplace_back("-nostdin");
        args.emplace_back("-hide_banner");
        args.emplace_back("-loglevel");
        args.emplace_back("error");
        args.emplace_back("-nostats");
        args.emplace_back("-progress");
        args.emplace_back("pipe:1");

        args.emplace_back("-i");
        args.emplace_back(parameters.inputFile.string());

        // Video
        args.emplace_back("-c:v");
        args.emplace_back("libx264");
        args.emplace_back("-preset");
        args.emplace_back("fast");
        args.emplace_back("-crf");
        args.emplace_back(std::to_string(parameters.qualityFactor));
        args.emplace_back("-b:v");
        args.emplace_back(std::to_string(parameters.videoBitrate));
        args.emplace_back("-s");
        args.emplace_back(std::to_string(parameters.width) + "x" + std::to_string(parameters.height));

        // Audio
        args.emplace_back("-c:a");
        args.emplace_back("aac");
        args.emplace_back("-b:a");
        args.emplace_back(std::to_string(parameters.audioBitrate));

        // Playable while downloading
        args.emplace_back("-movflags");
        args.emplace_back("+faststart");

        args.emplace_back("-f");
        args.emplace_back("mp4");
        args.emplace_back("-y");
        args.emplace_back(parameters.outputFile.string());

        REEL_LOG(TRANSCODING, DEBUG, "[" << debugId << "] - Dumping args (" << args.size() << ")");
        for (const std::string& arg : args)
            REEL_LOG(TRANSCODING, DEBUG, "[" << debugId << "] - Arg = '" << arg << "'");

        std::unique_ptr<core::IChildProcess> childProcess;
        try
        {
            childProcess = _childProcessManager.spawnChildProcess(_ffmpegPath, args);
        }
        catch (const core::ChildProcessException& exception)
        {
            throw Exception{ "Cannot execute '" + _ffmpegPath.string() + "': " + exception.what() };
        }

        return std::make_unique<EncodeProcess>(debugId, std::move(childProcess));
    }

    EncodeProcess::EncodeProcess(std::size_t debugId, std::unique_ptr<core::IChildProcess> childProcess)
        : _debugId{ debugId }
        , _childProcess{ std::move(childProcess) }
    {
    }

    EncodeProcess::~EncodeProcess()
    {
        if (!_exited)
            LOG(DEBUG, "Encoder still running, killing it");
        // the child process kills and reaps on destruction
    }

    bool EncodeProcess::waitFor(std::chrono::milliseconds duration)
    {
        const auto deadline{ std::chrono::steady_clock::now() + duration };

        while (true)
        {
            drainOutputs();

            if (!_exited && _childProcess->hasExited())
            {
                _exited = true;
                // pick up what was written just before exiting
                drainOutputs();
                LOG(DEBUG, "Encoder exited, code = " << (_childProcess->getExitCode() ? std::to_string(*_childProcess->getExitCode()) : "<none>"));
            }

            if (_exited)
                return true;

            const auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline)
                return false;

            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(pollPeriod, deadline - now));
        }
    }

    std::optional<int> EncodeProcess::getExitCode() const
    {
        return _childProcess->getExitCode();
    }

    void EncodeProcess::kill()
    {
        LOG(DEBUG, "Killing encoder");
        _childProcess->kill();
    }

    std::optional<std::chrono::milliseconds> EncodeProcess::getProgressTime() const
    {
        const std::scoped_lock lock{ _mutex };
        return _progressTime;
    }

    std::string EncodeProcess::getErrorOutputTail() const
    {
        const std::scoped_lock lock{ _mutex };
        return std::string{ core::stringUtils::stringTrim(core::stringUtils::tailLines(_errorOutput, errorOutputTailSize)) };
    }

    void EncodeProcess::drainOutputs()
    {
        std::array<std::byte, 4096> buffer;

        while (const std::size_t nbBytes{ _childProcess->readSome(core::IChildProcess::OutputChannel::StdOut, buffer.data(), buffer.size()) })
        {
            const std::string_view data{ reinterpret_cast<const char*>(buffer.data()), nbBytes };

            std::size_t lineBegin{};
            for (std::size_t pos{ data.find('\n') }; pos != std::string_view::npos; pos = data.find('\n', lineBegin))
            {
                _pendingProgressLine.append(data.substr(lineBegin, pos - lineBegin));
                processProgressLine(_pendingProgressLine);
                _pendingProgressLine.clear();
                lineBegin = pos + 1;
            }
            _pendingProgressLine.append(data.substr(lineBegin));
        }

        while (const std::size_t nbBytes{ _childProcess->readSome(core::IChildProcess::OutputChannel::StdErr, buffer.data(), buffer.size()) })
        {
            const std::scoped_lock lock{ _mutex };

            _errorOutput.append(reinterpret_cast<const char*>(buffer.data()), nbBytes);
            if (_errorOutput.size() > maxErrorOutputSize)
                _errorOutput.erase(0, _errorOutput.size() - maxErrorOutputSize);
        }
    }

    void EncodeProcess::processProgressLine(std::string_view line)
    {
        // progress reports are "key=value" blocks, out_time_us holds the output position
        const std::size_t separator{ line.find('=') };
        if (separator == std::string_view::npos)
            return;

        const std::string_view key{ core::stringUtils::stringTrim(line.substr(0, separator)) };
        if (key != "out_time_us")
            return;

        // may be "N/A" before the first frame
        const std::optional<long long> outTimeUs{ core::stringUtils::readAs<long long>(core::stringUtils::stringTrim(line.substr(separator + 1))) };
        if (!outTimeUs || *outTimeUs < 0)
            return;

        const std::scoped_lock lock{ _mutex };
        _progressTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::microseconds{ *outTimeUs });
    }
} // namespace reel::av
