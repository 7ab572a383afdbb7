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

#include "TranscodeWorker.hpp"

#include <algorithm>
#include <string>

#include "av/Exception.hpp"
#include "av/IEncoder.hpp"
#include "av/IMediaProber.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "database/objects/TranscodeJob.hpp"

#include "JobStatusStore.hpp"
#include "RenditionCache.hpp"

namespace reel::transcoding
{
#define LOG(severity, message) REEL_LOG(TRANSCODING, severity, "[job " << _desc.jobId.toString() << "] - " << message)

    namespace
    {
        constexpr std::chrono::seconds killGracePeriod{ 5 };
        constexpr double heuristicHalfProgressSecs{ 60 };
        constexpr double heuristicMaxProgress{ 90 };
    } // namespace

    namespace details
    {
        unsigned estimateProgress(std::optional<std::chrono::milliseconds> encodedTime, std::optional<std::chrono::milliseconds> sourceDuration, std::chrono::steady_clock::duration elapsed)
        {
            unsigned progress;
            if (encodedTime && sourceDuration && sourceDuration->count() > 0)
            {
                progress = static_cast<unsigned>(std::clamp<std::chrono::milliseconds::rep>(encodedTime->count() * 100 / sourceDuration->count(), 0, 100));
            }
            else
            {
                // tends to heuristicMaxProgress, half way after heuristicHalfProgressSecs
                const double elapsedSecs{ std::chrono::duration<double>{ elapsed }.count() };
                progress = elapsedSecs > 0 ? static_cast<unsigned>(heuristicMaxProgress * elapsedSecs / (elapsedSecs + heuristicHalfProgressSecs)) : 0;
            }

            return std::min(progress, db::TranscodeJob::maxProgressBeforeCompletion);
        }
    } // namespace details

    TranscodeWorker::TranscodeWorker(WorkerContext& context, const JobDesc& desc)
        : _context{ context }
        , _desc{ desc }
        , _tmpOutputPath{ _context.settings.tmpPath / ("job-" + _desc.jobId.toString() + ".mp4.tmp") }
        , _outputPath{ _context.cache.getRenditionPath(_desc.key.mediaId, _desc.key.quality) }
    {
    }

    void TranscodeWorker::run()
    {
        try
        {
            process();
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Job failed unexpectedly: " << e.what());
            core::pathUtils::removeFile(_tmpOutputPath);

            const bool isIoError{ dynamic_cast<const std::filesystem::filesystem_error*>(&e) != nullptr };
            fail(isIoError ? db::TranscodeErrorKind::CacheIoError : db::TranscodeErrorKind::EncodeProcessFailed, e.what());
        }
    }

    void TranscodeWorker::process()
    {
        LOG(INFO, "Transcoding media " << _desc.key.mediaId.toString() << " from " << _desc.inputPath << " to " << toString(_desc.key.quality));

        _context.jobStore.markProcessing(_desc.jobId);

        const EncodeProfile& profile{ getEncodeProfile(_desc.key.quality) };

        av::EncodeParameters parameters;
        parameters.inputFile = _desc.inputPath;
        parameters.outputFile = _tmpOutputPath;
        parameters.videoBitrate = profile.videoBitrate;
        parameters.audioBitrate = profile.audioBitrate;
        parameters.width = profile.width;
        parameters.height = profile.height;
        parameters.qualityFactor = profile.qualityFactor;

        std::unique_ptr<av::IEncodeProcess> encodeProcess;
        try
        {
            encodeProcess = _context.encoder.encode(parameters);
        }
        catch (const av::Exception& e)
        {
            LOG(ERROR, "Cannot start encoder: " << e.what());
            fail(db::TranscodeErrorKind::EncodeProcessFailed, e.what());
            return;
        }

        const auto startTime{ std::chrono::steady_clock::now() };
        const auto deadline{ startTime + _context.settings.transcodeTimeout };
        while (true)
        {
            const auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline)
            {
                LOG(WARNING, "Encode timed out after " << _context.settings.transcodeTimeout.count() << " seconds, killing encoder");
                encodeProcess->kill();
                encodeProcess->waitFor(killGracePeriod);
                core::pathUtils::removeFile(_tmpOutputPath);
                fail(db::TranscodeErrorKind::EncodeTimeout, "Encode exceeded " + std::to_string(_context.settings.transcodeTimeout.count()) + " seconds");
                return;
            }

            const std::chrono::milliseconds waitDuration{ std::min(_context.settings.progressInterval, std::chrono::ceil<std::chrono::milliseconds>(deadline - now)) };
            if (encodeProcess->waitFor(waitDuration))
                break;

            if (_context.abortRequested)
            {
                LOG(INFO, "Aborting encode");
                encodeProcess->kill();
                encodeProcess->waitFor(killGracePeriod);
                core::pathUtils::removeFile(_tmpOutputPath);
                fail(db::TranscodeErrorKind::Interrupted, "Service stopped while encoding");
                return;
            }

            const unsigned progress{ details::estimateProgress(encodeProcess->getProgressTime(), _desc.sourceDuration, std::chrono::steady_clock::now() - startTime) };
            _context.jobStore.setProgress(_desc.jobId, progress);
        }

        const std::optional<int> exitCode{ encodeProcess->getExitCode() };
        if (!exitCode || *exitCode != 0)
        {
            core::pathUtils::removeFile(_tmpOutputPath);

            std::string message{ exitCode ? "Encoder exited with code " + std::to_string(*exitCode) : std::string{ "Encoder terminated abnormally" } };
            const std::string errorOutput{ encodeProcess->getErrorOutputTail() };
            if (!errorOutput.empty())
                message += ": " + errorOutput;

            LOG(ERROR, message);
            fail(db::TranscodeErrorKind::EncodeProcessFailed, message);
            return;
        }

        LOG(DEBUG, "Encode done in " << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime).count() << "ms");
        publish();
    }

    void TranscodeWorker::publish()
    {
        std::chrono::milliseconds duration{ _desc.sourceDuration.value_or(std::chrono::milliseconds{}) };
        try
        {
            const av::MediaInfo outputInfo{ _context.prober.probe(_tmpOutputPath) };
            if (outputInfo.duration.count() > 0)
                duration = outputInfo.duration;
        }
        catch (const av::Exception& e)
        {
            LOG(WARNING, "Cannot probe encoded output, using source duration: " << e.what());
        }

        release([&] {
            std::error_code ec;
            std::filesystem::create_directories(_outputPath.parent_path(), ec);
            if (!ec)
                std::filesystem::rename(_tmpOutputPath, _outputPath, ec);

            if (ec)
            {
                LOG(ERROR, "Cannot move encoded output to " << _outputPath << ": " << ec.message());
                core::pathUtils::removeFile(_tmpOutputPath);
                _context.jobStore.markFailed(_desc.jobId, db::TranscodeErrorKind::CacheIoError, "Cannot publish rendition to '" + _outputPath.string() + "': " + ec.message());
                return;
            }

            try
            {
                _context.cache.put(_desc.key.mediaId, _desc.key.quality, _outputPath, core::pathUtils::getFileSize(_outputPath).value_or(0), duration);
                _context.jobStore.markCompleted(_desc.jobId, _outputPath);
            }
            catch (const std::exception&)
            {
                // a leftover row is dropped on next lookup since its file is gone
                core::pathUtils::removeFile(_outputPath);
                throw;
            }

            LOG(INFO, "Published " << _outputPath);
        });
    }

    void TranscodeWorker::fail(db::TranscodeErrorKind kind, std::string_view message)
    {
        release([&] {
            _context.jobStore.markFailed(_desc.jobId, kind, message);
        });
    }

    void TranscodeWorker::release(const std::function<void()>& recordOutcome)
    {
        if (_released)
            return;

        _released = true;
        _context.releaseJob(_desc.key, [&] {
            try
            {
                recordOutcome();
            }
            catch (const std::exception& e)
            {
                LOG(ERROR, "Cannot record job outcome: " << e.what());
                _context.jobStore.markFailed(_desc.jobId, db::TranscodeErrorKind::CacheIoError, "Cannot record job outcome: " + std::string{ e.what() });
            }
        });
    }
} // namespace reel::transcoding
