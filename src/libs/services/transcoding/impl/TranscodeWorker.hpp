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
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>

#include "core/IJob.hpp"
#include "database/MediaId.hpp"
#include "database/Types.hpp"
#include "database/objects/TranscodeJobId.hpp"
#include "services/transcoding/QualityTier.hpp"
#include "services/transcoding/TranscodingSettings.hpp"

namespace reel::av
{
    class IEncoder;
    class IMediaProber;
} // namespace reel::av

namespace reel::transcoding
{
    class JobStatusStore;
    class RenditionCache;

    struct ActiveJobKey
    {
        db::MediaId mediaId;
        QualityTier quality;

        auto operator<=>(const ActiveJobKey&) const = default;
    };

    struct WorkerContext
    {
        JobStatusStore& jobStore;
        RenditionCache& cache;
        av::IEncoder& encoder;
        av::IMediaProber& prober;
        const TranscodingSettings& settings;
        const std::atomic<bool>& abortRequested;

        // Records the outcome of a job and releases its key, serialized with submissions
        std::function<void(const ActiveJobKey&, const std::function<void()>& recordOutcome)> releaseJob;
    };

    struct JobDesc
    {
        db::TranscodeJobId jobId;
        ActiveJobKey key;
        std::filesystem::path inputPath;
        std::optional<std::chrono::milliseconds> sourceDuration;
    };

    // Runs one job from Pending to a terminal state
    class TranscodeWorker : public core::IJob
    {
    public:
        TranscodeWorker(WorkerContext& context, const JobDesc& desc);
        ~TranscodeWorker() override = default;
        TranscodeWorker(const TranscodeWorker&) = delete;
        TranscodeWorker& operator=(const TranscodeWorker&) = delete;

    private:
        std::string_view getName() const override { return "Transcode"; }
        void run() override;

        void process();
        void publish();
        void fail(db::TranscodeErrorKind kind, std::string_view message);
        void release(const std::function<void()>& recordOutcome);

        WorkerContext& _context;
        const JobDesc _desc;
        const std::filesystem::path _tmpOutputPath;
        const std::filesystem::path _outputPath;
        bool _released{};
    };

    namespace details
    {
        // Advisory progress in [0, maxProgressBeforeCompletion]
        // Uses the encoder position if the source duration is known, the elapsed time otherwise
        unsigned estimateProgress(std::optional<std::chrono::milliseconds> encodedTime, std::optional<std::chrono::milliseconds> sourceDuration, std::chrono::steady_clock::duration elapsed);
    } // namespace details
} // namespace reel::transcoding
