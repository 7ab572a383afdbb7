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
#include <map>
#include <memory>
#include <mutex>

#include "core/IJobScheduler.hpp"
#include "services/transcoding/ITranscodingService.hpp"

#include "CacheJanitor.hpp"
#include "JobStatusStore.hpp"
#include "QualityNegotiator.hpp"
#include "RenditionCache.hpp"
#include "TranscodeWorker.hpp"

namespace reel::transcoding
{
    class TranscodingService : public ITranscodingService
    {
    public:
        TranscodingService(boost::asio::io_context& ioContext, db::IDb& db, av::IEncoder& encoder, av::IMediaProber& prober, const TranscodingSettings& settings);
        ~TranscodingService() override;

        TranscodingService(const TranscodingService&) = delete;
        TranscodingService& operator=(const TranscodingService&) = delete;

    private:
        db::TranscodeJobId submit(db::MediaId mediaId, const std::filesystem::path& inputPath, std::string_view requestedQuality) override;
        JobStatus getStatus(db::TranscodeJobId jobId) override;
        std::optional<std::filesystem::path> getCachedPath(db::MediaId mediaId, std::string_view quality) override;
        std::unique_ptr<IRenditionLease> acquireRendition(db::MediaId mediaId, std::string_view quality) override;
        std::vector<QualityTier> getAvailableQualities(db::MediaId mediaId) override;
        StreamTarget resolveStream(db::MediaId mediaId, const std::filesystem::path& inputPath, std::string_view requestedQuality) override;
        std::size_t purgeOlderThan(std::chrono::seconds ttl) override;
        std::size_t pruneJobs(std::chrono::seconds olderThan) override;

        db::TranscodeJobId submitNegotiated(db::MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, const Negotiation& negotiation);
        void releaseJob(const ActiveJobKey& key, const std::function<void()>& recordOutcome);
        void recoverInterruptedJobs();

        const TranscodingSettings _settings;
        QualityNegotiator _negotiator;
        JobStatusStore _jobStore;
        RenditionCache _cache;
        std::atomic<bool> _abortRequested{};
        WorkerContext _workerContext;

        // serializes the cache and active job checks of submissions with job publications
        std::mutex _activeJobsMutex;
        std::map<ActiveJobKey, db::TranscodeJobId> _activeJobs;

        std::unique_ptr<core::IJobScheduler> _jobScheduler;
        std::unique_ptr<CacheJanitor> _janitor;
    };
} // namespace reel::transcoding
