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

#include "TranscodingService.hpp"

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "services/transcoding/Exception.hpp"

namespace reel::transcoding
{
    std::unique_ptr<ITranscodingService> createTranscodingService(boost::asio::io_context& ioContext, db::IDb& db, av::IEncoder& encoder, av::IMediaProber& prober, const TranscodingSettings& settings)
    {
        return std::make_unique<TranscodingService>(ioContext, db, encoder, prober, settings);
    }

    TranscodingService::TranscodingService(boost::asio::io_context& ioContext, db::IDb& db, av::IEncoder& encoder, av::IMediaProber& prober, const TranscodingSettings& settings)
        : _settings{ settings }
        , _negotiator{ prober }
        , _jobStore{ db }
        , _cache{ db, _settings.cachePath }
        , _workerContext{ _jobStore, _cache, encoder, prober, _settings, _abortRequested, [this](const ActiveJobKey& key, const std::function<void()>& recordOutcome) { releaseJob(key, recordOutcome); } }
    {
        if (_settings.maxConcurrentTranscodes == 0)
            throw Exception{ "At least one concurrent transcode is required" };

        if (!core::pathUtils::ensureDirectory(_settings.tmpPath))
            throw Exception{ "Cannot create temporary directory '" + _settings.tmpPath.string() + "'" };

        REEL_LOG(TRANSCODING, INFO, "Starting service...");

        recoverInterruptedJobs();

        _jobScheduler = core::createJobScheduler("Transcode", _settings.maxConcurrentTranscodes);
        _janitor = std::make_unique<CacheJanitor>(ioContext, _cache, _settings.cacheTtl, _settings.janitorPeriod);

        REEL_LOG(TRANSCODING, INFO, "Service started! (" << _settings.maxConcurrentTranscodes << " concurrent transcodes max)");
    }

    TranscodingService::~TranscodingService()
    {
        _janitor.reset();

        // running encodes are killed, queued jobs are dropped and will be failed at next startup
        _abortRequested = true;
        _jobScheduler.reset();

        REEL_LOG(TRANSCODING, INFO, "Service stopped!");
    }

    void TranscodingService::recoverInterruptedJobs()
    {
        const std::size_t interruptedJobCount{ _jobStore.failInterruptedJobs() };
        if (interruptedJobCount > 0)
            REEL_LOG(TRANSCODING, INFO, "Failed " << interruptedJobCount << " jobs interrupted by a previous stop");

        core::pathUtils::clearDirectory(_settings.tmpPath);
    }

    db::TranscodeJobId TranscodingService::submit(db::MediaId mediaId, const std::filesystem::path& inputPath, std::string_view requestedQuality)
    {
        const QualityTier quality{ parseQualityTier(requestedQuality) };
        const Negotiation negotiation{ _negotiator.negotiate(quality, inputPath) };

        return submitNegotiated(mediaId, inputPath, quality, negotiation);
    }

    db::TranscodeJobId TranscodingService::submitNegotiated(db::MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, const Negotiation& negotiation)
    {
        const ActiveJobKey key{ mediaId, negotiation.resolvedQuality };

        const std::scoped_lock lock{ _activeJobsMutex };

        if (const std::optional<CacheEntry> entry{ _cache.get(mediaId, key.quality) })
        {
            const db::TranscodeJobId jobId{ _jobStore.createCompleted(mediaId, inputPath, requestedQuality, key.quality, entry->path) };
            REEL_LOG(TRANSCODING, DEBUG, "Media " << mediaId.toString() << " already cached in " << toString(key.quality) << ", job " << jobId.toString() << " completed");
            return jobId;
        }

        if (auto it{ _activeJobs.find(key) }; it != std::cend(_activeJobs))
        {
            REEL_LOG(TRANSCODING, DEBUG, "Media " << mediaId.toString() << " already being transcoded in " << toString(key.quality) << ", joining job " << it->second.toString());
            return it->second;
        }

        const db::TranscodeJobId jobId{ _jobStore.createPending(mediaId, inputPath, requestedQuality, key.quality) };
        _activeJobs.emplace(key, jobId);

        std::optional<std::chrono::milliseconds> sourceDuration;
        if (negotiation.sourceInfo && negotiation.sourceInfo->duration.count() > 0)
            sourceDuration = negotiation.sourceInfo->duration;

        _jobScheduler->scheduleJob(std::make_unique<TranscodeWorker>(_workerContext, JobDesc{ jobId, key, inputPath, sourceDuration }));

        REEL_LOG(TRANSCODING, INFO, "Queued job " << jobId.toString() << ": media " << mediaId.toString() << " in " << toString(key.quality) << " (requested " << toString(requestedQuality) << ")");
        return jobId;
    }

    void TranscodingService::releaseJob(const ActiveJobKey& key, const std::function<void()>& recordOutcome)
    {
        const std::scoped_lock lock{ _activeJobsMutex };

        try
        {
            recordOutcome();
        }
        catch (const std::exception& e)
        {
            REEL_LOG(TRANSCODING, ERROR, "Cannot record outcome of the job for media " << key.mediaId.toString() << " in " << toString(key.quality) << ": " << e.what());
        }

        _activeJobs.erase(key);
    }

    JobStatus TranscodingService::getStatus(db::TranscodeJobId jobId)
    {
        std::optional<JobStatus> status{ _jobStore.getStatus(jobId) };
        if (!status)
            throw JobNotFoundException{};

        return *status;
    }

    std::optional<std::filesystem::path> TranscodingService::getCachedPath(db::MediaId mediaId, std::string_view quality)
    {
        const std::optional<CacheEntry> entry{ _cache.get(mediaId, parseQualityTier(quality)) };
        if (!entry)
            return std::nullopt;

        return entry->path;
    }

    std::unique_ptr<IRenditionLease> TranscodingService::acquireRendition(db::MediaId mediaId, std::string_view quality)
    {
        return _cache.acquire(mediaId, parseQualityTier(quality));
    }

    std::vector<QualityTier> TranscodingService::getAvailableQualities(db::MediaId mediaId)
    {
        return _cache.getAvailableQualities(mediaId);
    }

    StreamTarget TranscodingService::resolveStream(db::MediaId mediaId, const std::filesystem::path& inputPath, std::string_view requestedQuality)
    {
        const QualityTier quality{ parseQualityTier(requestedQuality) };
        const Negotiation negotiation{ _negotiator.negotiate(quality, inputPath) };

        if (std::optional<CacheEntry> entry{ _cache.get(mediaId, negotiation.resolvedQuality) })
            return StreamCached{ std::move(entry->path) };

        if (QualityNegotiator::canStreamDirectly(negotiation))
        {
            REEL_LOG(TRANSCODING, DEBUG, "Media " << mediaId.toString() << " can be streamed directly in " << toString(negotiation.resolvedQuality));
            return StreamDirect{ inputPath };
        }

        return StreamTranscoding{ submitNegotiated(mediaId, inputPath, quality, negotiation) };
    }

    std::size_t TranscodingService::purgeOlderThan(std::chrono::seconds ttl)
    {
        return _janitor->sweep(ttl);
    }

    std::size_t TranscodingService::pruneJobs(std::chrono::seconds olderThan)
    {
        return _jobStore.prune(olderThan);
    }
} // namespace reel::transcoding
