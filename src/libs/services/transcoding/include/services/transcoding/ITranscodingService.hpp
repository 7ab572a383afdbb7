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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <Wt/WDateTime.h>

#include "database/MediaId.hpp"
#include "database/Types.hpp"
#include "database/objects/TranscodeJobId.hpp"
#include "services/transcoding/QualityTier.hpp"
#include "services/transcoding/TranscodingSettings.hpp"

namespace reel
{
    namespace av
    {
        class IEncoder;
        class IMediaProber;
    } // namespace av

    namespace db
    {
        class IDb;
    }
} // namespace reel

namespace reel::transcoding
{
    struct JobPending
    {
    };

    struct JobProcessing
    {
        unsigned progress{}; // advisory, below 100
    };

    struct JobCompleted
    {
        std::filesystem::path outputPath;
    };

    struct JobFailed
    {
        db::TranscodeErrorKind kind;
        std::string message;
    };

    using JobState = std::variant<JobPending, JobProcessing, JobCompleted, JobFailed>;

    struct JobStatus
    {
        db::TranscodeJobId jobId;
        db::MediaId mediaId;
        QualityTier requestedQuality;
        QualityTier resolvedQuality;
        JobState state;
        unsigned progress{}; // 100 once completed
        Wt::WDateTime createdAt;
        Wt::WDateTime startedAt;   // invalid if not started
        Wt::WDateTime completedAt; // invalid if not terminated
    };

    constexpr bool isTerminal(const JobState& state)
    {
        return std::holds_alternative<JobCompleted>(state) || std::holds_alternative<JobFailed>(state);
    }

    // Keeps a cached rendition on disk while held, even if it expires meanwhile.
    // May outlive the service that created it, the rendition is then no longer
    // protected from eviction.
    class IRenditionLease
    {
    public:
        virtual ~IRenditionLease() = default;

        virtual const std::filesystem::path& getPath() const = 0;
        virtual std::uint64_t getFileSize() const = 0;
    };

    struct StreamCached
    {
        std::filesystem::path path;
    };

    // Source can be served as is
    struct StreamDirect
    {
        std::filesystem::path path;
    };

    struct StreamTranscoding
    {
        db::TranscodeJobId jobId;
    };

    using StreamTarget = std::variant<StreamCached, StreamDirect, StreamTranscoding>;

    class ITranscodingService
    {
    public:
        virtual ~ITranscodingService() = default;

        // Never waits for encode work
        // Returns an already completed job on a cache hit, or the active job for the same media and resolved quality
        // throws InvalidQualityException
        virtual db::TranscodeJobId submit(db::MediaId mediaId, const std::filesystem::path& inputPath, std::string_view requestedQuality) = 0;

        // throws JobNotFoundException
        virtual JobStatus getStatus(db::TranscodeJobId jobId) = 0;

        // throws InvalidQualityException
        virtual std::optional<std::filesystem::path> getCachedPath(db::MediaId mediaId, std::string_view quality) = 0;
        // null if not cached
        virtual std::unique_ptr<IRenditionLease> acquireRendition(db::MediaId mediaId, std::string_view quality) = 0;

        // ordered from the lowest quality
        virtual std::vector<QualityTier> getAvailableQualities(db::MediaId mediaId) = 0;

        // throws InvalidQualityException
        virtual StreamTarget resolveStream(db::MediaId mediaId, const std::filesystem::path& inputPath, std::string_view requestedQuality) = 0;

        // Manual janitor sweep, returns the number of evicted renditions
        virtual std::size_t purgeOlderThan(std::chrono::seconds ttl) = 0;

        // Drops terminated jobs, returns the number of dropped jobs
        virtual std::size_t pruneJobs(std::chrono::seconds olderThan) = 0;
    };

    // The io context is used to schedule the cache janitor
    std::unique_ptr<ITranscodingService> createTranscodingService(boost::asio::io_context& ioContext, db::IDb& db, av::IEncoder& encoder, av::IMediaProber& prober, const TranscodingSettings& settings);
} // namespace reel::transcoding
