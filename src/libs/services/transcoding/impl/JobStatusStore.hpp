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
#include <optional>
#include <string_view>

#include "database/MediaId.hpp"
#include "database/Types.hpp"
#include "database/objects/TranscodeJobId.hpp"
#include "services/transcoding/ITranscodingService.hpp"

namespace reel::db
{
    class IDb;
}

namespace reel::transcoding
{
    // Durable job records, see db::TranscodeJob for the state machine
    class JobStatusStore
    {
    public:
        JobStatusStore(db::IDb& db);
        ~JobStatusStore() = default;
        JobStatusStore(const JobStatusStore&) = delete;
        JobStatusStore& operator=(const JobStatusStore&) = delete;

        db::TranscodeJobId createPending(db::MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality);
        db::TranscodeJobId createCompleted(db::MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality, const std::filesystem::path& outputPath);

        std::optional<JobStatus> getStatus(db::TranscodeJobId jobId);

        // throw db::Exception on invalid transitions
        void markProcessing(db::TranscodeJobId jobId);
        void setProgress(db::TranscodeJobId jobId, unsigned progress);
        void markCompleted(db::TranscodeJobId jobId, const std::filesystem::path& outputPath);
        void markFailed(db::TranscodeJobId jobId, db::TranscodeErrorKind kind, std::string_view message);

        std::size_t failInterruptedJobs();
        std::size_t prune(std::chrono::seconds olderThan);

    private:
        db::IDb& _db;
    };
} // namespace reel::transcoding
