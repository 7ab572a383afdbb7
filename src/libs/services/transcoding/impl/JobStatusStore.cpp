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

#include "JobStatusStore.hpp"

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/TranscodeJob.hpp"

#include "Utils.hpp"

namespace reel::transcoding
{
    namespace
    {
        JobState toJobState(const db::TranscodeJob::pointer& job)
        {
            switch (job->getState())
            {
            case db::TranscodeJobState::Pending:
                return JobPending{};
            case db::TranscodeJobState::Processing:
                return JobProcessing{ job->getProgress() };
            case db::TranscodeJobState::Completed:
                return JobCompleted{ job->getOutputPath() };
            case db::TranscodeJobState::Failed:
                return JobFailed{ job->getErrorKind(), job->getErrorMessage() };
            }

            throw db::Exception{ "Unhandled job state " + std::to_string(static_cast<int>(job->getState())) };
        }

        db::TranscodeJob::pointer getJob(db::Session& session, db::TranscodeJobId jobId)
        {
            db::TranscodeJob::pointer job{ db::TranscodeJob::find(session, jobId) };
            if (!job)
                throw db::Exception{ "Job " + jobId.toString() + " not found" };

            return job;
        }
    } // namespace

    JobStatusStore::JobStatusStore(db::IDb& db)
        : _db{ db }
    {
    }

    db::TranscodeJobId JobStatusStore::createPending(db::MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        return session.create<db::TranscodeJob>(mediaId, inputPath, requestedQuality, resolvedQuality)->getId();
    }

    db::TranscodeJobId JobStatusStore::createCompleted(db::MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality, const std::filesystem::path& outputPath)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        return session.create<db::TranscodeJob>(mediaId, inputPath, requestedQuality, resolvedQuality, outputPath)->getId();
    }

    std::optional<JobStatus> JobStatusStore::getStatus(db::TranscodeJobId jobId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::TranscodeJob::pointer job{ db::TranscodeJob::find(session, jobId) };
        if (!job)
            return std::nullopt;

        JobStatus status;
        status.jobId = jobId;
        status.mediaId = job->getMediaId();
        status.requestedQuality = job->getRequestedQuality();
        status.resolvedQuality = job->getResolvedQuality();
        status.state = toJobState(job);
        status.progress = job->getProgress();
        status.createdAt = job->getCreatedAt();
        status.startedAt = job->getStartedAt();
        status.completedAt = job->getCompletedAt();

        return status;
    }

    void JobStatusStore::markProcessing(db::TranscodeJobId jobId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        getJob(session, jobId).modify()->markProcessing();
    }

    void JobStatusStore::setProgress(db::TranscodeJobId jobId, unsigned progress)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        getJob(session, jobId).modify()->setProgress(progress);
    }

    void JobStatusStore::markCompleted(db::TranscodeJobId jobId, const std::filesystem::path& outputPath)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        getJob(session, jobId).modify()->markCompleted(outputPath);
    }

    void JobStatusStore::markFailed(db::TranscodeJobId jobId, db::TranscodeErrorKind kind, std::string_view message)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        getJob(session, jobId).modify()->markFailed(kind, message);
    }

    std::size_t JobStatusStore::failInterruptedJobs()
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        return db::TranscodeJob::failInterruptedJobs(session);
    }

    std::size_t JobStatusStore::prune(std::chrono::seconds olderThan)
    {
        const Wt::WDateTime threshold{ utils::getDateTimeBefore(olderThan) };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        const std::size_t count{ db::TranscodeJob::removeTerminatedBefore(session, threshold) };
        REEL_LOG(TRANSCODING, DEBUG, "Pruned " << count << " terminated jobs");

        return count;
    }
} // namespace reel::transcoding
