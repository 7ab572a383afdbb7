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

#include "database/objects/TranscodeJob.hpp"

#include <algorithm>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"
#include "traits/PathTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(reel::db::TranscodeJob)

namespace reel::db
{
    namespace
    {
        const char* toString(TranscodeJobState state)
        {
            switch (state)
            {
            case TranscodeJobState::Pending:
                return "pending";
            case TranscodeJobState::Processing:
                return "processing";
            case TranscodeJobState::Completed:
                return "completed";
            case TranscodeJobState::Failed:
                return "failed";
            }
            return "unknown";
        }
    } // namespace

    TranscodeJob::TranscodeJob(MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality)
        : _mediaId{ mediaId }
        , _inputPath{ inputPath }
        , _requestedQuality{ requestedQuality }
        , _resolvedQuality{ resolvedQuality }
        , _createdAt{ Wt::WDateTime::currentDateTime() }
    {
    }

    TranscodeJob::pointer TranscodeJob::create(Session& session, MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality)
    {
        return session.getDboSession()->add(std::unique_ptr<TranscodeJob>{ new TranscodeJob{ mediaId, inputPath, requestedQuality, resolvedQuality } });
    }

    TranscodeJob::pointer TranscodeJob::create(Session& session, MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality, const std::filesystem::path& cachedOutputPath)
    {
        auto job{ std::unique_ptr<TranscodeJob>{ new TranscodeJob{ mediaId, inputPath, requestedQuality, resolvedQuality } } };
        job->_state = TranscodeJobState::Completed;
        job->_progress = 100;
        job->_startedAt = job->_createdAt;
        job->_completedAt = job->_createdAt;
        job->_outputPath = cachedOutputPath;

        return session.getDboSession()->add(std::move(job));
    }

    std::size_t TranscodeJob::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM transcode_job"));
    }

    TranscodeJob::pointer TranscodeJob::find(Session& session, TranscodeJobId jobId)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<TranscodeJob>>("SELECT t_j FROM transcode_job t_j").where("t_j.id = ?").bind(jobId));
    }

    void TranscodeJob::find(Session& session, TranscodeJobState state, const std::function<void(const pointer&)>& visitor)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<TranscodeJob>>("SELECT t_j FROM transcode_job t_j") };
        query.where("t_j.state = ?").bind(state);
        query.orderBy("t_j.id");

        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<TranscodeJob>& job) {
            visitor(job);
        });
    }

    std::size_t TranscodeJob::failInterruptedJobs(Session& session)
    {
        session.checkWriteTransaction();

        const std::size_t count{ static_cast<std::size_t>(utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM transcode_job").where("state = ? OR state = ?").bind(TranscodeJobState::Pending).bind(TranscodeJobState::Processing))) };
        if (count == 0)
            return 0;

        utils::executeCommand(*session.getDboSession(),
            "UPDATE transcode_job SET state = ?, error_kind = ?, error_message = ?, completed_at = ? WHERE state = ? OR state = ?",
            TranscodeJobState::Failed,
            TranscodeErrorKind::Interrupted,
            std::string{ "Interrupted by a restart" },
            Wt::WDateTime::currentDateTime(),
            TranscodeJobState::Pending,
            TranscodeJobState::Processing);

        return count;
    }

    std::size_t TranscodeJob::removeTerminatedBefore(Session& session, const Wt::WDateTime& dateTime)
    {
        session.checkWriteTransaction();

        const std::string whereClause{ "(state = ? OR state = ?) AND completed_at < ?" };
        const std::size_t count{ static_cast<std::size_t>(utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM transcode_job").where(whereClause).bind(TranscodeJobState::Completed).bind(TranscodeJobState::Failed).bind(dateTime))) };
        if (count == 0)
            return 0;

        utils::executeCommand(*session.getDboSession(), "DELETE FROM transcode_job WHERE " + whereClause, TranscodeJobState::Completed, TranscodeJobState::Failed, dateTime);

        return count;
    }

    void TranscodeJob::checkNotTerminated(std::string_view operation) const
    {
        if (isTerminated())
            throw Exception{ "Cannot " + std::string{ operation } + " job " + getId().toString() + ": already " + toString(_state) };
    }

    void TranscodeJob::markProcessing()
    {
        checkNotTerminated("start");
        if (_state != TranscodeJobState::Pending)
            throw Exception{ "Cannot start job " + getId().toString() + ": already " + toString(_state) };

        _state = TranscodeJobState::Processing;
        _startedAt = Wt::WDateTime::currentDateTime();
    }

    void TranscodeJob::setProgress(unsigned progress)
    {
        checkNotTerminated("update progress of");

        progress = std::min(progress, maxProgressBeforeCompletion);
        _progress = std::max(_progress, static_cast<int>(progress));
    }

    void TranscodeJob::markCompleted(const std::filesystem::path& outputPath)
    {
        checkNotTerminated("complete");

        _state = TranscodeJobState::Completed;
        _progress = 100;
        _outputPath = outputPath;
        _completedAt = Wt::WDateTime::currentDateTime();
        if (!_startedAt.isValid())
            _startedAt = _completedAt;
    }

    void TranscodeJob::markFailed(TranscodeErrorKind kind, std::string_view message)
    {
        checkNotTerminated("fail");

        _state = TranscodeJobState::Failed;
        _errorKind = kind;
        _errorMessage = message;
        _completedAt = Wt::WDateTime::currentDateTime();
    }
} // namespace reel::db
