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

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/MediaId.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/TranscodeJobId.hpp"

namespace reel::db
{
    class Session;

    // Lifecycle: Pending -> Processing -> Completed | Failed
    // A job may also fail straight from Pending, and cache hits are created Completed
    // Terminal states are immutable: transitions out of them throw db::Exception
    class TranscodeJob final : public Object<TranscodeJob, TranscodeJobId>
    {
    public:
        TranscodeJob() = default;

        static constexpr unsigned maxProgressBeforeCompletion{ 99 };

        // Utility
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, TranscodeJobId jobId);
        static void find(Session& session, TranscodeJobState state, const std::function<void(const pointer&)>& visitor);
        // Fails jobs left Pending or Processing, returns the number of affected jobs
        static std::size_t failInterruptedJobs(Session& session);
        // Only Completed and Failed jobs are removed, returns the number of removed jobs
        static std::size_t removeTerminatedBefore(Session& session, const Wt::WDateTime& dateTime);

        // Accessors
        MediaId getMediaId() const { return _mediaId; }
        const std::filesystem::path& getInputPath() const { return _inputPath; }
        QualityTier getRequestedQuality() const { return _requestedQuality; }
        QualityTier getResolvedQuality() const { return _resolvedQuality; }
        TranscodeJobState getState() const { return _state; }
        bool isTerminated() const { return isTerminal(_state); }
        unsigned getProgress() const { return static_cast<unsigned>(_progress); }
        TranscodeErrorKind getErrorKind() const { return _errorKind; }
        const std::string& getErrorMessage() const { return _errorMessage; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getStartedAt() const { return _startedAt; }
        const Wt::WDateTime& getCompletedAt() const { return _completedAt; }
        const std::filesystem::path& getOutputPath() const { return _outputPath; }

        // State transitions
        void markProcessing();
        // progress never decreases and stays at most maxProgressBeforeCompletion
        void setProgress(unsigned progress);
        void markCompleted(const std::filesystem::path& outputPath);
        void markFailed(TranscodeErrorKind kind, std::string_view message);

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _mediaId, "media_id");
            Wt::Dbo::field(a, _inputPath, "input_path");
            Wt::Dbo::field(a, _requestedQuality, "requested_quality");
            Wt::Dbo::field(a, _resolvedQuality, "resolved_quality");
            Wt::Dbo::field(a, _state, "state");
            Wt::Dbo::field(a, _progress, "progress");
            Wt::Dbo::field(a, _errorKind, "error_kind");
            Wt::Dbo::field(a, _errorMessage, "error_message");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _startedAt, "started_at");
            Wt::Dbo::field(a, _completedAt, "completed_at");
            Wt::Dbo::field(a, _outputPath, "output_path");
        }

    private:
        friend class Session;
        TranscodeJob(MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality);
        static pointer create(Session& session, MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality);
        // Already completed job, for requests served from the cache
        static pointer create(Session& session, MediaId mediaId, const std::filesystem::path& inputPath, QualityTier requestedQuality, QualityTier resolvedQuality, const std::filesystem::path& cachedOutputPath);

        void checkNotTerminated(std::string_view operation) const;

        MediaId _mediaId;
        std::filesystem::path _inputPath;
        QualityTier _requestedQuality{ QualityTier::Q240p };
        QualityTier _resolvedQuality{ QualityTier::Q240p };
        TranscodeJobState _state{ TranscodeJobState::Pending };
        int _progress{};
        TranscodeErrorKind _errorKind{ TranscodeErrorKind::None };
        std::string _errorMessage;
        Wt::WDateTime _createdAt;
        Wt::WDateTime _startedAt;
        Wt::WDateTime _completedAt;
        std::filesystem::path _outputPath;
    };
} // namespace reel::db
