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
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/MediaId.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/CachedRenditionId.hpp"

namespace reel::db
{
    class Session;

    // Completed encode output, at most one per (media, quality)
    class CachedRendition final : public Object<CachedRendition, CachedRenditionId>
    {
    public:
        CachedRendition() = default;

        // Utility
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, CachedRenditionId id);
        static pointer find(Session& session, MediaId mediaId, QualityTier quality);
        // ordered by quality
        static void find(Session& session, MediaId mediaId, const std::function<void(const pointer&)>& visitor);
        static std::vector<CachedRenditionId> findLastAccessedBefore(Session& session, const Wt::WDateTime& dateTime);

        // Accessors
        MediaId getMediaId() const { return _mediaId; }
        QualityTier getQuality() const { return _quality; }
        const std::filesystem::path& getOutputPath() const { return _outputPath; }
        std::uint64_t getFileSize() const { return static_cast<std::uint64_t>(_fileSize); }
        std::chrono::milliseconds getDuration() const { return _duration; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getLastAccessedAt() const { return _lastAccessedAt; }

        // Setters
        // Replaces the artifact, creation and access dates are reset
        void setArtifact(const std::filesystem::path& outputPath, std::uint64_t fileSize, std::chrono::milliseconds duration);
        void setLastAccessedAt(const Wt::WDateTime& dateTime) { _lastAccessedAt = dateTime; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _mediaId, "media_id");
            Wt::Dbo::field(a, _quality, "quality");
            Wt::Dbo::field(a, _outputPath, "output_path");
            Wt::Dbo::field(a, _fileSize, "file_size");
            Wt::Dbo::field(a, _duration, "duration");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _lastAccessedAt, "last_accessed_at");
        }

    private:
        friend class Session;
        CachedRendition(MediaId mediaId, QualityTier quality, const std::filesystem::path& outputPath, std::uint64_t fileSize, std::chrono::milliseconds duration);
        static pointer create(Session& session, MediaId mediaId, QualityTier quality, const std::filesystem::path& outputPath, std::uint64_t fileSize, std::chrono::milliseconds duration);

        MediaId _mediaId;
        QualityTier _quality{ QualityTier::Q240p };
        std::filesystem::path _outputPath;
        long long _fileSize{};
        std::chrono::duration<int, std::milli> _duration{};
        Wt::WDateTime _createdAt;
        Wt::WDateTime _lastAccessedAt;
    };
} // namespace reel::db
