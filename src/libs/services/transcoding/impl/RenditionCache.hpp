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
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "database/MediaId.hpp"
#include "services/transcoding/ITranscodingService.hpp"
#include "services/transcoding/QualityTier.hpp"

namespace reel::db
{
    class IDb;
}

namespace reel::transcoding
{
    struct CacheEntry
    {
        std::filesystem::path path;
        std::uint64_t fileSize{};
        std::chrono::milliseconds duration{};
    };

    class RenditionLease;

    // Entries are only trusted if their file exists: stale entries are dropped on lookup
    class RenditionCache
    {
    public:
        RenditionCache(db::IDb& db, const std::filesystem::path& cachePath);
        RenditionCache(const RenditionCache&) = delete;
        RenditionCache& operator=(const RenditionCache&) = delete;

        const std::filesystem::path& getCachePath() const { return _cachePath; }
        std::filesystem::path getRenditionPath(db::MediaId mediaId, QualityTier quality) const;

        // Refreshes the last access date on hit
        std::optional<CacheEntry> get(db::MediaId mediaId, QualityTier quality);
        // Last writer wins
        void put(db::MediaId mediaId, QualityTier quality, const std::filesystem::path& path, std::uint64_t fileSize, std::chrono::milliseconds duration);

        std::vector<QualityTier> getAvailableQualities(db::MediaId mediaId);

        // null on miss
        std::unique_ptr<IRenditionLease> acquire(db::MediaId mediaId, QualityTier quality);

        // Leased renditions are skipped, returns the number of evicted renditions
        std::size_t evictOlderThan(std::chrono::seconds ttl);

    private:
        friend class RenditionLease;

        // Shared with the leases, which may outlive the cache
        struct LeaseRegistry
        {
            std::mutex mutex;
            std::map<std::filesystem::path, std::size_t> counts;
        };

        db::IDb& _db;
        const std::filesystem::path _cachePath;
        const std::shared_ptr<LeaseRegistry> _leases;
    };
} // namespace reel::transcoding
