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

#include "RenditionCache.hpp"

#include <cassert>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/CachedRendition.hpp"

#include "Utils.hpp"

namespace reel::transcoding
{
    class RenditionLease : public IRenditionLease
    {
    public:
        RenditionLease(std::shared_ptr<RenditionCache::LeaseRegistry> leases, const CacheEntry& entry)
            : _leases{ std::move(leases) }
            , _entry{ entry }
        {
        }

        ~RenditionLease() override
        {
            const std::scoped_lock lock{ _leases->mutex };

            auto it{ _leases->counts.find(_entry.path) };
            assert(it != std::end(_leases->counts));
            if (--it->second == 0)
                _leases->counts.erase(it);
        }

        RenditionLease(const RenditionLease&) = delete;
        RenditionLease& operator=(const RenditionLease&) = delete;

    private:
        const std::filesystem::path& getPath() const override { return _entry.path; }
        std::uint64_t getFileSize() const override { return _entry.fileSize; }

        const std::shared_ptr<RenditionCache::LeaseRegistry> _leases;
        const CacheEntry _entry;
    };

    RenditionCache::RenditionCache(db::IDb& db, const std::filesystem::path& cachePath)
        : _db{ db }
        , _cachePath{ cachePath }
        , _leases{ std::make_shared<LeaseRegistry>() }
    {
        if (!core::pathUtils::ensureDirectory(_cachePath))
            throw core::ReelException{ "Cannot create cache directory '" + _cachePath.string() + "'" };
    }

    std::filesystem::path RenditionCache::getRenditionPath(db::MediaId mediaId, QualityTier quality) const
    {
        return _cachePath / mediaId.toString() / (std::string{ toString(quality) } + ".mp4");
    }

    std::optional<CacheEntry> RenditionCache::get(db::MediaId mediaId, QualityTier quality)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::CachedRendition::pointer rendition{ db::CachedRendition::find(session, mediaId, quality) };
        if (!rendition)
            return std::nullopt;

        std::error_code ec;
        const bool fileExists{ std::filesystem::exists(rendition->getOutputPath(), ec) };
        if (ec)
        {
            REEL_LOG(CACHE, ERROR, "Cannot check " << rendition->getOutputPath() << ": " << ec.message());
            return std::nullopt;
        }

        if (!fileExists)
        {
            REEL_LOG(CACHE, INFO, "Removing stale rendition " << toString(quality) << " of media " << mediaId.toString() << ": " << rendition->getOutputPath() << " is missing");
            rendition.remove();
            return std::nullopt;
        }

        rendition.modify()->setLastAccessedAt(Wt::WDateTime::currentDateTime());

        return CacheEntry{ rendition->getOutputPath(), rendition->getFileSize(), rendition->getDuration() };
    }

    void RenditionCache::put(db::MediaId mediaId, QualityTier quality, const std::filesystem::path& path, std::uint64_t fileSize, std::chrono::milliseconds duration)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::CachedRendition::pointer rendition{ db::CachedRendition::find(session, mediaId, quality) };
        if (!rendition)
        {
            session.create<db::CachedRendition>(mediaId, quality, path, fileSize, duration);
        }
        else
        {
            if (rendition->getOutputPath() != path && !core::pathUtils::removeFile(rendition->getOutputPath()))
                REEL_LOG(CACHE, WARNING, "Cannot remove replaced rendition " << rendition->getOutputPath());

            rendition.modify()->setArtifact(path, fileSize, duration);
        }

        REEL_LOG(CACHE, DEBUG, "Cached rendition " << toString(quality) << " of media " << mediaId.toString() << ": " << path << " (" << fileSize << " bytes)");
    }

    std::vector<QualityTier> RenditionCache::getAvailableQualities(db::MediaId mediaId)
    {
        std::vector<QualityTier> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        std::vector<db::CachedRendition::pointer> staleRenditions;
        db::CachedRendition::find(session, mediaId, [&](const db::CachedRendition::pointer& rendition) {
            std::error_code ec;
            if (std::filesystem::exists(rendition->getOutputPath(), ec))
                res.push_back(rendition->getQuality());
            else if (!ec)
                staleRenditions.push_back(rendition);
        });

        for (db::CachedRendition::pointer& rendition : staleRenditions)
        {
            REEL_LOG(CACHE, INFO, "Removing stale rendition " << toString(rendition->getQuality()) << " of media " << mediaId.toString());
            rendition.remove();
        }

        return res;
    }

    std::unique_ptr<IRenditionLease> RenditionCache::acquire(db::MediaId mediaId, QualityTier quality)
    {
        const std::scoped_lock lock{ _leases->mutex };

        const std::optional<CacheEntry> entry{ get(mediaId, quality) };
        if (!entry)
            return nullptr;

        _leases->counts[entry->path] += 1;
        return std::make_unique<RenditionLease>(_leases, *entry);
    }

    std::size_t RenditionCache::evictOlderThan(std::chrono::seconds ttl)
    {
        // computed once: later accesses are always more recent than this threshold
        const Wt::WDateTime threshold{ utils::getDateTimeBefore(ttl) };

        db::Session& session{ _db.getTLSSession() };

        std::vector<db::CachedRenditionId> candidates;
        {
            auto transaction{ session.createReadTransaction() };
            candidates = db::CachedRendition::findLastAccessedBefore(session, threshold);
        }

        std::size_t evictedCount{};
        for (const db::CachedRenditionId renditionId : candidates)
        {
            const std::scoped_lock lock{ _leases->mutex };
            auto transaction{ session.createWriteTransaction() };

            db::CachedRendition::pointer rendition{ db::CachedRendition::find(session, renditionId) };
            // may have been accessed or replaced meanwhile
            if (!rendition || rendition->getLastAccessedAt() >= threshold)
                continue;

            const std::filesystem::path path{ rendition->getOutputPath() };
            if (_leases->counts.contains(path))
            {
                REEL_LOG(CACHE, DEBUG, "Not evicting " << path << ": still in use");
                continue;
            }

            if (core::pathUtils::removeFile(path))
            {
                // drop the media directory once empty
                std::error_code ec;
                std::filesystem::remove(path.parent_path(), ec);
            }
            else
            {
                REEL_LOG(CACHE, ERROR, "Cannot remove expired rendition " << path);
            }

            REEL_LOG(CACHE, DEBUG, "Evicting rendition " << toString(rendition->getQuality()) << " of media " << rendition->getMediaId().toString());
            rendition.remove();
            evictedCount += 1;
        }

        return evictedCount;
    }
} // namespace reel::transcoding
