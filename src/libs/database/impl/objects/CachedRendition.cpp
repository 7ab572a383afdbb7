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

#include "database/objects/CachedRendition.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"
#include "traits/PathTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(reel::db::CachedRendition)

namespace reel::db
{
    CachedRendition::CachedRendition(MediaId mediaId, QualityTier quality, const std::filesystem::path& outputPath, std::uint64_t fileSize, std::chrono::milliseconds duration)
        : _mediaId{ mediaId }
        , _quality{ quality }
    {
        setArtifact(outputPath, fileSize, duration);
    }

    CachedRendition::pointer CachedRendition::create(Session& session, MediaId mediaId, QualityTier quality, const std::filesystem::path& outputPath, std::uint64_t fileSize, std::chrono::milliseconds duration)
    {
        return session.getDboSession()->add(std::unique_ptr<CachedRendition>{ new CachedRendition{ mediaId, quality, outputPath, fileSize, duration } });
    }

    std::size_t CachedRendition::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM cached_rendition"));
    }

    CachedRendition::pointer CachedRendition::find(Session& session, CachedRenditionId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<CachedRendition>>("SELECT c_r FROM cached_rendition c_r").where("c_r.id = ?").bind(id));
    }

    CachedRendition::pointer CachedRendition::find(Session& session, MediaId mediaId, QualityTier quality)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<CachedRendition>>("SELECT c_r FROM cached_rendition c_r") };
        query.where("c_r.media_id = ?").bind(mediaId);
        query.where("c_r.quality = ?").bind(quality);

        return utils::fetchQuerySingleResult(query);
    }

    void CachedRendition::find(Session& session, MediaId mediaId, const std::function<void(const pointer&)>& visitor)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<CachedRendition>>("SELECT c_r FROM cached_rendition c_r") };
        query.where("c_r.media_id = ?").bind(mediaId);
        query.orderBy("c_r.quality");

        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<CachedRendition>& rendition) {
            visitor(rendition);
        });
    }

    std::vector<CachedRenditionId> CachedRendition::findLastAccessedBefore(Session& session, const Wt::WDateTime& dateTime)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<CachedRenditionId>("SELECT c_r.id FROM cached_rendition c_r") };
        query.where("c_r.last_accessed_at < ?").bind(dateTime);
        query.orderBy("c_r.last_accessed_at");

        return utils::fetchQueryResults<CachedRenditionId>(query);
    }

    void CachedRendition::setArtifact(const std::filesystem::path& outputPath, std::uint64_t fileSize, std::chrono::milliseconds duration)
    {
        _outputPath = outputPath;
        _fileSize = static_cast<long long>(fileSize);
        _duration = std::chrono::duration_cast<std::chrono::duration<int, std::milli>>(duration);
        _createdAt = Wt::WDateTime::currentDateTime();
        _lastAccessedAt = _createdAt;
    }
} // namespace reel::db
