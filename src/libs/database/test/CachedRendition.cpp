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

#include "Common.hpp"

namespace reel::db::tests
{
    TEST_F(DatabaseFixture, CachedRendition_create)
    {
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(CachedRendition::getCount(session), 0);
            EXPECT_FALSE(CachedRendition::find(session, MediaId{ 7 }, QualityTier::Q720p));
        }

        ScopedCachedRendition rendition{ session, MediaId{ 7 }, QualityTier::Q720p, "/cache/7/720p.mp4", std::uint64_t{ 1024 }, std::chrono::milliseconds{ 90'000 } };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(CachedRendition::getCount(session), 1);

            auto dbRendition{ CachedRendition::find(session, MediaId{ 7 }, QualityTier::Q720p) };
            ASSERT_TRUE(dbRendition);
            EXPECT_EQ(dbRendition->getId(), rendition.getId());
            EXPECT_EQ(dbRendition->getOutputPath(), "/cache/7/720p.mp4");
            EXPECT_EQ(dbRendition->getFileSize(), 1024);
            EXPECT_EQ(dbRendition->getDuration(), std::chrono::milliseconds{ 90'000 });
            EXPECT_TRUE(dbRendition->getCreatedAt().isValid());
            EXPECT_EQ(dbRendition->getCreatedAt(), dbRendition->getLastAccessedAt());

            EXPECT_FALSE(CachedRendition::find(session, MediaId{ 7 }, QualityTier::Q1080p));
            EXPECT_FALSE(CachedRendition::find(session, MediaId{ 8 }, QualityTier::Q720p));
        }
    }

    TEST_F(DatabaseFixture, CachedRendition_findByMedia)
    {
        ScopedCachedRendition rendition1080{ session, MediaId{ 7 }, QualityTier::Q1080p, "/cache/7/1080p.mp4", std::uint64_t{ 2 }, std::chrono::milliseconds{ 0 } };
        ScopedCachedRendition rendition240{ session, MediaId{ 7 }, QualityTier::Q240p, "/cache/7/240p.mp4", std::uint64_t{ 1 }, std::chrono::milliseconds{ 0 } };
        ScopedCachedRendition otherMedia{ session, MediaId{ 8 }, QualityTier::Q480p, "/cache/8/480p.mp4", std::uint64_t{ 1 }, std::chrono::milliseconds{ 0 } };

        auto transaction{ session.createReadTransaction() };

        std::vector<QualityTier> qualities;
        CachedRendition::find(session, MediaId{ 7 }, [&](const CachedRendition::pointer& rendition) {
            qualities.push_back(rendition->getQuality());
        });

        const std::vector<QualityTier> expected{ QualityTier::Q240p, QualityTier::Q1080p };
        EXPECT_EQ(qualities, expected);
    }

    TEST_F(DatabaseFixture, CachedRendition_findLastAccessedBefore)
    {
        ScopedCachedRendition oldRendition{ session, MediaId{ 7 }, QualityTier::Q720p, "/cache/7/720p.mp4", std::uint64_t{ 1 }, std::chrono::milliseconds{ 0 } };
        ScopedCachedRendition recentRendition{ session, MediaId{ 7 }, QualityTier::Q480p, "/cache/7/480p.mp4", std::uint64_t{ 1 }, std::chrono::milliseconds{ 0 } };

        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };
        {
            auto transaction{ session.createWriteTransaction() };
            oldRendition.get().modify()->setLastAccessedAt(now.addSecs(-2 * 3600));
        }

        {
            auto transaction{ session.createReadTransaction() };

            const auto ids{ CachedRendition::findLastAccessedBefore(session, now.addSecs(-3600)) };
            ASSERT_EQ(ids.size(), 1);
            EXPECT_EQ(ids.front(), oldRendition.getId());

            EXPECT_TRUE(CachedRendition::findLastAccessedBefore(session, now.addSecs(-3 * 3600)).empty());
            EXPECT_EQ(CachedRendition::findLastAccessedBefore(session, now.addSecs(3600)).size(), 2);
        }
    }

    TEST_F(DatabaseFixture, CachedRendition_setArtifact)
    {
        ScopedCachedRendition rendition{ session, MediaId{ 7 }, QualityTier::Q720p, "/cache/7/720p.mp4", std::uint64_t{ 1 }, std::chrono::milliseconds{ 0 } };

        {
            auto transaction{ session.createWriteTransaction() };
            auto dbRendition{ rendition.get() };
            dbRendition.modify()->setLastAccessedAt(Wt::WDateTime::currentDateTime().addSecs(-3600));
            dbRendition.modify()->setArtifact("/cache/7/720p-new.mp4", 42, std::chrono::milliseconds{ 1000 });
        }

        {
            auto transaction{ session.createReadTransaction() };
            auto dbRendition{ rendition.get() };
            EXPECT_EQ(dbRendition->getOutputPath(), "/cache/7/720p-new.mp4");
            EXPECT_EQ(dbRendition->getFileSize(), 42);
            EXPECT_EQ(dbRendition->getDuration(), std::chrono::milliseconds{ 1000 });
            EXPECT_GT(dbRendition->getLastAccessedAt(), Wt::WDateTime::currentDateTime().addSecs(-60));
        }
    }
} // namespace reel::db::tests
