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

#include <atomic>

#include <unistd.h>

namespace reel::db::tests
{
    namespace
    {
        std::filesystem::path createTmpDbPath()
        {
            static std::atomic<unsigned> counter{};
            return std::filesystem::temp_directory_path() / ("reel-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".db");
        }

        void removeDbFiles(const std::filesystem::path& dbPath)
        {
            std::error_code ec;
            for (const char* suffix : { "", "-wal", "-shm" })
                std::filesystem::remove(dbPath.string() + suffix, ec);
        }
    } // namespace

    TmpDatabase::TmpDatabase()
        : _tmpFile{ createTmpDbPath() }
        , _db{ createDb(_tmpFile, 4) }
    {
    }

    TmpDatabase::~TmpDatabase()
    {
        _db.reset();
        removeDbFiles(_tmpFile);
    }

    IDb& TmpDatabase::getDb()
    {
        return *_db;
    }

    DatabaseFixture::~DatabaseFixture()
    {
        testDatabaseEmpty();
    }

    void DatabaseFixture::SetUpTestSuite()
    {
        _tmpDb = std::make_unique<TmpDatabase>();
        {
            db::Session s{ _tmpDb->getDb() };
            s.prepareTablesIfNeeded();
            s.createIndexesIfNeeded();
        }
    }

    void DatabaseFixture::TearDownTestSuite()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::testDatabaseEmpty()
    {
        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(CachedRendition::getCount(session), 0);
        EXPECT_EQ(TranscodeJob::getCount(session), 0);
    }

    TEST_F(DatabaseFixture, prepareTablesTwice)
    {
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();
    }

    TEST(DatabaseCommon, IdType)
    {
        {
            const IdType id{};
            EXPECT_FALSE(id.isValid());
        }

        {
            const IdType id{ 0 };
            EXPECT_TRUE(id.isValid());
            EXPECT_EQ(id.toString(), "0");
        }

        {
            const IdType id1{ 0 };
            const IdType id2{ 1 };
            EXPECT_NE(id1, id2);
            EXPECT_LT(id1, id2);
        }
    }
} // namespace reel::db::tests
