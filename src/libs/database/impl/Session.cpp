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

#include "database/Session.hpp"

#include <cassert>

#include "core/ILogger.hpp"
#include "database/objects/CachedRendition.hpp"
#include "database/objects/TranscodeJob.hpp"

#include "Db.hpp"
#include "Utils.hpp"

namespace reel::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<CachedRendition>("cached_rendition");
        _session.mapClass<TranscodeJob>("transcode_job");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getWriteMutex(), *this };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ *this };
    }

    void Session::pushTransaction(TransactionType type)
    {
        _transactionStack.push_back(type);
    }

    void Session::popTransaction([[maybe_unused]] TransactionType type)
    {
        assert(!_transactionStack.empty());
        assert(_transactionStack.back() == type);
        _transactionStack.pop_back();
    }

    void Session::checkWriteTransaction() const
    {
        assert(!_transactionStack.empty() && _transactionStack.back() == TransactionType::Write);
    }

    void Session::checkReadTransaction() const
    {
        assert(!_transactionStack.empty());
    }

    void Session::execute(std::string_view statement)
    {
        utils::executeCommand(_session, statement);
    }

    void Session::prepareTablesIfNeeded()
    {
        REEL_LOG(DB, INFO, "Preparing tables...");

        // Initial creation case
        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            REEL_LOG(DB, INFO, "Tables created");
        }
        catch (const Wt::Dbo::Exception& e)
        {
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                REEL_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw Exception{ std::string{ "Cannot create tables: " } + e.what() };
            }
            REEL_LOG(DB, DEBUG, "Tables already exist");
        }
    }

    void Session::createIndexesIfNeeded()
    {
        REEL_LOG(DB, INFO, "Creating indexes...");

        auto transaction{ createWriteTransaction() };

        // one rendition per media and quality
        utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS cached_rendition_media_quality_idx ON cached_rendition(media_id, quality)");
        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS cached_rendition_last_accessed_idx ON cached_rendition(last_accessed_at)");

        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS transcode_job_state_idx ON transcode_job(state)");
        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS transcode_job_completed_at_idx ON transcode_job(completed_at)");
    }
} // namespace reel::db
