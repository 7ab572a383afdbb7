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

#include "Db.hpp"

#include <cassert>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Session.hpp"

namespace reel::db
{
    namespace
    {
        class Connection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            Connection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
            {
                prepare();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
            {
                prepare();
            }
            ~Connection() override = default;

        private:
            Connection& operator=(const Connection&) = delete;

            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void prepare()
            {
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
                executeSql("PRAGMA busy_timeout=10000");
            }
        };

        bool quickCheck(Wt::Dbo::SqlConnection& connection)
        {
            auto statement{ connection.prepareStatement("PRAGMA quick_check") };
            statement->execute();

            bool passed{};
            std::string result;
            result.reserve(32);
            while (statement->nextRow())
            {
                result.clear();
                statement->getResult(0, &result, static_cast<int>(result.capacity()));

                if (result == "ok")
                {
                    passed = true;
                    break;
                }

                REEL_LOG(DB, ERROR, "Quick check error: " << result);
            }

            return passed;
        }
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount);
    }

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount)
        : _uid{ nextUid++ }
    {
        REEL_LOG(DB, INFO, "Creating connection pool on file " << dbPath);

        std::unique_ptr<Connection> connection;
        try
        {
            connection = std::make_unique<Connection>(dbPath);
        }
        catch (const Wt::Dbo::Exception& e)
        {
            throw Exception{ "Cannot open database '" + dbPath.string() + "': " + e.what() };
        }

        if (core::IConfig * config{ core::Service<core::IConfig>::get() }) // may not be here on tests
            connection->setProperty("show-queries", config->getBool("db-show-queries", false) ? "true" : "false");

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), static_cast<int>(connectionCount)) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });
        _connectionPool = std::move(connectionPool);

        executeSql("PRAGMA temp_store=MEMORY");
        performQuickCheck();
    }

    Db::~Db()
    {
        // sessions must release their connections before the pool goes away
        std::scoped_lock lock{ _tlsSessionsMutex };
        _tlsSessions.clear();
    }

    void Db::executeSql(const std::string& sql)
    {
        ScopedConnection connection{ *_connectionPool };
        connection->executeSql(sql);
    }

    Session& Db::getTLSSession()
    {
        // keyed on a uid rather than on the address, a destroyed Db may be reallocated at the same place
        struct TLSSession
        {
            std::uint64_t dbUid{};
            Session* session{};
        };
        static thread_local TLSSession tlsSession;

        if (tlsSession.dbUid != _uid)
        {
            auto newSession{ std::make_unique<Session>(*this) };
            tlsSession = TLSSession{ _uid, newSession.get() };

            std::scoped_lock lock{ _tlsSessionsMutex };
            _tlsSessions.push_back(std::move(newSession));
        }

        assert(&tlsSession.session->getDb() == this);
        return *tlsSession.session;
    }

    void Db::performQuickCheck()
    {
        ScopedConnection connection{ *_connectionPool };

        REEL_LOG(DB, INFO, "Performing quick database check...");
        if (quickCheck(*connection))
            REEL_LOG(DB, INFO, "Quick database check passed");
        else
            REEL_LOG(DB, ERROR, "Quick database check done with errors!");
    }

    Db::ScopedConnection::ScopedConnection(Wt::Dbo::SqlConnectionPool& pool)
        : _connectionPool{ pool }
        , _connection{ _connectionPool.getConnection() }
    {
    }

    Db::ScopedConnection::~ScopedConnection()
    {
        _connectionPool.returnConnection(std::move(_connection));
    }
} // namespace reel::db
