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

#include "database/Transaction.hpp"

#include <exception>

#include "database/Session.hpp"

namespace reel::db
{
    WriteTransaction::WriteTransaction(std::recursive_mutex& mutex, Session& session)
        : _lock{ mutex }
        , _session{ session }
        , _transaction{ *session.getDboSession() }
        , _uncaughtExceptions{ std::uncaught_exceptions() }
    {
        _session.pushTransaction(Session::TransactionType::Write);
    }

    WriteTransaction::~WriteTransaction()
    {
        _session.popTransaction(Session::TransactionType::Write);

        // rolled back by Wt::Dbo when unwinding
        if (std::uncaught_exceptions() == _uncaughtExceptions)
            _transaction.commit();
    }

    ReadTransaction::ReadTransaction(Session& session)
        : _session{ session }
        , _transaction{ *session.getDboSession() }
    {
        _session.pushTransaction(Session::TransactionType::Read);
    }

    ReadTransaction::~ReadTransaction()
    {
        _session.popTransaction(Session::TransactionType::Read);
    }
} // namespace reel::db
