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

#include <functional>
#include <string>

namespace reel::db
{
    class IdType
    {
    public:
        using ValueType = long long;

        IdType();
        IdType(ValueType id);

        bool isValid() const;
        std::string toString() const;

        ValueType getValue() const { return _id; }
        auto operator<=>(const IdType& other) const = default;

    private:
        ValueType _id;
    };
} // namespace reel::db

#define REEL_DECLARE_IDTYPE(name)                                             \
    namespace reel::db                                                        \
    {                                                                         \
        class name : public IdType                                            \
        {                                                                     \
        public:                                                               \
            using IdType::IdType;                                             \
            auto operator<=>(const name& other) const = default;              \
        };                                                                    \
    }                                                                         \
    namespace std                                                             \
    {                                                                         \
        template<>                                                            \
        class hash<reel::db::name>                                            \
        {                                                                     \
        public:                                                               \
            size_t operator()(reel::db::name id) const                        \
            {                                                                 \
                return std::hash<reel::db::name::ValueType>()(id.getValue()); \
            }                                                                 \
        };                                                                    \
    } // ns std
