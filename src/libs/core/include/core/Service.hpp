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

#include <cassert>
#include <memory>

namespace reel::core
{
    // Process-wide registry slot for one implementation of Interface
    // The registered instance lives as long as the Service object that holds it
    template<typename Interface>
    class Service
    {
    public:
        Service() = default;
        Service(std::unique_ptr<Interface> instance)
            : _owner{ true }
        {
            assign(std::move(instance));
        }

        ~Service()
        {
            if (_owner)
                _instance.reset();
        }

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        Interface* operator->() const { return get(); }
        Interface& operator*() const { return *get(); }

        static Interface* get() { return _instance.get(); }
        static bool exists() { return static_cast<bool>(_instance); }

        template<typename Impl>
        static Interface& assign(std::unique_ptr<Impl> instance)
        {
            assert(!_instance);
            _instance = std::move(instance);
            return *_instance;
        }

    private:
        const bool _owner{};
        static inline std::unique_ptr<Interface> _instance;
    };
} // namespace reel::core
