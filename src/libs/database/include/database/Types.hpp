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

#include "core/Exception.hpp"

namespace reel::db
{
    class Exception : public core::ReelException
    {
    public:
        using ReelException::ReelException;
    };

    // Caution: do not change enum values if they are set!

    // Totally ordered, from the lowest to the highest quality
    enum class QualityTier
    {
        Q240p = 0,
        Q360p = 1,
        Q480p = 2,
        Q720p = 3,
        Q1080p = 4,
        Q4k = 5,
    };

    enum class TranscodeJobState
    {
        Pending = 0,
        Processing = 1,
        Completed = 2,
        Failed = 3,
    };

    enum class TranscodeErrorKind
    {
        None = 0,
        EncodeProcessFailed = 1,
        EncodeTimeout = 2,
        CacheIoError = 3,
        Interrupted = 4, // process stopped while the job was in progress
    };

    constexpr bool isTerminal(TranscodeJobState state)
    {
        return state == TranscodeJobState::Completed || state == TranscodeJobState::Failed;
    }
} // namespace reel::db
