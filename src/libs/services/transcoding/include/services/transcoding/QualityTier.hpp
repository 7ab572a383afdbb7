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

#include <array>
#include <optional>
#include <string_view>

#include "database/Types.hpp"

namespace reel::transcoding
{
    using QualityTier = db::QualityTier;

    inline constexpr std::array<QualityTier, 6> allQualityTiers{
        QualityTier::Q240p,
        QualityTier::Q360p,
        QualityTier::Q480p,
        QualityTier::Q720p,
        QualityTier::Q1080p,
        QualityTier::Q4k,
    };

    // Static encode parameters bound to each tier
    struct EncodeProfile
    {
        std::size_t videoBitrate; // bits per second
        std::size_t audioBitrate; // bits per second
        std::size_t width;
        std::size_t height;
        unsigned qualityFactor; // x264 CRF
    };

    // Case insensitive: "720p", "720P", "4k" and "4K" are accepted
    // throws InvalidQualityException
    QualityTier parseQualityTier(std::string_view quality);
    std::string_view toString(QualityTier quality);

    const EncodeProfile& getEncodeProfile(QualityTier quality);

    // Highest tier a source of the given height can provide
    QualityTier getCapabilityTier(std::size_t sourceHeight);

    // Never upscales: min(requested, capability)
    // Without source information, the requested tier is kept
    QualityTier resolveQuality(QualityTier requested, std::optional<std::size_t> sourceHeight);
} // namespace reel::transcoding
