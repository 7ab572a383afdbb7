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

#include "services/transcoding/QualityTier.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "core/String.hpp"
#include "services/transcoding/Exception.hpp"

namespace reel::transcoding
{
    namespace
    {
        struct TierDesc
        {
            QualityTier quality;
            std::string_view name;
            std::size_t maxSourceHeight;
            EncodeProfile profile;
        };

        constexpr std::array<TierDesc, 6> tierDescs{ {
            { QualityTier::Q240p, "240p", 240, { 500'000, 64'000, 426, 240, 28 } },
            { QualityTier::Q360p, "360p", 360, { 800'000, 96'000, 640, 360, 26 } },
            { QualityTier::Q480p, "480p", 480, { 1'200'000, 128'000, 854, 480, 24 } },
            { QualityTier::Q720p, "720p", 720, { 2'500'000, 192'000, 1280, 720, 22 } },
            { QualityTier::Q1080p, "1080p", 1080, { 5'000'000, 256'000, 1920, 1080, 20 } },
            { QualityTier::Q4k, "4k", std::numeric_limits<std::size_t>::max(), { 15'000'000, 320'000, 3840, 2160, 18 } },
        } };

        const TierDesc& getTierDesc(QualityTier quality)
        {
            const auto it{ std::find_if(std::cbegin(tierDescs), std::cend(tierDescs), [=](const TierDesc& desc) { return desc.quality == quality; }) };
            if (it == std::cend(tierDescs))
                throw Exception{ "Unhandled quality tier " + std::to_string(static_cast<int>(quality)) };

            return *it;
        }
    } // namespace

    QualityTier parseQualityTier(std::string_view quality)
    {
        const std::string_view trimmed{ core::stringUtils::stringTrim(quality) };
        for (const TierDesc& desc : tierDescs)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(trimmed, desc.name))
                return desc.quality;
        }

        throw InvalidQualityException{ quality };
    }

    std::string_view toString(QualityTier quality)
    {
        return getTierDesc(quality).name;
    }

    const EncodeProfile& getEncodeProfile(QualityTier quality)
    {
        return getTierDesc(quality).profile;
    }

    QualityTier getCapabilityTier(std::size_t sourceHeight)
    {
        for (const TierDesc& desc : tierDescs)
        {
            if (sourceHeight <= desc.maxSourceHeight)
                return desc.quality;
        }

        return QualityTier::Q4k;
    }

    QualityTier resolveQuality(QualityTier requested, std::optional<std::size_t> sourceHeight)
    {
        if (!sourceHeight)
            return requested;

        return std::min(requested, getCapabilityTier(*sourceHeight));
    }
} // namespace reel::transcoding
