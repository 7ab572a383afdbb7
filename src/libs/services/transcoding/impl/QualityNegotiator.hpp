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

#include <filesystem>
#include <optional>

#include "av/IMediaProber.hpp"
#include "services/transcoding/QualityTier.hpp"

namespace reel::transcoding
{
    struct Negotiation
    {
        QualityTier resolvedQuality;
        std::optional<av::MediaInfo> sourceInfo; // none if the source could not be probed
    };

    class QualityNegotiator
    {
    public:
        QualityNegotiator(av::IMediaProber& prober);
        ~QualityNegotiator() = default;
        QualityNegotiator(const QualityNegotiator&) = delete;
        QualityNegotiator& operator=(const QualityNegotiator&) = delete;

        // Probe failures are not errors: the requested quality is kept
        Negotiation negotiate(QualityTier requestedQuality, const std::filesystem::path& inputPath) const;

        // True if the source does not need to be downscaled to deliver this negotiation
        static bool canStreamDirectly(const Negotiation& negotiation);

    private:
        av::IMediaProber& _prober;
    };
} // namespace reel::transcoding
