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

#include "QualityNegotiator.hpp"

#include "av/Exception.hpp"
#include "core/ILogger.hpp"

namespace reel::transcoding
{
    QualityNegotiator::QualityNegotiator(av::IMediaProber& prober)
        : _prober{ prober }
    {
    }

    Negotiation QualityNegotiator::negotiate(QualityTier requestedQuality, const std::filesystem::path& inputPath) const
    {
        Negotiation negotiation{ requestedQuality, std::nullopt };

        try
        {
            negotiation.sourceInfo = _prober.probe(inputPath);
        }
        catch (const av::Exception& e)
        {
            REEL_LOG(QUALITY, WARNING, "Cannot probe " << inputPath << ", keeping requested quality " << toString(requestedQuality) << ": " << e.what());
            return negotiation;
        }

        if (!negotiation.sourceInfo->video)
        {
            REEL_LOG(QUALITY, DEBUG, "No video stream in " << inputPath << ", keeping requested quality " << toString(requestedQuality));
            return negotiation;
        }

        negotiation.resolvedQuality = resolveQuality(requestedQuality, negotiation.sourceInfo->video->height);
        REEL_LOG(QUALITY, DEBUG, "Requested " << toString(requestedQuality) << ", source height " << negotiation.sourceInfo->video->height << " => resolved " << toString(negotiation.resolvedQuality));

        return negotiation;
    }

    bool QualityNegotiator::canStreamDirectly(const Negotiation& negotiation)
    {
        if (!negotiation.sourceInfo || !negotiation.sourceInfo->video)
            return false;

        return getCapabilityTier(negotiation.sourceInfo->video->height) == negotiation.resolvedQuality;
    }
} // namespace reel::transcoding
