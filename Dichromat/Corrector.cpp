//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Corrector.h"

#include <Dichromat/ColorConversion.h>
#include <Dichromat/Utils.h>

#include <algorithm>

namespace dm
{

    namespace
    {
        PixelLinearRGB addAndClamp (const PixelLinearRGB& rgb, const PixelLinearRGB& delta)
        {
            return clampToUnit (PixelLinearRGB(rgb.r + delta.r,
                                               rgb.g + delta.g,
                                               rgb.b + delta.b));
        }
    }

    PixelLinearRGB correctThresholdRedness (const PixelLinearRGB& rgb, const CorrectionParams::ThresholdRedness& params)
    {
        PixelLinearRGB delta (0.f, 0.f, 0.f);

        const float redness = rgb.r - rgb.g;
        if (redness > params.rednessThreshold)
        {
            delta.b = params.blueStrength * redness;
        }

        return addAndClamp (rgb, delta);
    }

    PixelLinearRGB correctDualDetection (const PixelLinearRGB& rgb, const CorrectionParams::DualDetection& params)
    {
        PixelLinearRGB delta (0.f, 0.f, 0.f);

        const float redness = std::max (0.f, rgb.r - rgb.g);

        // A green that is also rather blue is left alone.
        const float greenness = std::max (0.f, rgb.g - std::max (rgb.r*0.8f, rgb.b));

        delta.b += params.redBlueAdd * redness;     // reds -> magenta
        delta.b += params.greenBlueAdd * greenness; // greens -> cyan
        delta.r -= params.greenRedSub * greenness;

        return addAndClamp (rgb, delta);
    }

    bool isReddish (const PixelLinearRGB& rgb)
    {
        return rgb.r > rgb.g && rgb.r > rgb.b*1.5f;
    }

    bool isGreenish (const PixelLinearRGB& rgb)
    {
        return rgb.g > rgb.r*0.8f && rgb.g > rgb.b;
    }

    PixelLinearRGB correctMasked (const PixelLinearRGB& rgb, const CorrectionParams::Masked& params)
    {
        PixelLinearRGB delta (0.f, 0.f, 0.f);

        const float redness = isReddish (rgb) ? rgb.r - rgb.g : 0.f;
        const float greenness = isGreenish (rgb) ? rgb.g - std::max (rgb.r, rgb.b) : 0.f;

        delta.b += params.redToBlue * redness;
        delta.g += params.redToGreen * redness;
        delta.b += params.greenToBlue * greenness;

        // TODO: decide whether saturationBoost should scale the delta before
        // it gets added. Kept as a no-op until then.

        return addAndClamp (rgb, delta);
    }

    PixelLinearRGB correct (const PixelLinearRGB& rgb, const CorrectionParams& params)
    {
        switch (params.kind)
        {
            case CorrectionKind::ThresholdRedness:
                return correctThresholdRedness (rgb, params.thresholdRedness);

            case CorrectionKind::DualDetection:
                return correctDualDetection (rgb, params.dualDetection);

            case CorrectionKind::Masked:
                return correctMasked (rgb, params.masked);
        }

        dm_assert (false, "Invalid correction kind %d", static_cast<int>(params.kind));
        return rgb;
    }

    ImageLinearRGB correct (const ImageLinearRGB& rgbImage, const CorrectionParams& params)
    {
        return mapPixels<PixelLinearRGB>(rgbImage, [&params](const PixelLinearRGB& p) {
            return correct (p, params);
        });
    }

} // dm
