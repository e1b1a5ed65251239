//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include "Image.h"

namespace dm
{

    // Additive protanopia corrections. Each one computes a delta from the
    // red/green content of a linear RGB pixel, adds it and clamps to [0,1],
    // so that the red/green information survives in the blue channel once
    // the deficiency is simulated again.
    enum class CorrectionKind
    {
        ThresholdRedness = 0, // "v1"
        DualDetection    = 1, // "v2"
        Masked           = 2, // "v3"
    };

    struct CorrectionParams
    {
        // Reds get blue added, turning them magenta.
        struct ThresholdRedness
        {
            float rednessThreshold = 0.f;
            float blueStrength = 0.8f;
        };

        // Reds toward magenta, greens toward cyan.
        struct DualDetection
        {
            float redBlueAdd = 0.8f;
            float greenBlueAdd = 0.3f;
            float greenRedSub = 0.2f;
        };

        // Hard red and green masks, no correction on borderline hues.
        struct Masked
        {
            float redToBlue = 1.0f;
            float redToGreen = 0.0f;
            float greenToBlue = 0.5f;

            // Accepted but currently has no effect on the output.
            float saturationBoost = 1.0f;
        };

        CorrectionKind kind = CorrectionKind::Masked;
        ThresholdRedness thresholdRedness;
        DualDetection dualDetection;
        Masked masked;
    };

    PixelLinearRGB correctThresholdRedness (const PixelLinearRGB& rgb, const CorrectionParams::ThresholdRedness& params);
    PixelLinearRGB correctDualDetection (const PixelLinearRGB& rgb, const CorrectionParams::DualDetection& params);
    PixelLinearRGB correctMasked (const PixelLinearRGB& rgb, const CorrectionParams::Masked& params);

    // Mask predicates used by correctMasked.
    bool isReddish (const PixelLinearRGB& rgb);
    bool isGreenish (const PixelLinearRGB& rgb);

    PixelLinearRGB correct (const PixelLinearRGB& rgb, const CorrectionParams& params);
    ImageLinearRGB correct (const ImageLinearRGB& rgbImage, const CorrectionParams& params);

} // dm
