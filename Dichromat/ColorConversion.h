//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include "Image.h"
#include "MathUtils.h"

namespace dm
{

    // Smith & Pokorny derived cone fundamentals for linear sRGB primaries.
    // The two matrices are numerical inverses of each other.
    struct LMSModel
    {
        static const Matrix3f& linearRgbToLms ();
        static const Matrix3f& lmsToLinearRgb ();
    };

    // sRGB transfer function on one channel. x must be in [0,1].
    double srgbToLinear (double x);

    // Inverse sRGB transfer function on one channel. The power branch clamps
    // its base to [0.0001,1]. The result is not clamped.
    // Negative inputs take the linear branch and pass through unclamped.
    double linearToSrgb (double x);

    // Storage. quantize clamps to [0,1], scales by 255 and truncates.
    PixelEncodedRGB normalize (const PixelSRGB& p);
    PixelSRGB quantize (const PixelEncodedRGB& p);

    // Encoded <-> LinearRGB
    PixelLinearRGB convertToLinearRGB (const PixelEncodedRGB& p);
    PixelEncodedRGB convertToEncodedRGB (const PixelLinearRGB& p);

    // LinearRGB <-> LMS
    PixelLMS convertToLMS (const PixelLinearRGB& p);
    PixelLinearRGB convertToLinearRGB (const PixelLMS& p);

    PixelLinearRGB clampToUnit (const PixelLinearRGB& p);
    PixelEncodedRGB clampToUnit (const PixelEncodedRGB& p);

    // 8-bit storage straight to linear, and back with clamping and truncation.
    // A storage round trip may lose one code value.
    PixelLinearRGB convertToLinearRGB (const PixelSRGB& p);
    PixelSRGB convertToSRGB (const PixelLinearRGB& p);

    // Whole-image versions. Each returns a new image of the same size.
    ImageEncodedRGB normalize (const ImageSRGB& im);
    ImageSRGB quantize (const ImageEncodedRGB& im);
    ImageLinearRGB convertToLinearRGB (const ImageEncodedRGB& im);
    ImageEncodedRGB convertToEncodedRGB (const ImageLinearRGB& im);
    ImageLMS convertToLMS (const ImageLinearRGB& im);
    ImageLinearRGB convertToLinearRGB (const ImageLMS& im);
    ImageLinearRGB clampToUnit (const ImageLinearRGB& im);
    ImageLinearRGB convertToLinearRGB (const ImageSRGB& im);
    ImageSRGB convertToSRGB (const ImageLinearRGB& im);

} // dm
