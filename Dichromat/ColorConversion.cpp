//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "ColorConversion.h"

#include <Dichromat/Utils.h>

#include <cmath>

namespace dm
{

    const Matrix3f& LMSModel::linearRgbToLms ()
    {
        // Smith & Pokorny 1975 cone fundamentals, sRGB primaries.
        static const Matrix3f m (0.31399022f, 0.63951294f, 0.04649755f,
                                 0.15537241f, 0.75789446f, 0.08670142f,
                                 0.01775239f, 0.10944209f, 0.87256922f);
        return m;
    }

    const Matrix3f& LMSModel::lmsToLinearRgb ()
    {
        // Inverse of linearRgbToLms.
        static const Matrix3f m ( 5.47221206f, -4.64196010f,  0.16963708f,
                                 -1.12524190f,  2.29317094f, -0.16789520f,
                                  0.02980165f, -0.19318073f,  1.16364789f);
        return m;
    }

} // dm

namespace dm
{

    double srgbToLinear (double x)
    {
        dm_assert (x >= 0.0 && x <= 1.0, "Encoded value %f outside of [0,1]", x);

        if (x <= 0.04045)
            return x / 12.92;
        else
            return std::pow((x + 0.055) / 1.055, 2.4);
    }

    double linearToSrgb (double x)
    {
        if (x <= 0.0031308)
            return x * 12.92;
        else
            return 1.055 * std::pow(keepInRange(x, 0.0001, 1.0), 1.0 / 2.4) - 0.055;
    }

    PixelEncodedRGB normalize (const PixelSRGB& p)
    {
        return PixelEncodedRGB(p.r/255.f, p.g/255.f, p.b/255.f);
    }

    PixelSRGB quantize (const PixelEncodedRGB& p)
    {
        const PixelEncodedRGB clamped = clampToUnit (p);
        return PixelSRGB(saturateAndCastToUint8(clamped.r*255.f),
                         saturateAndCastToUint8(clamped.g*255.f),
                         saturateAndCastToUint8(clamped.b*255.f));
    }

    PixelLinearRGB convertToLinearRGB (const PixelEncodedRGB& p)
    {
        return PixelLinearRGB(srgbToLinear(p.r), srgbToLinear(p.g), srgbToLinear(p.b));
    }

    PixelEncodedRGB convertToEncodedRGB (const PixelLinearRGB& p)
    {
        return PixelEncodedRGB(linearToSrgb(p.r), linearToSrgb(p.g), linearToSrgb(p.b));
    }

    PixelLMS convertToLMS (const PixelLinearRGB& p)
    {
        PixelLMS lms;
        multiply (LMSModel::linearRgbToLms(), p, lms);
        return lms;
    }

    PixelLinearRGB convertToLinearRGB (const PixelLMS& p)
    {
        PixelLinearRGB rgb;
        multiply (LMSModel::lmsToLinearRgb(), p, rgb);
        return rgb;
    }

    PixelLinearRGB clampToUnit (const PixelLinearRGB& p)
    {
        return PixelLinearRGB(keepInRange(p.r, 0.f, 1.f),
                              keepInRange(p.g, 0.f, 1.f),
                              keepInRange(p.b, 0.f, 1.f));
    }

    PixelEncodedRGB clampToUnit (const PixelEncodedRGB& p)
    {
        return PixelEncodedRGB(keepInRange(p.r, 0.f, 1.f),
                               keepInRange(p.g, 0.f, 1.f),
                               keepInRange(p.b, 0.f, 1.f));
    }

    PixelLinearRGB convertToLinearRGB (const PixelSRGB& p)
    {
        return convertToLinearRGB (normalize (p));
    }

    PixelSRGB convertToSRGB (const PixelLinearRGB& p)
    {
        return quantize (convertToEncodedRGB (clampToUnit (p)));
    }

} // dm

namespace dm
{

    ImageEncodedRGB normalize (const ImageSRGB& im)
    {
        return mapPixels<PixelEncodedRGB>(im, [](const PixelSRGB& p) { return normalize(p); });
    }

    ImageSRGB quantize (const ImageEncodedRGB& im)
    {
        return mapPixels<PixelSRGB>(im, [](const PixelEncodedRGB& p) { return quantize(p); });
    }

    ImageLinearRGB convertToLinearRGB (const ImageEncodedRGB& im)
    {
        return mapPixels<PixelLinearRGB>(im, [](const PixelEncodedRGB& p) { return convertToLinearRGB(p); });
    }

    ImageEncodedRGB convertToEncodedRGB (const ImageLinearRGB& im)
    {
        return mapPixels<PixelEncodedRGB>(im, [](const PixelLinearRGB& p) { return convertToEncodedRGB(p); });
    }

    ImageLMS convertToLMS (const ImageLinearRGB& im)
    {
        return mapPixels<PixelLMS>(im, [](const PixelLinearRGB& p) { return convertToLMS(p); });
    }

    ImageLinearRGB convertToLinearRGB (const ImageLMS& im)
    {
        return mapPixels<PixelLinearRGB>(im, [](const PixelLMS& p) { return convertToLinearRGB(p); });
    }

    ImageLinearRGB clampToUnit (const ImageLinearRGB& im)
    {
        return mapPixels<PixelLinearRGB>(im, [](const PixelLinearRGB& p) { return clampToUnit(p); });
    }

    ImageLinearRGB convertToLinearRGB (const ImageSRGB& im)
    {
        return mapPixels<PixelLinearRGB>(im, [](const PixelSRGB& p) { return convertToLinearRGB(p); });
    }

    ImageSRGB convertToSRGB (const ImageLinearRGB& im)
    {
        return mapPixels<PixelSRGB>(im, [](const PixelLinearRGB& p) { return convertToSRGB(p); });
    }

} // dm
