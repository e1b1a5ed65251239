//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include <Dichromat/Image.h>
#include <Dichromat/Utils.h>

#include <utest/utest.h>

#include <cmath>
#include <cstdlib>
#include <random>

namespace dm
{
namespace testing
{

    inline float maxChannelDifference (const PixelTriplet& p1, const PixelTriplet& p2)
    {
        float maxDiff = 0.f;
        for (int i = 0; i < 3; ++i)
            maxDiff = std::max (maxDiff, std::abs(p1.v[i] - p2.v[i]));
        return maxDiff;
    }

    inline bool pixelsAreSimilar (const PixelSRGB& p1, const PixelSRGB& p2, int maxDiff)
    {
        for (int i = 0; i < 3; ++i)
            if (std::abs(p1.v[i] - p2.v[i]) > maxDiff)
                return false;
        return true;
    }

    inline bool imagesAreSimilar (const ImageSRGB& im1, const ImageSRGB& im2, int maxDiff)
    {
        if (!haveSameSize (im1, im2))
        {
            dm_dbg ("Size mismatch");
            return false;
        }

        for (int r = 0; r < im1.height(); ++r)
        {
            const PixelSRGB* p1Row = im1.atRowPtr(r);
            const PixelSRGB* p2Row = im2.atRowPtr(r);
            for (int c = 0; c < im1.width(); ++c)
            {
                if (!pixelsAreSimilar(p1Row[c], p2Row[c], maxDiff))
                {
                    dm_dbg ("Images differ at row %d col %d (%d %d %d) vs (%d %d %d)",
                            r, c,
                            p1Row[c].r, p1Row[c].g, p1Row[c].b,
                            p2Row[c].r, p2Row[c].g, p2Row[c].b);
                    return false;
                }
            }
        }

        return true;
    }

    // Deterministic source of colors in [0,1]^3.
    class RandomColors
    {
    public:
        explicit RandomColors (unsigned seed = 42) : _rng (seed) {}

        PixelEncodedRGB nextEncoded () { return PixelEncodedRGB(next(), next(), next()); }
        PixelLinearRGB nextLinear () { return PixelLinearRGB(next(), next(), next()); }
        PixelSRGB nextSRGB () { return PixelSRGB(nextByte(), nextByte(), nextByte()); }

    private:
        float next () { return _unit (_rng); }
        uint8_t nextByte () { return uint8_t(_bytes (_rng)); }

    private:
        std::mt19937 _rng;
        std::uniform_real_distribution<float> _unit { 0.f, 1.f };
        std::uniform_int_distribution<int> _bytes { 0, 255 };
    };

    // Every 8-bit gray level on the first row, then random colors.
    inline ImageSRGB makeColorSpanImage (int width = 256, int height = 8)
    {
        ImageSRGB im (width, height);
        RandomColors colors (7);
        im.apply ([&](int c, int r, PixelSRGB& p) {
            if (r == 0)
            {
                const uint8_t v = uint8_t(c % 256);
                p = PixelSRGB(v, v, v);
            }
            else
            {
                p = colors.nextSRGB ();
            }
        });
        return im;
    }

} // testing
} // dm
