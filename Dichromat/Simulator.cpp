//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Simulator.h"

#include <Dichromat/Utils.h>

namespace dm
{

    const Matrix3f& machadoProtanopiaMatrix ()
    {
        // Machado, Oliveira & Fernandes 2009, severity 1.0.
        static const Matrix3f m ( 0.152286f, 1.052583f, -0.204868f,
                                  0.114503f, 0.786281f,  0.099216f,
                                 -0.003882f, -0.048116f, 1.051998f);
        return m;
    }

    PixelLMS applyProtanopiaBlend (const PixelLMS& lms, float strength)
    {
        // Only ever reduce L. Blending toward M would otherwise make
        // greens and blues look redder than they are.
        PixelLMS out = lms;
        const float blendedL = lms.l*(1.f - strength) + lms.m*strength;
        out.l = std::min (lms.l, blendedL);
        return out;
    }

    PixelLinearRGB simulateProtanopiaStrict (const PixelLinearRGB& rgb)
    {
        PixelLMS lms = convertToLMS (rgb);
        lms.l = std::min (lms.l, lms.m);
        return convertToLinearRGB (lms);
    }

    PixelLinearRGB simulateProtanopiaBlend (const PixelLinearRGB& rgb, float strength)
    {
        dm_assert (strength >= 0.f && strength <= 1.f, "Blend strength %f outside of [0,1]", strength);
        return convertToLinearRGB (applyProtanopiaBlend (convertToLMS (rgb), strength));
    }

    PixelLinearRGB simulateProtanopiaMachado (const PixelLinearRGB& rgb)
    {
        PixelLinearRGB out;
        multiply (machadoProtanopiaMatrix(), rgb, out);
        return out;
    }

    PixelLinearRGB simulate (const PixelLinearRGB& rgb, const SimulationParams& params)
    {
        switch (params.kind)
        {
            case SimulationKind::Strict:
                return simulateProtanopiaStrict (rgb);

            case SimulationKind::Blend:
                return simulateProtanopiaBlend (rgb, params.strength);

            case SimulationKind::Machado:
                return simulateProtanopiaMachado (rgb);
        }

        dm_assert (false, "Invalid simulation kind %d", static_cast<int>(params.kind));
        return rgb;
    }

    ImageLinearRGB simulate (const ImageLinearRGB& rgbImage, const SimulationParams& params)
    {
        return mapPixels<PixelLinearRGB>(rgbImage, [&params](const PixelLinearRGB& p) {
            return simulate (p, params);
        });
    }

} // dm
