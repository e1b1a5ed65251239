//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include "Image.h"

#include "ColorConversion.h"

#include "MathUtils.h"

namespace dm
{

    // Protan-type dichromacy models. All of them map linear RGB to linear RGB
    // and can leave [0,1], the caller clamps.
    enum class SimulationKind
    {
        // L' = min(L, M) in LMS space.
        Strict  = 0,

        // L' = min(L, lerp(L, M, strength)) in LMS space.
        Blend   = 1,

        // Machado 2009 protanopia matrix applied directly on linear RGB.
        Machado = 2,
    };

    struct SimulationParams
    {
        SimulationKind kind = SimulationKind::Strict;

        // Only used by Blend. In [0,1], 1 matches Strict.
        float strength = 1.f;
    };

    PixelLinearRGB simulateProtanopiaStrict (const PixelLinearRGB& rgb);
    PixelLinearRGB simulateProtanopiaBlend (const PixelLinearRGB& rgb, float strength);
    PixelLinearRGB simulateProtanopiaMachado (const PixelLinearRGB& rgb);

    // The LMS-space part of the Strict and Blend models.
    PixelLMS applyProtanopiaBlend (const PixelLMS& lms, float strength);

    const Matrix3f& machadoProtanopiaMatrix ();

    PixelLinearRGB simulate (const PixelLinearRGB& rgb, const SimulationParams& params);
    ImageLinearRGB simulate (const ImageLinearRGB& rgbImage, const SimulationParams& params);

} // dm
