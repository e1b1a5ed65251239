//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Pipeline.h"

#include <Dichromat/ColorConversion.h>
#include <Dichromat/Utils.h>

namespace dm
{

    namespace
    {
        ImageSRGB encodeForStorage (const ImageLinearRGB& linearImage)
        {
            ImageLinearRGB clamped = clampToUnit (linearImage);
            ImageEncodedRGB encoded = convertToEncodedRGB (clamped);
            // quantize clamps the encoded values to [0,1] again before rounding.
            return quantize (encoded);
        }
    }

    PipelineResult runPipeline (const ImageSRGB& input,
                                const SimulationParams* simulation,
                                const CorrectionParams* correction)
    {
        ScopeTimer timer ("runPipeline");

        const ImageLinearRGB linear = convertToLinearRGB (normalize (input));

        PipelineResult result;

        if (simulation)
        {
            result.simulated = encodeForStorage (simulate (linear, *simulation));
        }
        else
        {
            result.simulated = encodeForStorage (linear);
        }

        // Always from the original linear image, never from the simulated one.
        if (correction)
        {
            result.corrected = encodeForStorage (correct (linear, *correction));
        }
        else
        {
            result.corrected = encodeForStorage (linear);
        }

        dm_assert (haveSameSize (result.simulated, input), "Simulated image size mismatch");
        dm_assert (haveSameSize (result.corrected, input), "Corrected image size mismatch");
        return result;
    }

    ImageSRGB simulateEncoded (const ImageSRGB& input, const SimulationParams& simulation)
    {
        return encodeForStorage (simulate (convertToLinearRGB (normalize (input)), simulation));
    }

} // dm
