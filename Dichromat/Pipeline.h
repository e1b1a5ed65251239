//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include <Dichromat/Image.h>
#include <Dichromat/Simulator.h>
#include <Dichromat/Corrector.h>

namespace dm
{

    struct PipelineResult
    {
        ImageSRGB simulated;
        ImageSRGB corrected;
    };

    // Runs the simulation and the correction, both from the original linear
    // image, and encodes them back to 8-bit sRGB. A null params pointer skips
    // that stage and outputs the input. Both outputs have the input size.
    PipelineResult runPipeline (const ImageSRGB& input,
                                const SimulationParams* simulation,
                                const CorrectionParams* correction);

    // What a protan observer would see of an already encoded image.
    ImageSRGB simulateEncoded (const ImageSRGB& input, const SimulationParams& simulation);

} // dm
