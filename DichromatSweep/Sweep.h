//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include <Dichromat/Image.h>
#include <Dichromat/Simulator.h>
#include <Dichromat/Corrector.h>

#include <string>
#include <vector>

namespace dm
{

    struct SweepConfig
    {
        std::string inputImagePath;
        std::string outputDir = "Results/ParameterTests";
        int jpegQuality = 95;
        bool runCorrectionSweep = true;
        bool runSimulationSweep = true;
    };

    // One V3 correction configuration of the correction sweep.
    struct MaskedCorrectionPreset
    {
        float redToBlue;
        float redToGreen;
        float greenToBlue;
        const char* name;
    };

    struct SimulationPreset
    {
        const char* name;
        SimulationParams params;
    };

    const std::vector<MaskedCorrectionPreset>& maskedCorrectionPresets ();
    const std::vector<SimulationPreset>& simulationPresets ();

    // e.g. "03_protanopia_strong_red_shift_r2b1.0_r2g0.0_g2b0.0.jpg"
    std::string correctionGridFileName (int index, const MaskedCorrectionPreset& preset);

    // 2x2 grid:
    //   original  | corrected
    //   simulated | strict simulation of the corrected image
    // All the inputs must have the same size.
    ImageSRGB makeComparisonGrid (const ImageSRGB& original,
                                  const ImageSRGB& simulated,
                                  const ImageSRGB& corrected);

    // Creates config.outputDir and its parents when needed.
    bool prepareOutputDirectory (const SweepConfig& config);

    // Each returns false as soon as an output cannot be written.
    bool runCorrectionSweep (const SweepConfig& config, const ImageSRGB& original);
    bool runSimulationSweep (const SweepConfig& config, const ImageSRGB& original);

    // A single pipeline run with explicit variants, written as one grid.
    // A null pointer skips that stage.
    bool runSingleConfiguration (const SweepConfig& config,
                                 const ImageSRGB& original,
                                 const SimulationParams* simulation,
                                 const CorrectionParams* correction,
                                 const std::string& outputFileName);

} // dm
