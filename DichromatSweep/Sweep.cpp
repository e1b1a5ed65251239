//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Sweep.h"

#include <Dichromat/ColorConversion.h>
#include <Dichromat/Pipeline.h>
#include <Dichromat/Utils.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace dm
{

    namespace
    {
        bool writeOutput (const SweepConfig& config, const std::string& fileName, const ImageSRGB& image)
        {
            const fs::path path = fs::path(config.outputDir) / fileName;
            if (!writeJpgImage (path.string(), image, config.jpegQuality))
            {
                dm_error ("could not write %s", path.string().c_str());
                return false;
            }
            dm_log ("Saved: %s", fileName.c_str());
            return true;
        }

        void copyPanel (const ImageSRGB& panel, int colOffset, int rowOffset, ImageSRGB& grid)
        {
            for (int r = 0; r < panel.height(); ++r)
            {
                const PixelSRGB* inRow = panel.atRowPtr(r);
                std::copy (inRow, inRow + panel.width(), grid.atRowPtr(r + rowOffset) + colOffset);
            }
        }
    }

    const std::vector<MaskedCorrectionPreset>& maskedCorrectionPresets ()
    {
        static const std::vector<MaskedCorrectionPreset> presets = {
            { 0.5f, 0.0f, 0.0f, "weak_red_shift" },
            { 0.8f, 0.0f, 0.0f, "medium_red_shift" },
            { 1.0f, 0.0f, 0.0f, "strong_red_shift" },
            { 1.2f, 0.0f, 0.0f, "very_strong_red_shift" },
            { 1.5f, 0.0f, 0.0f, "extreme_red_shift" },

            { 0.8f, 0.0f, 0.3f, "red_shift_with_green_cyan" },
            { 1.0f, 0.0f, 0.5f, "strong_red_green_cyan" },
            { 1.2f, 0.0f, 0.5f, "very_strong_both" },

            { 0.8f, 0.2f, 0.0f, "red_to_magenta" },
            { 1.0f, 0.3f, 0.0f, "strong_red_to_magenta" },

            { 1.0f, 0.2f, 0.3f, "balanced_correction" },
            { 1.2f, 0.2f, 0.4f, "strong_balanced" },
            { 1.5f, 0.3f, 0.5f, "maximum_correction" },
        };
        return presets;
    }

    const std::vector<SimulationPreset>& simulationPresets ()
    {
        static const std::vector<SimulationPreset> presets = {
            { "min_L_M",   { SimulationKind::Strict, 1.0f } },
            { "machado",   { SimulationKind::Machado, 1.0f } },
            { "blend_50",  { SimulationKind::Blend, 0.5f } },
            { "blend_70",  { SimulationKind::Blend, 0.7f } },
            { "blend_100", { SimulationKind::Blend, 1.0f } },
        };
        return presets;
    }

    std::string correctionGridFileName (int index, const MaskedCorrectionPreset& preset)
    {
        return formatted ("%02d_protanopia_%s_r2b%.1f_r2g%.1f_g2b%.1f.jpg",
                          index,
                          preset.name,
                          preset.redToBlue,
                          preset.redToGreen,
                          preset.greenToBlue);
    }

    ImageSRGB makeComparisonGrid (const ImageSRGB& original,
                                  const ImageSRGB& simulated,
                                  const ImageSRGB& corrected)
    {
        dm_assert (haveSameSize (original, simulated), "Simulated panel size mismatch");
        dm_assert (haveSameSize (original, corrected), "Corrected panel size mismatch");

        const int w = original.width();
        const int h = original.height();

        SimulationParams strict;
        strict.kind = SimulationKind::Strict;
        const ImageSRGB simulatedCorrected = simulateEncoded (corrected, strict);

        ImageSRGB grid (w*2, h*2);
        copyPanel (original, 0, 0, grid);
        copyPanel (corrected, w, 0, grid);
        copyPanel (simulated, 0, h, grid);
        copyPanel (simulatedCorrected, w, h, grid);
        return grid;
    }

    bool prepareOutputDirectory (const SweepConfig& config)
    {
        std::error_code err;
        fs::create_directories (config.outputDir, err);
        if (err)
        {
            dm_error ("could not create %s: %s", config.outputDir.c_str(), err.message().c_str());
            return false;
        }
        return true;
    }

    bool runCorrectionSweep (const SweepConfig& config, const ImageSRGB& original)
    {
        dm_log ("Testing protanopia correction parameters...");

        SimulationParams strict;
        strict.kind = SimulationKind::Strict;
        const ImageSRGB simulated = simulateEncoded (original, strict);

        if (!writeOutput (config, "00_simulation_protanopia.jpg", simulated))
            return false;

        const auto& presets = maskedCorrectionPresets();
        for (size_t i = 0; i < presets.size(); ++i)
        {
            const auto& preset = presets[i];

            CorrectionParams correction;
            correction.kind = CorrectionKind::Masked;
            correction.masked.redToBlue = preset.redToBlue;
            correction.masked.redToGreen = preset.redToGreen;
            correction.masked.greenToBlue = preset.greenToBlue;

            const PipelineResult result = runPipeline (original, nullptr, &correction);
            const ImageSRGB grid = makeComparisonGrid (original, simulated, result.corrected);

            if (!writeOutput (config, correctionGridFileName (int(i) + 1, preset), grid))
                return false;

            dm_log ("  red_to_blue=%.1f, red_to_green=%.1f, green_to_blue=%.1f",
                    preset.redToBlue, preset.redToGreen, preset.greenToBlue);
        }

        return true;
    }

    bool runSimulationSweep (const SweepConfig& config, const ImageSRGB& original)
    {
        dm_log ("Testing protanopia simulation parameters...");

        for (const auto& preset : simulationPresets())
        {
            const ImageSRGB simulated = simulateEncoded (original, preset.params);
            if (!writeOutput (config, formatted ("sim_protanopia_%s.jpg", preset.name), simulated))
                return false;
        }

        return true;
    }

    bool runSingleConfiguration (const SweepConfig& config,
                                 const ImageSRGB& original,
                                 const SimulationParams* simulation,
                                 const CorrectionParams* correction,
                                 const std::string& outputFileName)
    {
        const PipelineResult result = runPipeline (original, simulation, correction);
        return writeOutput (config, outputFileName, makeComparisonGrid (original, result.simulated, result.corrected));
    }

} // dm
