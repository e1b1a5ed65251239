//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Sweep.h"

#include <Dichromat/Parameters.h>
#include <Dichromat/Utils.h>

#include <argparse/argparse.hpp>

#include <iostream>
#include <optional>

using namespace dm;

namespace
{

bool collectParameters (const argparse::ArgumentParser& parser, ParameterMap& values)
{
    auto assignments = parser.present<std::vector<std::string>>("--param");
    if (!assignments)
        return true;

    for (const auto& assignment : *assignments)
    {
        std::string key;
        double value = 0.;
        if (!parseParameterAssignment (assignment, key, value))
            return false;
        values[key] = value;
    }
    return true;
}

} // anonymous

int main(int argc, char** argv)
{
    argparse::ArgumentParser parser("dichromat-sweep", "0.1");
    parser.add_argument("image")
          .help("Input image (PNG or JPEG)");

    parser.add_argument("--output-dir")
          .help("Directory receiving the generated images")
          .default_value(std::string("Results/ParameterTests"));

    parser.add_argument("--quality")
          .help("JPEG quality of the outputs, in [1,100]")
          .default_value(95)
          .scan<'i', int>();

    parser.add_argument("--skip-corrections")
          .help("Do not run the V3 correction sweep")
          .default_value(false)
          .implicit_value(true);

    parser.add_argument("--skip-simulations")
          .help("Do not run the simulation sweep")
          .default_value(false)
          .implicit_value(true);

    parser.add_argument("--simulate")
          .help("Single run: simulation variant (strict, blend, machado)");

    parser.add_argument("--correct")
          .help("Single run: correction variant (v1, v2, v3)");

    parser.add_argument("--param")
          .help("Single run: key=value parameter, can be repeated. Applies to the chosen variants.")
          .append();

    parser.add_argument("--output")
          .help("Single run: name of the comparison grid")
          .default_value(std::string("single_configuration.jpg"));

    try
    {
        parser.parse_args(argc, argv);
    }
    catch (const std::runtime_error &err)
    {
        std::cerr << "Wrong usage" << std::endl;
        std::cerr << err.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    SweepConfig config;
    config.inputImagePath = parser.get<std::string>("image");
    config.outputDir = parser.get<std::string>("--output-dir");
    config.jpegQuality = parser.get<int>("--quality");
    config.runCorrectionSweep = !parser.get<bool>("--skip-corrections");
    config.runSimulationSweep = !parser.get<bool>("--skip-simulations");

    if (config.jpegQuality < 1 || config.jpegQuality > 100)
    {
        dm_error ("--quality must be in [1,100], got %d", config.jpegQuality);
        return 1;
    }

    ParameterMap values;
    if (!collectParameters (parser, values))
        return 1;

    // Parameters are shared by the two stages of a single run, so each
    // variant only sees the keys it accepts.
    auto simulationName = parser.present<std::string>("--simulate");
    auto correctionName = parser.present<std::string>("--correct");

    std::optional<SimulationParams> simulation;
    std::optional<CorrectionParams> correction;
    if (simulationName || correctionName)
    {
        ParameterMap simulationValues;
        ParameterMap correctionValues;
        for (const auto& it : values)
        {
            if (it.first == "strength")
                simulationValues.insert (it);
            else
                correctionValues.insert (it);
        }

        if (!simulationName && !simulationValues.empty())
        {
            dm_error ("parameter 'strength' given without --simulate");
            return 1;
        }

        if (!correctionName && !correctionValues.empty())
        {
            dm_error ("parameter '%s' given without --correct", correctionValues.begin()->first.c_str());
            return 1;
        }

        if (simulationName)
        {
            simulation.emplace ();
            if (!makeSimulationParams (*simulationName, simulationValues, *simulation))
                return 1;
        }

        if (correctionName)
        {
            correction.emplace ();
            if (!makeCorrectionParams (*correctionName, correctionValues, *correction))
                return 1;
        }
    }
    else if (!values.empty())
    {
        dm_error ("--param requires --simulate or --correct");
        return 1;
    }

    ImageSRGB original;
    if (!readImage (config.inputImagePath, original))
    {
        dm_error ("%s could not be loaded", config.inputImagePath.c_str());
        return 1;
    }

    if (!prepareOutputDirectory (config))
        return 1;

    ScopeTimer timer ("dichromat-sweep");

    if (simulation || correction)
    {
        if (!runSingleConfiguration (config,
                                     original,
                                     simulation ? &*simulation : nullptr,
                                     correction ? &*correction : nullptr,
                                     parser.get<std::string>("--output")))
            return 1;
    }
    else
    {
        if (config.runCorrectionSweep && !runCorrectionSweep (config, original))
            return 1;

        if (config.runSimulationSweep && !runSimulationSweep (config, original))
            return 1;
    }

    dm_log ("Results saved to: %s/", config.outputDir.c_str());
    if (config.runCorrectionSweep || simulation || correction)
    {
        dm_log ("Grid layout:");
        dm_log ("  Top-Left: Original");
        dm_log ("  Top-Right: Corrected");
        dm_log ("  Bottom-Left: Simulated");
        dm_log ("  Bottom-Right: Simulated+Corrected");
    }
    return 0;
}
