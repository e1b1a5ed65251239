//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include <Dichromat/Parameters.h>

#include <DichromatTests/Common.h>

#include <cstring>

using namespace dm;

UTEST(Parameters, VariantNames)
{
    for (auto kind : { SimulationKind::Strict, SimulationKind::Blend, SimulationKind::Machado })
    {
        SimulationKind parsed = SimulationKind::Strict;
        ASSERT_TRUE(parseSimulationKind (simulationKindName (kind), parsed));
        ASSERT_TRUE(parsed == kind);
    }

    for (auto kind : { CorrectionKind::ThresholdRedness, CorrectionKind::DualDetection, CorrectionKind::Masked })
    {
        CorrectionKind parsed = CorrectionKind::Masked;
        ASSERT_TRUE(parseCorrectionKind (correctionKindName (kind), parsed));
        ASSERT_TRUE(parsed == kind);
    }

    ASSERT_STREQ(simulationKindName (SimulationKind::Machado), "machado");
    ASSERT_STREQ(correctionKindName (CorrectionKind::DualDetection), "v2");
}

UTEST(Parameters, UnsupportedVariantsAreRejected)
{
    SimulationKind simulationKind = SimulationKind::Blend;
    ASSERT_FALSE(parseSimulationKind ("deuteranopia", simulationKind));
    ASSERT_FALSE(parseSimulationKind ("", simulationKind));
    ASSERT_FALSE(parseSimulationKind ("Strict", simulationKind));
    // Untouched on failure.
    ASSERT_TRUE(simulationKind == SimulationKind::Blend);

    CorrectionKind correctionKind = CorrectionKind::DualDetection;
    ASSERT_FALSE(parseCorrectionKind ("v4", correctionKind));
    ASSERT_TRUE(correctionKind == CorrectionKind::DualDetection);

    SimulationParams simulation;
    ASSERT_FALSE(makeSimulationParams ("brettel", {}, simulation));

    CorrectionParams correction;
    ASSERT_FALSE(makeCorrectionParams ("daltonize", {}, correction));
}

UTEST(Parameters, DefaultsWhenKeysAreMissing)
{
    CorrectionParams params;
    ASSERT_TRUE(makeCorrectionParams ("v1", {}, params));
    ASSERT_TRUE(params.kind == CorrectionKind::ThresholdRedness);
    ASSERT_NEAR(params.thresholdRedness.rednessThreshold, 0.0, 1e-9);
    ASSERT_NEAR(params.thresholdRedness.blueStrength, 0.8, 1e-6);

    ASSERT_TRUE(makeCorrectionParams ("v2", {}, params));
    ASSERT_TRUE(params.kind == CorrectionKind::DualDetection);
    ASSERT_NEAR(params.dualDetection.redBlueAdd, 0.8, 1e-6);
    ASSERT_NEAR(params.dualDetection.greenBlueAdd, 0.3, 1e-6);
    ASSERT_NEAR(params.dualDetection.greenRedSub, 0.2, 1e-6);

    ASSERT_TRUE(makeCorrectionParams ("v3", {}, params));
    ASSERT_TRUE(params.kind == CorrectionKind::Masked);
    ASSERT_NEAR(params.masked.redToBlue, 1.0, 1e-6);
    ASSERT_NEAR(params.masked.redToGreen, 0.0, 1e-6);
    ASSERT_NEAR(params.masked.greenToBlue, 0.5, 1e-6);
    ASSERT_NEAR(params.masked.saturationBoost, 1.0, 1e-6);

    SimulationParams simulation;
    ASSERT_TRUE(makeSimulationParams ("blend", {}, simulation));
    ASSERT_TRUE(simulation.kind == SimulationKind::Blend);
    ASSERT_NEAR(simulation.strength, 1.0, 1e-6);
}

UTEST(Parameters, ValuesOverrideDefaults)
{
    CorrectionParams params;
    ASSERT_TRUE(makeCorrectionParams ("v3", { {"red_to_blue", 1.2}, {"green_to_blue", 0.4} }, params));
    ASSERT_NEAR(params.masked.redToBlue, 1.2, 1e-6);
    ASSERT_NEAR(params.masked.redToGreen, 0.0, 1e-6);
    ASSERT_NEAR(params.masked.greenToBlue, 0.4, 1e-6);

    ASSERT_TRUE(makeCorrectionParams ("v1", { {"redness_threshold", 0.1}, {"blue_strength", 0.5} }, params));
    ASSERT_NEAR(params.thresholdRedness.rednessThreshold, 0.1, 1e-6);
    ASSERT_NEAR(params.thresholdRedness.blueStrength, 0.5, 1e-6);

    SimulationParams simulation;
    ASSERT_TRUE(makeSimulationParams ("blend", { {"strength", 0.7} }, simulation));
    ASSERT_NEAR(simulation.strength, 0.7, 1e-6);
}

UTEST(Parameters, UnknownKeysAreRejected)
{
    CorrectionParams params;
    params.masked.redToBlue = 0.25f;

    // v1 key given to v3.
    ASSERT_FALSE(makeCorrectionParams ("v3", { {"blue_strength", 0.5} }, params));
    // Output untouched on failure.
    ASSERT_NEAR(params.masked.redToBlue, 0.25, 1e-6);

    ASSERT_FALSE(makeCorrectionParams ("v2", { {"red_blue_ad", 0.5} }, params));

    SimulationParams simulation;
    ASSERT_FALSE(makeSimulationParams ("strict", { {"strength", 0.5} }, simulation));
    ASSERT_FALSE(makeSimulationParams ("machado", { {"severity", 1.0} }, simulation));
}

UTEST(Parameters, BlendStrengthRange)
{
    SimulationParams simulation;
    ASSERT_TRUE(makeSimulationParams ("blend", { {"strength", 0.0} }, simulation));
    ASSERT_TRUE(makeSimulationParams ("blend", { {"strength", 1.0} }, simulation));
    ASSERT_FALSE(makeSimulationParams ("blend", { {"strength", -0.1} }, simulation));
    ASSERT_FALSE(makeSimulationParams ("blend", { {"strength", 1.5} }, simulation));
}

UTEST(Parameters, NonFiniteValuesAreRejected)
{
    CorrectionParams params;
    ASSERT_FALSE(makeCorrectionParams ("v3", { {"red_to_blue", NAN} }, params));
    ASSERT_FALSE(makeCorrectionParams ("v3", { {"red_to_blue", INFINITY} }, params));
}

UTEST(Parameters, ParameterAssignment)
{
    std::string key;
    double value = 0.;

    ASSERT_TRUE(parseParameterAssignment ("red_to_blue=1.2", key, value));
    ASSERT_STREQ(key.c_str(), "red_to_blue");
    ASSERT_NEAR(value, 1.2, 1e-12);

    ASSERT_TRUE(parseParameterAssignment ("redness_threshold=-0.05", key, value));
    ASSERT_STREQ(key.c_str(), "redness_threshold");
    ASSERT_NEAR(value, -0.05, 1e-12);

    ASSERT_FALSE(parseParameterAssignment ("red_to_blue", key, value));
    ASSERT_FALSE(parseParameterAssignment ("=1.0", key, value));
    ASSERT_FALSE(parseParameterAssignment ("red_to_blue=", key, value));
    ASSERT_FALSE(parseParameterAssignment ("red_to_blue=abc", key, value));
    ASSERT_FALSE(parseParameterAssignment ("red_to_blue=1.0x", key, value));
    ASSERT_FALSE(parseParameterAssignment ("red_to_blue=inf", key, value));

    // Last successful parse is kept.
    ASSERT_STREQ(key.c_str(), "redness_threshold");
}

UTEST_MAIN();
