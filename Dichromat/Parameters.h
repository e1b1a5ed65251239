//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include <Dichromat/Simulator.h>
#include <Dichromat/Corrector.h>

#include <map>
#include <string>

namespace dm
{

    // Named numeric knobs, e.g. {"red_to_blue", 1.2}. Missing keys keep
    // their default value.
    using ParameterMap = std::map<std::string, double>;

    // "strict", "blend", "machado"
    const char* simulationKindName (SimulationKind kind);

    // "v1", "v2", "v3"
    const char* correctionKindName (CorrectionKind kind);

    // These return false and log an error for unknown names. There is no
    // fallback to a default variant.
    bool parseSimulationKind (const std::string& name, SimulationKind& kind);
    bool parseCorrectionKind (const std::string& name, CorrectionKind& kind);

    // Resolve a variant name and its parameters. Keys not accepted by the
    // variant and out of range values are errors.
    bool makeSimulationParams (const std::string& name, const ParameterMap& values, SimulationParams& params);
    bool makeCorrectionParams (const std::string& name, const ParameterMap& values, CorrectionParams& params);

    // Parses "key=value".
    bool parseParameterAssignment (const std::string& assignment, std::string& key, double& value);

} // dm
