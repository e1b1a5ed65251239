//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Parameters.h"

#include <Dichromat/Utils.h>

#include <cmath>
#include <cstdlib>
#include <initializer_list>

namespace dm
{

    namespace
    {
        struct ParameterSlot
        {
            const char* key;
            float* target;
        };

        // Copies the values of the map into the matching slots. Every key of
        // the map must match one slot.
        bool assignParameters (const char* variantName,
                               const ParameterMap& values,
                               std::initializer_list<ParameterSlot> slots)
        {
            for (const auto& it : values)
            {
                const ParameterSlot* matchingSlot = nullptr;
                for (const auto& slot : slots)
                {
                    if (it.first == slot.key)
                    {
                        matchingSlot = &slot;
                        break;
                    }
                }

                if (!matchingSlot)
                {
                    dm_error ("unsupported parameter '%s' for variant '%s'", it.first.c_str(), variantName);
                    return false;
                }

                if (!std::isfinite(it.second))
                {
                    dm_error ("parameter '%s' of variant '%s' is not a finite number", it.first.c_str(), variantName);
                    return false;
                }

                *matchingSlot->target = float(it.second);
            }
            return true;
        }
    }

    const char* simulationKindName (SimulationKind kind)
    {
        switch (kind)
        {
            case SimulationKind::Strict: return "strict";
            case SimulationKind::Blend: return "blend";
            case SimulationKind::Machado: return "machado";
        }
        return "invalid";
    }

    const char* correctionKindName (CorrectionKind kind)
    {
        switch (kind)
        {
            case CorrectionKind::ThresholdRedness: return "v1";
            case CorrectionKind::DualDetection: return "v2";
            case CorrectionKind::Masked: return "v3";
        }
        return "invalid";
    }

    bool parseSimulationKind (const std::string& name, SimulationKind& kind)
    {
        for (auto candidate : { SimulationKind::Strict, SimulationKind::Blend, SimulationKind::Machado })
        {
            if (name == simulationKindName(candidate))
            {
                kind = candidate;
                return true;
            }
        }

        dm_error ("unsupported simulation variant '%s' (expected strict, blend or machado)", name.c_str());
        return false;
    }

    bool parseCorrectionKind (const std::string& name, CorrectionKind& kind)
    {
        for (auto candidate : { CorrectionKind::ThresholdRedness, CorrectionKind::DualDetection, CorrectionKind::Masked })
        {
            if (name == correctionKindName(candidate))
            {
                kind = candidate;
                return true;
            }
        }

        dm_error ("unsupported correction variant '%s' (expected v1, v2 or v3)", name.c_str());
        return false;
    }

    bool makeSimulationParams (const std::string& name, const ParameterMap& values, SimulationParams& params)
    {
        SimulationParams resolved;
        if (!parseSimulationKind (name, resolved.kind))
            return false;

        bool ok = false;
        switch (resolved.kind)
        {
            case SimulationKind::Strict:
            case SimulationKind::Machado:
                ok = assignParameters (name.c_str(), values, {});
                break;

            case SimulationKind::Blend:
                ok = assignParameters (name.c_str(), values, {
                    { "strength", &resolved.strength },
                });
                break;
        }

        if (!ok)
            return false;

        if (resolved.strength < 0.f || resolved.strength > 1.f)
        {
            dm_error ("blend strength %f outside of [0,1]", resolved.strength);
            return false;
        }

        params = resolved;
        return true;
    }

    bool makeCorrectionParams (const std::string& name, const ParameterMap& values, CorrectionParams& params)
    {
        CorrectionParams resolved;
        if (!parseCorrectionKind (name, resolved.kind))
            return false;

        bool ok = false;
        switch (resolved.kind)
        {
            case CorrectionKind::ThresholdRedness:
            {
                auto& p = resolved.thresholdRedness;
                ok = assignParameters (name.c_str(), values, {
                    { "redness_threshold", &p.rednessThreshold },
                    { "blue_strength", &p.blueStrength },
                });
                break;
            }

            case CorrectionKind::DualDetection:
            {
                auto& p = resolved.dualDetection;
                ok = assignParameters (name.c_str(), values, {
                    { "red_blue_add", &p.redBlueAdd },
                    { "green_blue_add", &p.greenBlueAdd },
                    { "green_red_sub", &p.greenRedSub },
                });
                break;
            }

            case CorrectionKind::Masked:
            {
                auto& p = resolved.masked;
                ok = assignParameters (name.c_str(), values, {
                    { "red_to_blue", &p.redToBlue },
                    { "red_to_green", &p.redToGreen },
                    { "green_to_blue", &p.greenToBlue },
                    { "saturation_boost", &p.saturationBoost },
                });
                break;
            }
        }

        if (!ok)
            return false;

        params = resolved;
        return true;
    }

    bool parseParameterAssignment (const std::string& assignment, std::string& key, double& value)
    {
        const size_t equalPos = assignment.find ('=');
        if (equalPos == std::string::npos || equalPos == 0 || equalPos + 1 == assignment.size())
        {
            dm_error ("invalid parameter '%s', expected key=value", assignment.c_str());
            return false;
        }

        const std::string valueString = assignment.substr (equalPos + 1);
        char* endPtr = nullptr;
        const double parsedValue = std::strtod (valueString.c_str(), &endPtr);
        if (endPtr == valueString.c_str() || *endPtr != '\0' || !std::isfinite(parsedValue))
        {
            dm_error ("invalid value '%s' for parameter '%s'", valueString.c_str(), assignment.substr(0, equalPos).c_str());
            return false;
        }

        key = assignment.substr (0, equalPos);
        value = parsedValue;
        return true;
    }

} // dm
