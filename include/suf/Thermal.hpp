#pragma once
#include "Types.hpp"

namespace suf
{
    /**
     * Newtonian cooling of a body toward ambient temperature:
     * t_body' = t_env + (t_body - t_env) * exp(-k * dt).
     */
    [[nodiscard]] double coolingEqK(double k, double tBody, double tEnv, double deltaT);

    /**
     * Microhabitat a thermoregulating animal moves to: Burrow when the burrow lies on the
     * side of the body temperature facing t_opt, otherwise Open.
     */
    [[nodiscard]] Microhabitat selectThermoregulationMicrohabitat(double tBody, double tOpt, double burrowTemp,
                                                                  double openTemp);

    // Ambient temperature seen from a microhabitat.
    [[nodiscard]] double ambientTemperature(Microhabitat m, double burrowTemp, double openTemp,
                                            double brumationTemp);
} // namespace suf
