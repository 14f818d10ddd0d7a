#include "suf/Thermal.hpp"
#include <cmath>
#include <stdexcept>

namespace suf
{
    double coolingEqK(const double k, const double tBody, const double tEnv, const double deltaT)
    {
        const double expDecay = std::exp(-k * deltaT);
        return tEnv + (tBody - tEnv) * expDecay;
    }

    Microhabitat selectThermoregulationMicrohabitat(const double tBody, const double tOpt,
                                                    const double burrowTemp, const double openTemp)
    {
        if (tBody > tOpt && burrowTemp < openTemp)
            return Microhabitat::Burrow;
        if (tBody < tOpt && burrowTemp > openTemp)
            return Microhabitat::Burrow;
        return Microhabitat::Open;
    }

    double ambientTemperature(const Microhabitat m, const double burrowTemp, const double openTemp,
                              const double brumationTemp)
    {
        switch (m)
        {
            case Microhabitat::Burrow:
                return burrowTemp;
            case Microhabitat::Open:
                return openTemp;
            case Microhabitat::WinterBurrow:
                return brumationTemp;
        }
        throw std::logic_error("microhabitat has no ambient temperature");
    }
} // namespace suf
