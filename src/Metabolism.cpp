#include "suf/Metabolism.hpp"
#include <algorithm>
#include <cmath>

namespace suf
{
    double standardMetabolicRate(const double massGrams, const double bodyTemperature, const SmrCoefficients &c)
    {
        return std::pow(10.0, c.x1Mass * std::log10(massGrams) + c.x2Temp * bodyTemperature + c.x3Const);
    }

    double preyCalories(const double preyMass, const double caloriesPerGram, const double digestionEfficiency)
    {
        return preyMass * caloriesPerGram * digestionEfficiency;
    }

    double Metabolism::tickCost(const double massGrams, const double bodyTemperature, const Behavior behavior,
                                const double deltaTMinutes) const
    {
        const double smr   = standardMetabolicRate(massGrams, bodyTemperature, m_smr);
        const double hours = deltaTMinutes / 60.0;
        return smr * activityCoefficient(behavior) * hours * kJoulesPerMlO2 * kKcalPerJoule;
    }

    double Metabolism::burn(const double massGrams, const double bodyTemperature, const Behavior behavior,
                            const double deltaTMinutes)
    {
        const double cost = tickCost(massGrams, bodyTemperature, behavior, deltaTMinutes);
        m_state -= cost;
        return cost;
    }

    double Metabolism::calsGained(const double preyMass, const double caloriesPerGram,
                                  const double digestionEfficiency)
    {
        const double before = m_state;
        const double gain   = preyCalories(preyMass, caloriesPerGram, digestionEfficiency);
        m_state             = std::max(m_state, std::min(m_state + gain, m_maxState));
        return m_state - before;
    }
} // namespace suf
