#pragma once
#include <array>
#include <cstddef>
#include "Types.hpp"

namespace suf
{
    struct SmrCoefficients
    {
        double x1Mass  = 0.93;
        double x2Temp  = 0.044;
        double x3Const = -2.58;
    };

    inline constexpr double kJoulesPerMlO2 = 19.874;
    inline constexpr double kKcalPerJoule  = 2.39006e-4;

    /**
     * Standard metabolic rate in ml O2 / h:
     * 10^(x1 * log10(mass) + x2 * t_body + x3).
     */
    [[nodiscard]] double standardMetabolicRate(double massGrams, double bodyTemperature, const SmrCoefficients &c);

    // Calories gained from one prey item.
    [[nodiscard]] double preyCalories(double preyMass, double caloriesPerGram, double digestionEfficiency);

    /**
     * Energy reserve of one organism. Costs are subtracted without a floor; whoever
     * owns the reserve decides what a depleted reserve means.
     */
    class Metabolism
    {
        public:
            Metabolism() = default;

            Metabolism(const double initial, const double maxState, const SmrCoefficients &smr,
                       const std::array<double, kBehaviorCount> &activityCoefficients): m_state(initial),
                m_maxState(maxState), m_smr(smr), m_activity(activityCoefficients)
            {
            }

            [[nodiscard]] double metabolicState() const
            {
                return m_state;
            }

            [[nodiscard]] double maxMetabolicState() const
            {
                return m_maxState;
            }

            [[nodiscard]] double activityCoefficient(const Behavior b) const
            {
                return m_activity[static_cast<size_t>(b)];
            }

            void setMetabolicState(const double v)
            {
                m_state = v;
            }

            // Calories spent by an animal of the given mass and temperature over deltaTMinutes.
            [[nodiscard]] double tickCost(double massGrams, double bodyTemperature, Behavior behavior,
                                          double deltaTMinutes) const;

            // Subtracts the cost and returns it.
            double burn(double massGrams, double bodyTemperature, Behavior behavior, double deltaTMinutes);

            // Credits one prey item, saturating at the maximum reserve. Returns calories credited.
            double calsGained(double preyMass, double caloriesPerGram, double digestionEfficiency);

        private:
            double                             m_state    = 0.0;
            double                             m_maxState = 0.0;
            SmrCoefficients                    m_smr;
            std::array<double, kBehaviorCount> m_activity{1.0, 1.0, 1.0, 1.0, 1.0};
    };
} // namespace suf
