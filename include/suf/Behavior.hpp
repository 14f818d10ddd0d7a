#pragma once
#include <vector>

#include "Config.hpp"
#include "Landscape.hpp"
#include "Types.hpp"

namespace suf
{
    class Organism;
    class Rng;

    // Foraging parameters fixed for the life of one organism.
    struct ForagingParameters
    {
        double  attackRate           = 0.0;
        double  preyDensity          = 0.0;
        double  handlingTime         = 0.0;
        double  caloriesPerGram      = 0.0;
        double  digestionEfficiency  = 0.0;
        double  expectedPreyBodySize = 0.0;
        bool    searchingBehavior    = false;
        HourSet preyActiveHours;

        // Samples range-valued attack rate (3 decimals) and prey density (whole prey).
        static ForagingParameters sample(const InteractionParameters &cfg, const Rng &rng);
    };

    struct Utilities
    {
        double rest           = 0.0;
        double thermoregulate = 0.0;
        double forage         = 0.0;

        // Order matches kEmergentBehaviors.
        [[nodiscard]] std::vector<double> asVector() const
        {
            return {rest, thermoregulate, forage};
        }
    };

    /**
     * Per-organism behavior state machine. Each tick, the first matching rule wins:
     * brumation date, inactive hour, thermal stress, pending search, then a
     * sparsemax-weighted draw among Rest / Thermoregulate / Forage.
     */
    class EctothermBehavior
    {
        public:
            EctothermBehavior() = default;

            explicit EctothermBehavior(const ForagingParameters &params): m_params(params)
            {
            }

            void step(Organism &snake, const TickContext &ctx, const Rng &rng);

            [[nodiscard]] Utilities           computeUtilities(const Organism &snake, const TickContext &ctx) const;
            [[nodiscard]] std::vector<double> behavioralWeights(const Organism &snake, const TickContext &ctx) const;
            [[nodiscard]] Behavior chooseBehavior(const Organism &snake, const TickContext &ctx, const Rng &rng) const;

            // Action handlers.
            void rest(Organism &snake) const;
            void thermoregulate(Organism &snake, const TickContext &ctx) const;
            void forage(Organism &snake, const TickContext &ctx, const Rng &rng);
            void search(Organism &snake);
            void bruminate(Organism &snake) const;

            [[nodiscard]] double thermalAccuracy(const Organism &snake) const;
            [[nodiscard]] double thermoregulationUtility(const Organism &snake) const;

            // Zero outside the prey's active hours.
            [[nodiscard]] double preyDensity(int hour) const;

            [[nodiscard]] const ForagingParameters &params() const
            {
                return m_params;
            }

            [[nodiscard]] double attackRate() const
            {
                return m_params.attackRate;
            }

            [[nodiscard]] int searchCounter() const
            {
                return m_searchCounter;
            }

            void setSearchCounter(const int v)
            {
                m_searchCounter = v;
            }

            [[nodiscard]] double preyEncountered() const
            {
                return m_preyEncountered;
            }

            [[nodiscard]] int preyConsumed() const
            {
                return m_preyConsumed;
            }

            void resetPreyCounters()
            {
                m_preyEncountered = 0.0;
                m_preyConsumed    = 0;
            }

        private:
            ForagingParameters m_params;

            int    m_searchCounter   = 0;
            double m_preyEncountered = 0.0;
            int    m_preyConsumed    = 0;

            void execute(Behavior b, Organism &snake, const TickContext &ctx, const Rng &rng);
    };
} // namespace suf
