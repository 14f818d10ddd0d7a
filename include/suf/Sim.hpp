#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "Config.hpp"
#include "Landscape.hpp"
#include "Organism.hpp"
#include "Random.hpp"
#include "Types.hpp"

namespace suf
{
    class Sim
    {
        public:
            struct RuntimeStats
            {
                int    organisms           = 0;
                int    active              = 0;
                double meanBodyTemperature = 0.0;
                double meanMetabolicState  = 0.0;

                std::array<int, kBehaviorCount>     behaviorCounts{};
                std::array<int, kMicrohabitatCount> microhabitatCounts{};
            };

            // Called once per organism per tick, after that organism has acted.
            using Observer = std::function<void(const TickContext &, const Organism &)>;

            Sim(Config config, Landscape landscape, std::shared_ptr<const BrumationCalendar> calendar,
                uint64_t seed = 42);

            // Loads the thermal profile and brumation calendar named by the configuration.
            static Sim fromConfig(const Config &config, uint64_t seed = 42);

            // Creates model.rattlesnakeCount organisms (or n), ids starting at 1.
            void seedInitial();
            void seedInitial(int n);

            // Discards the population and tick counter and reseeds the generator.
            void reset(uint64_t seed);

            /**
             * Advances one tick. Organisms that died on the previous tick are removed first.
             * @return false once the thermal profile is exhausted or nobody is left alive
             */
            bool step();

            // maxSteps == 0 runs the whole profile. Returns the number of ticks executed.
            int run(int maxSteps = 0);

            void addObserver(Observer obs)
            {
                m_observers.push_back(std::move(obs));
            }

            [[nodiscard]] RuntimeStats computeStats() const;

            [[nodiscard]] const std::vector<Organism> &organisms() const
            {
                return m_orgs;
            }

            // Organisms removed after dying, in removal order.
            [[nodiscard]] const std::vector<Organism> &departed() const
            {
                return m_departed;
            }

            [[nodiscard]] const Config &config() const
            {
                return m_config;
            }

            [[nodiscard]] const Landscape &landscape() const
            {
                return m_landscape;
            }

            [[nodiscard]] size_t currentStep() const
            {
                return m_step;
            }

            [[nodiscard]] const std::optional<TickContext> &lastContext() const
            {
                return m_lastContext;
            }

            [[nodiscard]] const std::map<CauseOfDeath, int> &deathsByCause() const
            {
                return m_deaths;
            }

            [[nodiscard]] uint64_t seed() const
            {
                return m_seed;
            }

        private:
            Config                                   m_config;
            Landscape                                m_landscape;
            std::shared_ptr<const BrumationCalendar> m_calendar;
            Rng                                      m_rng;
            uint64_t                                 m_seed;

            std::vector<Organism> m_orgs;
            std::vector<Organism> m_departed;
            std::vector<size_t>   m_order;
            std::vector<Observer> m_observers;

            std::map<CauseOfDeath, int> m_deaths;
            std::optional<TickContext>  m_lastContext;

            uint64_t m_nextId = 1;
            size_t   m_step   = 0;

            void purgeDead();
    };
} // namespace suf
