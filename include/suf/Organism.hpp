#pragma once
#include <cstdint>
#include <memory>
#include <optional>

#include "Behavior.hpp"
#include "Config.hpp"
#include "Landscape.hpp"
#include "Metabolism.hpp"
#include "Types.hpp"

namespace suf
{
    class Rng;

    // Immutable per-organism physiology, copied out of the rattlesnake configuration.
    struct OrganismTraits
    {
        HourSet           activeHours;
        ThermalPreference thermal;
        VoluntaryCt       voluntaryCt;
        double            strikePerformance    = 1.0;
        double            deltaT               = 60.0;
        double            brumationTemperature = 5.0;

        static OrganismTraits fromConfig(const RattlesnakeParameters &cfg);
    };

    // Flat per-tick state handed to observers.
    struct OrganismRecord
    {
        uint64_t                    id              = 0;
        bool                        alive           = true;
        bool                        active          = false;
        double                      mass            = 0.0;
        Behavior                    behavior        = Behavior::Rest;
        Microhabitat                microhabitat    = Microhabitat::Burrow;
        double                      bodyTemperature = 0.0;
        double                      tEnv            = 0.0;
        double                      metabolicState  = 0.0;
        double                      preyDensity     = 0.0;
        double                      attackRate      = 0.0;
        int                         preyConsumed    = 0;
        double                      preyEncountered = 0.0;
        double                      thermalAccuracy = 0.0;
        double                      thermalQuality  = 0.0;
        int                         ctCounter       = 0;
        std::optional<CauseOfDeath> causeOfDeath;
    };

    class Organism
    {
        public:
            Organism(uint64_t id, const OrganismTraits &traits, double mass, double initialBodyTemperature,
                     const Metabolism &metabolism, const EctothermBehavior &behavior,
                     std::shared_ptr<const BrumationCalendar> calendar = nullptr);

            // Samples body mass, attack rate and prey density from the configuration, in that order.
            static Organism create(uint64_t id, const Config &cfg, std::shared_ptr<const BrumationCalendar> calendar,
                                   const Rng &rng);

            /**
             * Advances one tick: behavior, ambient temperature, cooling, metabolic cost,
             * mortality checks, then the derived thermal metrics. No-op once dead.
             */
            void step(const TickContext &ctx, const Rng &rng);

            // Latches the brumation flag and clears per-tick prey counters.
            void beginTick(const TickContext &ctx);

            void checkMortality();
            void checkCtOutOfBounds();
            bool checkStarvation();

            // @throws std::logic_error when already dead
            void kill(CauseOfDeath cause);

            [[nodiscard]] OrganismRecord snapshot() const;

            [[nodiscard]] uint64_t id() const
            {
                return m_id;
            }

            [[nodiscard]] bool alive() const
            {
                return m_alive;
            }

            [[nodiscard]] bool active() const;

            [[nodiscard]] std::optional<CauseOfDeath> causeOfDeath() const
            {
                return m_causeOfDeath;
            }

            [[nodiscard]] Behavior behavior() const
            {
                return m_behavior;
            }

            void setBehavior(const Behavior b)
            {
                m_behavior = b;
            }

            [[nodiscard]] Microhabitat microhabitat() const
            {
                return m_microhabitat;
            }

            void setMicrohabitat(const Microhabitat m)
            {
                m_microhabitat = m;
            }

            [[nodiscard]] double bodyTemperature() const
            {
                return m_bodyTemperature;
            }

            // Pinned to the brumation temperature while bruminating.
            void setBodyTemperature(double t);

            [[nodiscard]] bool isBruminatingToday() const
            {
                return m_bruminating;
            }

            [[nodiscard]] double tEnv() const
            {
                return m_tEnv;
            }

            [[nodiscard]] double thermalAccuracy() const
            {
                return m_thermalAccuracy;
            }

            [[nodiscard]] double thermalQuality() const
            {
                return m_thermalQuality;
            }

            [[nodiscard]] double mass() const
            {
                return m_mass;
            }

            [[nodiscard]] int ctOutOfBoundsCounter() const
            {
                return m_ctCounter;
            }

            void setCtOutOfBoundsCounter(const int v)
            {
                m_ctCounter = v;
            }

            [[nodiscard]] int age() const
            {
                return m_age;
            }

            [[nodiscard]] std::optional<int> deathStep() const
            {
                return m_deathStep;
            }

            [[nodiscard]] int totalPreyConsumed() const
            {
                return m_totalPrey;
            }

            void recordMeal(const int prey)
            {
                m_totalPrey += prey;
            }

            [[nodiscard]] const OrganismTraits &traits() const
            {
                return m_traits;
            }

            [[nodiscard]] const Metabolism &metabolism() const
            {
                return m_metabolism;
            }

            Metabolism &metabolism()
            {
                return m_metabolism;
            }

            [[nodiscard]] const EctothermBehavior &behaviorModule() const
            {
                return m_behaviorModule;
            }

            EctothermBehavior &behaviorModule()
            {
                return m_behaviorModule;
            }

        private:
            uint64_t       m_id = 0;
            OrganismTraits m_traits;
            double         m_mass = 0.0;

            bool                        m_alive = true;
            std::optional<CauseOfDeath> m_causeOfDeath;
            std::optional<int>          m_deathStep;

            Behavior     m_behavior     = Behavior::Rest;
            Microhabitat m_microhabitat = Microhabitat::Burrow;

            double m_bodyTemperature = 25.0;
            double m_tEnv            = 0.0;
            double m_thermalAccuracy = 0.0;
            double m_thermalQuality  = 0.0;

            int  m_ctCounter   = 0;
            int  m_age         = 0;
            int  m_totalPrey   = 0;
            int  m_currentStep = 0;
            bool m_bruminating = false;

            Metabolism        m_metabolism;
            EctothermBehavior m_behaviorModule;

            std::shared_ptr<const BrumationCalendar> m_calendar;
    };
} // namespace suf
