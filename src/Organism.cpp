#include "suf/Organism.hpp"
#include "suf/Random.hpp"
#include "suf/Thermal.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace suf
{
    OrganismTraits OrganismTraits::fromConfig(const RattlesnakeParameters &cfg)
    {
        OrganismTraits t;
        t.activeHours          = cfg.activeHours;
        t.thermal              = cfg.thermal;
        t.voluntaryCt          = cfg.voluntaryCt;
        t.strikePerformance    = cfg.strikePerformance;
        t.deltaT               = static_cast<double>(cfg.deltaT);
        t.brumationTemperature = cfg.brumation.temperature;
        return t;
    }

    Organism::Organism(const uint64_t id, const OrganismTraits &traits, const double mass,
                       const double initialBodyTemperature, const Metabolism &metabolism,
                       const EctothermBehavior &behavior, std::shared_ptr<const BrumationCalendar> calendar): m_id(id),
        m_traits(traits), m_mass(mass), m_bodyTemperature(initialBodyTemperature), m_metabolism(metabolism),
        m_behaviorModule(behavior), m_calendar(std::move(calendar))
    {
        m_thermalAccuracy = std::abs(m_traits.thermal.tOpt - m_bodyTemperature);
    }

    Organism Organism::create(const uint64_t id, const Config &cfg, std::shared_ptr<const BrumationCalendar> calendar,
                              const Rng &rng)
    {
        const auto  &r    = cfg.rattlesnake;
        const double mass = rng.truncatedNormal(r.bodySize.mean, r.bodySize.sd, r.bodySize.min, r.bodySize.max);
        const auto   fp   = ForagingParameters::sample(cfg.interaction, rng);

        return {id,
                OrganismTraits::fromConfig(r),
                mass,
                r.initialBodyTemperature,
                Metabolism(r.initialCalories, cfg.maxMetabolicState(), r.smr, r.activityCoefficients),
                EctothermBehavior(fp),
                std::move(calendar)};
    }

    bool Organism::active() const
    {
        if (!m_alive || m_bruminating || m_microhabitat != Microhabitat::Open)
            return false;
        return m_behavior == Behavior::Thermoregulate || m_behavior == Behavior::Forage ||
               m_behavior == Behavior::Search;
    }

    void Organism::setBodyTemperature(const double t)
    {
        m_bodyTemperature = m_bruminating ? m_traits.brumationTemperature : t;
    }

    void Organism::beginTick(const TickContext &ctx)
    {
        m_currentStep = ctx.step;
        m_bruminating = m_calendar && m_calendar->isBrumationDay(ctx.month, ctx.day);
        m_behaviorModule.resetPreyCounters();
    }

    void Organism::kill(const CauseOfDeath cause)
    {
        if (!m_alive)
            throw std::logic_error("organism " + std::to_string(m_id) + " is already dead (" +
                                   std::string(toString(*m_causeOfDeath)) + ")");
        m_alive        = false;
        m_causeOfDeath = cause;
        m_deathStep    = m_currentStep;
    }

    void Organism::checkCtOutOfBounds()
    {
        if (!m_alive)
            return;

        const auto &ct = m_traits.voluntaryCt;
        if (m_bodyTemperature < ct.minTemp || m_bodyTemperature > ct.maxTemp)
        {
            ++m_ctCounter;
            if (m_ctCounter >= ct.maxSteps)
                kill(m_bodyTemperature < ct.minTemp ? CauseOfDeath::Cold : CauseOfDeath::Heat);
        }
        else
        {
            m_ctCounter = 0;
        }
    }

    bool Organism::checkStarvation()
    {
        if (!m_alive)
            return false;
        if (m_metabolism.metabolicState() > 0.0)
            return false;

        m_metabolism.setMetabolicState(0.0);
        kill(CauseOfDeath::Starved);
        return true;
    }

    void Organism::checkMortality()
    {
        checkCtOutOfBounds();
        checkStarvation();
    }

    void Organism::step(const TickContext &ctx, const Rng &rng)
    {
        if (!m_alive)
            return;

        beginTick(ctx);
        m_behaviorModule.step(*this, ctx, rng);

        m_tEnv = ambientTemperature(m_microhabitat, ctx.burrowTemperature, ctx.openTemperature,
                                    m_traits.brumationTemperature);
        setBodyTemperature(coolingEqK(m_traits.thermal.k, m_bodyTemperature, m_tEnv, m_traits.deltaT));
        m_metabolism.burn(m_mass, m_bodyTemperature, m_behavior, m_traits.deltaT);

        checkMortality();

        m_thermalAccuracy = std::abs(m_traits.thermal.tOpt - m_bodyTemperature);
        m_thermalQuality  = std::abs(m_traits.thermal.tOpt - m_tEnv);
        ++m_age;
    }

    OrganismRecord Organism::snapshot() const
    {
        OrganismRecord r;
        r.id              = m_id;
        r.alive           = m_alive;
        r.active          = active();
        r.mass            = m_mass;
        r.behavior        = m_behavior;
        r.microhabitat    = m_microhabitat;
        r.bodyTemperature = m_bodyTemperature;
        r.tEnv            = m_tEnv;
        r.metabolicState  = m_metabolism.metabolicState();
        r.attackRate      = m_behaviorModule.attackRate();
        r.preyDensity     = m_behaviorModule.params().preyDensity;
        r.preyConsumed    = m_behaviorModule.preyConsumed();
        r.preyEncountered = m_behaviorModule.preyEncountered();
        r.thermalAccuracy = m_thermalAccuracy;
        r.thermalQuality  = m_thermalQuality;
        r.ctCounter       = m_ctCounter;
        r.causeOfDeath    = m_causeOfDeath;
        return r;
    }
} // namespace suf
