#include "suf/Behavior.hpp"
#include "suf/Foraging.hpp"
#include "suf/Math.hpp"
#include "suf/Organism.hpp"
#include "suf/Random.hpp"
#include "suf/Sparsemax.hpp"
#include "suf/Thermal.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace suf
{
    ForagingParameters ForagingParameters::sample(const InteractionParameters &cfg, const Rng &rng)
    {
        ForagingParameters p;
        p.attackRate           = roundTo(cfg.attackRate.sample(rng), 3);
        p.preyDensity          = roundTo(cfg.preyDensity.sample(rng), 0);
        p.handlingTime         = cfg.handlingTime;
        p.caloriesPerGram      = cfg.caloriesPerGram;
        p.digestionEfficiency  = cfg.digestionEfficiency;
        p.expectedPreyBodySize = cfg.expectedPreyBodySize;
        p.searchingBehavior    = cfg.searchingBehavior;
        p.preyActiveHours      = cfg.preyActiveHours;
        return p;
    }

    double EctothermBehavior::preyDensity(const int hour) const
    {
        if (m_params.preyActiveHours.test(static_cast<size_t>(hour)))
            return m_params.preyDensity;
        return 0.0;
    }

    double EctothermBehavior::thermalAccuracy(const Organism &snake) const
    {
        return std::abs(snake.traits().thermal.tOpt - snake.bodyTemperature());
    }

    double EctothermBehavior::thermoregulationUtility(const Organism &snake) const
    {
        const auto  &t  = snake.traits().thermal;
        const double db = thermalAccuracy(snake);
        if (db == 0.0)
            return 0.0;

        const double margin = snake.bodyTemperature() < t.tOpt ? t.tOpt - t.tPrefMin : t.tPrefMax - t.tOpt;
        if (margin <= 0.0)
            return 1.0;
        return scaleValue(db, margin);
    }

    Utilities EctothermBehavior::computeUtilities(const Organism &snake, const TickContext &ctx) const
    {
        Utilities u;
        if (!snake.traits().activeHours.test(static_cast<size_t>(ctx.hour)))
        {
            u.rest = 1.0;
            return u;
        }

        const Metabolism &m = snake.metabolism();
        u.thermoregulate    = thermoregulationUtility(snake);
        u.rest              = m.maxMetabolicState() > 0.0 ? scaleValue(m.metabolicState(), m.maxMetabolicState()) : 1.0;
        u.forage            = 1.0 - u.rest;
        return u;
    }

    std::vector<double> EctothermBehavior::behavioralWeights(const Organism &snake, const TickContext &ctx) const
    {
        return behaviorWeights(computeUtilities(snake, ctx).asVector());
    }

    Behavior EctothermBehavior::chooseBehavior(const Organism &snake, const TickContext &ctx, const Rng &rng) const
    {
        const std::vector<double> p = behavioralWeights(snake, ctx);
        return kEmergentBehaviors[rng.categorical(p)];
    }

    void EctothermBehavior::rest(Organism &snake) const
    {
        snake.setMicrohabitat(Microhabitat::Burrow);
        snake.setBehavior(Behavior::Rest);
    }

    void EctothermBehavior::thermoregulate(Organism &snake, const TickContext &ctx) const
    {
        snake.setBehavior(Behavior::Thermoregulate);
        snake.setMicrohabitat(selectThermoregulationMicrohabitat(snake.bodyTemperature(), snake.traits().thermal.tOpt,
                                                                 ctx.burrowTemperature, ctx.openTemperature));
    }

    void EctothermBehavior::forage(Organism &snake, const TickContext &ctx, const Rng &rng)
    {
        snake.setMicrohabitat(Microhabitat::Open);
        snake.setBehavior(Behavior::Forage);

        const double expected = hollingType2(preyDensity(ctx.hour), m_params.attackRate, m_params.handlingTime,
                                             snake.traits().strikePerformance);
        m_preyEncountered += expected;
        m_preyConsumed = sampleCaptures(expected, rng);
        if (m_preyConsumed > 0)
        {
            snake.metabolism().calsGained(m_params.expectedPreyBodySize, m_params.caloriesPerGram,
                                          m_params.digestionEfficiency);
            snake.recordMeal(m_preyConsumed);
            if (m_params.searchingBehavior)
                m_searchCounter = static_cast<int>(std::ceil(std::max(0.0, m_params.handlingTime - 1.0)));
        }
    }

    void EctothermBehavior::search(Organism &snake)
    {
        snake.setMicrohabitat(Microhabitat::Open);
        snake.setBehavior(Behavior::Search);
        --m_searchCounter;
    }

    void EctothermBehavior::bruminate(Organism &snake) const
    {
        snake.setMicrohabitat(Microhabitat::WinterBurrow);
        snake.setBehavior(Behavior::Brumation);
        snake.setBodyTemperature(snake.traits().brumationTemperature);
    }

    void EctothermBehavior::execute(const Behavior b, Organism &snake, const TickContext &ctx, const Rng &rng)
    {
        switch (b)
        {
            case Behavior::Rest:
                rest(snake);
                return;
            case Behavior::Thermoregulate:
                thermoregulate(snake, ctx);
                return;
            case Behavior::Forage:
                forage(snake, ctx, rng);
                return;
            case Behavior::Search:
                search(snake);
                return;
            case Behavior::Brumation:
                bruminate(snake);
                return;
        }
        throw std::logic_error("unknown behavior");
    }

    void EctothermBehavior::step(Organism &snake, const TickContext &ctx, const Rng &rng)
    {
        if (snake.isBruminatingToday())
            bruminate(snake);
        else if (!snake.traits().activeHours.test(static_cast<size_t>(ctx.hour)))
            rest(snake);
        else if (snake.ctOutOfBoundsCounter() > 0)
            thermoregulate(snake, ctx);
        else if (m_searchCounter > 0)
            search(snake);
        else
            execute(chooseBehavior(snake, ctx, rng), snake, ctx, rng);
    }
} // namespace suf
