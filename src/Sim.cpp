#include "suf/Sim.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#if defined(SUF_HAS_OPENMP)
#include <omp.h>
#endif

namespace suf
{
    Sim::Sim(Config config, Landscape landscape, std::shared_ptr<const BrumationCalendar> calendar,
             const uint64_t seed): m_config(std::move(config)), m_landscape(std::move(landscape)),
                                   m_calendar(std::move(calendar)), m_rng(seed), m_seed(seed)
    {
    }

    Sim Sim::fromConfig(const Config &config, const uint64_t seed)
    {
        Landscape landscape = Landscape::fromCsv(config.landscape.thermalDatabase, config.landscape.openColumn,
                                                 config.landscape.burrowColumn);
        auto calendar = std::make_shared<const BrumationCalendar>(
            BrumationCalendar::fromFile(config.rattlesnake.brumation.filePath));

        spdlog::info("thermal profile: {} rows from {}", landscape.stepCount(),
                     config.landscape.thermalDatabase.string());
        spdlog::info("brumation calendar: {} days for site '{}'", calendar->size(), calendar->site());
        return {config, std::move(landscape), std::move(calendar), seed};
    }

    void Sim::seedInitial()
    {
        seedInitial(m_config.model.rattlesnakeCount);
    }

    void Sim::seedInitial(const int n)
    {
        m_orgs.clear();
        m_orgs.reserve(static_cast<size_t>(n));

        for (int i = 0; i < n; ++i)
            m_orgs.push_back(Organism::create(m_nextId++, m_config, m_calendar, m_rng));
    }

    void Sim::reset(const uint64_t seed)
    {
        m_rng.reseed(seed);
        m_seed = seed;
        m_orgs.clear();
        m_departed.clear();
        m_deaths.clear();
        m_lastContext.reset();
        m_nextId = 1;
        m_step   = 0;
    }

    void Sim::purgeDead()
    {
        for (auto &o : m_orgs)
        {
            if (!o.alive())
                m_departed.push_back(o);
        }
        std::erase_if(m_orgs, [](const Organism &o)
        {
            return !o.alive();
        });
    }

    bool Sim::step()
    {
        if (m_step >= m_landscape.stepCount())
            return false;

        purgeDead();
        if (m_orgs.empty())
            return false;

        const TickContext ctx = m_landscape.contextAt(m_step);
        m_lastContext         = ctx;

        m_order.resize(m_orgs.size());
        std::iota(m_order.begin(), m_order.end(), size_t{0});
        m_rng.shuffle(m_order.begin(), m_order.end());

        for (const size_t idx : m_order)
        {
            Organism &o = m_orgs[idx];
            o.step(ctx, m_rng);

            for (const auto &obs : m_observers)
                obs(ctx, o);

            if (!o.alive() && o.deathStep() == ctx.step)
            {
                const CauseOfDeath cause = *o.causeOfDeath();
                ++m_deaths[cause];
                spdlog::debug("organism {} died at step {} ({})", o.id(), ctx.step, toString(cause));
            }
        }

        ++m_step;
        return true;
    }

    int Sim::run(const int maxSteps)
    {
        int executed = 0;
        while (maxSteps == 0 || executed < maxSteps)
        {
            if (!step())
                break;
            ++executed;
        }
        return executed;
    }

    Sim::RuntimeStats Sim::computeStats() const
    {
        RuntimeStats s;

        int    alive   = 0;
        int    active  = 0;
        double tempSum = 0.0;
        double metaSum = 0.0;

#if defined(SUF_HAS_OPENMP)
#pragma omp parallel for reduction(+:alive,active,tempSum,metaSum) schedule(static)
#endif
        for (int i = 0; i < static_cast<int>(m_orgs.size()); ++i)
        {
            const auto &o = m_orgs[static_cast<size_t>(i)];
            if (!o.alive())
                continue;
            ++alive;
            if (o.active())
                ++active;
            tempSum += o.bodyTemperature();
            metaSum += o.metabolism().metabolicState();
        }

        for (const auto &o : m_orgs)
        {
            if (!o.alive())
                continue;
            s.behaviorCounts[static_cast<size_t>(o.behavior())]++;
            s.microhabitatCounts[static_cast<size_t>(o.microhabitat())]++;
        }

        s.organisms           = alive;
        s.active              = active;
        s.meanBodyTemperature = alive > 0 ? tempSum / alive : 0.0;
        s.meanMetabolicState  = alive > 0 ? metaSum / alive : 0.0;
        return s;
    }
} // namespace suf
