#include "suf/DataLogger.hpp"
#include "suf/Organism.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <utility>

namespace suf
{
    namespace
    {
        const char *boolText(const bool b)
        {
            return b ? "True" : "False";
        }
    } // namespace

    DataLogger::DataLogger(std::filesystem::path outputDir, std::string site, std::string experiment,
                           std::string simId, const int keepData): m_outputDir(std::move(outputDir)),
                                                                   m_site(std::move(site)),
                                                                   m_experiment(std::move(experiment)),
                                                                   m_keepData(keepData)
    {
        m_experimentName = m_site + "_" + m_experiment + "_" + simId;
    }

    bool DataLogger::shouldLog(const uint64_t id) const
    {
        if (m_keepData <= 0 || id == 0)
            return false;
        return (id - 1) % static_cast<uint64_t>(m_keepData) == 0;
    }

    std::filesystem::path DataLogger::fileFor(const uint64_t id) const
    {
        return m_outputDir / (std::to_string(id) + "_data_log.csv");
    }

    void DataLogger::record(const TickContext &ctx, const Organism &o)
    {
        if (!shouldLog(o.id()))
            return;

        const auto path    = fileFor(o.id());
        const bool started = m_started.contains(o.id());

        std::ofstream f(path, started ? std::ios::app : std::ios::trunc);
        if (!f)
            throw std::runtime_error("cannot open data log: " + path.string());
        if (!started)
        {
            f << kDataLogHeader << "\n";
            m_started.insert(o.id());
            spdlog::debug("data log started for organism {}: {}", o.id(), path.string());
        }

        const std::string cause = o.causeOfDeath() ? std::string(toString(*o.causeOfDeath())) : std::string();

        f << fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n", ctx.step, o.id(),
                         m_experimentName, m_site, m_experiment, ctx.hour, ctx.day, ctx.month,
                         toString(seasonOf(ctx.month)), ctx.year, boolText(o.alive()), boolText(o.active()), o.mass(),
                         toString(o.behavior()), toString(o.microhabitat()), o.bodyTemperature(), o.tEnv(),
                         o.metabolism().metabolicState(), o.behaviorModule().preyDensity(ctx.hour),
                         o.behaviorModule().attackRate(), o.behaviorModule().preyConsumed(), cause);
        if (!f)
            throw std::runtime_error("cannot write data log: " + path.string());

        if (!o.alive())
            m_started.erase(o.id());
    }
} // namespace suf
