#include "suf/Summary.hpp"
#include "suf/Sim.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace suf
{
    namespace
    {
        OrganismSummary summaryOf(const Organism &o)
        {
            OrganismSummary s;
            s.id                  = o.id();
            s.mass                = o.mass();
            s.alive               = o.alive();
            s.causeOfDeath        = o.causeOfDeath();
            s.deathStep           = o.deathStep();
            s.age                 = o.age();
            s.totalPreyConsumed   = o.totalPreyConsumed();
            s.finalMetabolicState = o.metabolism().metabolicState();
            return s;
        }
    } // namespace

    std::vector<OrganismSummary> summarize(const Sim &sim)
    {
        std::vector<OrganismSummary> rows;
        rows.reserve(sim.departed().size() + sim.organisms().size());
        for (const auto &o : sim.departed())
            rows.push_back(summaryOf(o));
        for (const auto &o : sim.organisms())
            rows.push_back(summaryOf(o));

        std::ranges::sort(rows, {}, &OrganismSummary::id);
        return rows;
    }

    void writeSummaryCsv(const std::filesystem::path &path, const std::vector<OrganismSummary> &rows)
    {
        std::ofstream f(path, std::ios::trunc);
        if (!f)
            throw std::runtime_error("cannot create summary: " + path.string());

        f << "Agent_ID,Mass,Alive,Cause_of_Death,Death_Step,Age,Prey_Consumed,Final_Metabolic_State\n";
        for (const auto &r : rows)
        {
            f << fmt::format("{},{},{},{},{},{},{},{}\n", r.id, r.mass, r.alive ? "True" : "False",
                             r.causeOfDeath ? toString(*r.causeOfDeath) : std::string_view{},
                             r.deathStep ? std::to_string(*r.deathStep) : std::string(), r.age, r.totalPreyConsumed,
                             r.finalMetabolicState);
        }
        spdlog::info("summary written: {} ({} organisms)", path.string(), rows.size());
    }

    void logSummary(const Sim &sim, const std::vector<OrganismSummary> &rows)
    {
        const auto survivors = std::ranges::count_if(rows, &OrganismSummary::alive);
        spdlog::info("steps executed: {}, survivors: {}/{}", sim.currentStep(), survivors, rows.size());
        for (const auto &[cause, n] : sim.deathsByCause())
            spdlog::info("  deaths ({}): {}", toString(cause), n);
    }
} // namespace suf
