#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

#include "Landscape.hpp"

namespace suf
{
    class Organism;

    inline constexpr const char *kDataLogHeader =
        "Step,Agent_ID,Experiment_Name,Study_site,Experiment,Hour,Day,Month,Season,Year,Alive,Active,Mass,"
        "Behavior,Microhabitat,Body_Temperature,T_env,Metabolic_state,Prey_Density,Attack_Rate,Prey_Consumed,"
        "Cause_of_Death";

    /**
     * Per-organism CSV trace, one row per tick at <output>/<id>_data_log.csv.
     * keepData = N logs every organism with (id - 1) % N == 0; 0 disables logging.
     */
    class DataLogger
    {
        public:
            DataLogger(std::filesystem::path outputDir, std::string site, std::string experiment, std::string simId,
                       int keepData);

            DataLogger(const DataLogger &)            = delete;
            DataLogger &operator=(const DataLogger &) = delete;

            [[nodiscard]] bool shouldLog(uint64_t id) const;

            [[nodiscard]] std::filesystem::path fileFor(uint64_t id) const;

            // Appends one row. The file is reopened per row so the open handle count stays flat with population size.
            void record(const TickContext &ctx, const Organism &o);

            [[nodiscard]] const std::string &experimentName() const
            {
                return m_experimentName;
            }

            // Organisms with a started log that have not yet written their death row.
            [[nodiscard]] size_t liveLogs() const
            {
                return m_started.size();
            }

        private:
            std::filesystem::path m_outputDir;
            std::string           m_site;
            std::string           m_experiment;
            std::string           m_experimentName;
            int                   m_keepData = 0;

            std::set<uint64_t> m_started;
    };
} // namespace suf
