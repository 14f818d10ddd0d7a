#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "Types.hpp"

namespace suf
{
    class Sim;

    struct OrganismSummary
    {
        uint64_t                    id    = 0;
        double                      mass  = 0.0;
        bool                        alive = true;
        std::optional<CauseOfDeath> causeOfDeath;
        std::optional<int>          deathStep;
        int                         age                 = 0;
        int                         totalPreyConsumed   = 0;
        double                      finalMetabolicState = 0.0;
    };

    // One row per organism ever created, ordered by id.
    [[nodiscard]] std::vector<OrganismSummary> summarize(const Sim &sim);

    void writeSummaryCsv(const std::filesystem::path &path, const std::vector<OrganismSummary> &rows);

    // Logs survivors and deaths by cause at info level.
    void logSummary(const Sim &sim, const std::vector<OrganismSummary> &rows);
} // namespace suf
