#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>

#include <spdlog/spdlog.h>

#include "suf/CommandLineArgs.hpp"
#include "suf/Config.hpp"
#include "suf/DataLogger.hpp"
#include "suf/Log.hpp"
#include "suf/Sim.hpp"
#include "suf/Summary.hpp"

using namespace suf;

namespace
{
    bool hasYamlExtension(const std::filesystem::path &p)
    {
        const auto ext = p.extension().string();
        return ext == ".yaml" || ext == ".yml";
    }

    void runSimulation(const CommandLineArgs &args)
    {
        const Config config = loadConfig(*args.config);

        Sim sim = Sim::fromConfig(config, args.seed);
        sim.seedInitial();
        spdlog::info("population: {} rattlesnakes, site '{}', experiment '{}'", sim.organisms().size(),
                     config.model.site, config.model.experiment);

        std::optional<DataLogger> dataLogger;
        if (args.keepData > 0)
        {
            dataLogger.emplace(args.output, config.model.site, config.model.experiment, args.simId, args.keepData);
            sim.addObserver([&](const TickContext &ctx, const Organism &o)
            {
                dataLogger->record(ctx, o);
            });
            spdlog::info("per-organism logs: every {} organism(s) as {}", args.keepData,
                         dataLogger->experimentName());
        }

        const int steps = sim.run(args.maxSteps);
        spdlog::info("ran {} of {} steps", steps, sim.landscape().stepCount());

        const auto rows = summarize(sim);
        writeSummaryCsv(args.output / (args.simId + "_summary.csv"), rows);
        logSummary(sim, rows);
    }
} // namespace

int main(const int argc, char **argv)
{
    const CommandLineArgs args = parseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::fputs(buildCommandLineHelpText("suffugium").c_str(), stdout);
        return 0;
    }
    if (!args.ok())
    {
        for (const auto &e : args.errors)
            std::fprintf(stderr, "%s\n", e.c_str());
        std::fputs(buildCommandLineHelpText("suffugium").c_str(), stderr);
        return 2;
    }
    if (!hasYamlExtension(*args.config))
    {
        std::fprintf(stderr, "unsupported config file format '%s': use .yaml\n", args.config->string().c_str());
        return 2;
    }

    try
    {
        std::filesystem::create_directories(args.output);
        initLogging(args.output, args.verbose ? spdlog::level::debug : spdlog::level::info);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "cannot prepare output directory '%s': %s\n", args.output.string().c_str(), e.what());
        return 1;
    }

    spdlog::info("=== Starting simulation ===");
    spdlog::info("seed: {} | sim id: {} | output dir: {}", args.seed, args.simId, args.output.string());

    const auto start = std::chrono::steady_clock::now();
    try
    {
        runSimulation(args);
    }
    catch (const std::exception &e)
    {
        spdlog::critical("simulation failed: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    spdlog::info("simulation completed successfully in {:.2f} seconds", elapsed.count());
    spdlog::shutdown();
    return 0;
}
