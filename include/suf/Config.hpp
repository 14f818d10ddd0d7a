#pragma once
#include <array>
#include <bitset>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>

#include "Metabolism.hpp"
#include "Types.hpp"

namespace suf
{
    class Rng;

    // Hours of day 0..23 (a configured 24 maps to 0).
    using HourSet = std::bitset<24>;

    struct Range
    {
        double min = 0.0;
        double max = 0.0;
    };

    // A parameter given either as a fixed value or as a [min, max] range sampled once per organism.
    struct RangeOrValue
    {
        double               value = 0.0;
        std::optional<Range> range;

        [[nodiscard]] bool isRange() const
        {
            return range.has_value();
        }

        [[nodiscard]] double sample(const Rng &rng) const;
    };

    struct ModelParameters
    {
        std::string site;
        std::string experiment;
        int         rattlesnakeCount = 0;
    };

    struct LandscapeParameters
    {
        std::filesystem::path thermalDatabase;
        std::string           openColumn;
        std::string           burrowColumn;
        std::optional<int>    width;
        std::optional<int>    height;
        bool                  spatiallyExplicit = false;
        bool                  torus             = false;
        bool                  moore             = false;
    };

    struct BodySizeConfig
    {
        std::string distribution = "normal";
        double      mean         = 0.0;
        double      sd           = 0.0;
        double      min          = 0.0;
        double      max          = 0.0;
    };

    struct ThermalPreference
    {
        double k        = 0.01;
        double tPrefMin = 0.0;
        double tPrefMax = 0.0;
        double tOpt     = 0.0;
    };

    struct VoluntaryCt
    {
        double minTemp  = 0.0;
        double maxTemp  = 0.0;
        int    maxSteps = 0;
    };

    struct BrumationConfig
    {
        std::filesystem::path filePath;
        std::string           scale       = "Day";
        double                temperature = 0.0;
    };

    struct RattlesnakeParameters
    {
        std::string       species                  = "Rattlesnake";
        std::string       thermoregulationStrategy = "Ectotherm";
        BodySizeConfig    bodySize;
        HourSet           activeHours;
        double            initialBodyTemperature = 25.0;
        double            initialCalories        = 100.0;
        int               maxMeals               = 0;
        double            maxThermalAccuracy     = 0.0;
        ThermalPreference thermal;
        VoluntaryCt       voluntaryCt;
        double            strikePerformance = 0.0;
        int               deltaT            = 60;
        SmrCoefficients   smr;
        BrumationConfig   brumation;

        std::array<double, kBehaviorCount> activityCoefficients{1.0, 1.0, 1.0, 1.0, 1.0};
    };

    struct InteractionParameters
    {
        double       caloriesPerGram      = 0.0;
        double       digestionEfficiency  = 0.0;
        double       expectedPreyBodySize = 0.0;
        double       handlingTime         = 0.0;
        RangeOrValue attackRate;
        RangeOrValue preyDensity;
        bool         searchingBehavior = false;
        HourSet      preyActiveHours;
    };

    struct Config
    {
        ModelParameters       model;
        LandscapeParameters   landscape;
        RattlesnakeParameters rattlesnake;
        InteractionParameters interaction;

        // Reserve ceiling: max_meals full meals of the expected prey.
        [[nodiscard]] double maxMetabolicState() const;
    };

    /**
     * Parses and validates a YAML configuration. Relative file paths are resolved against
     * baseDir and must exist.
     * @throws ConfigError naming the offending key on any schema or range violation
     */
    [[nodiscard]] Config parseConfig(const std::string &yamlText, const std::filesystem::path &baseDir);

    [[nodiscard]] Config loadConfig(const std::filesystem::path &path);

    // Hours list normalization: 24 -> 0, duplicates collapse.
    [[nodiscard]] HourSet makeHourSet(std::initializer_list<int> hours);
} // namespace suf
