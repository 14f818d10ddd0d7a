#include "suf/Config.hpp"
#include "suf/Errors.hpp"
#include "suf/Random.hpp"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>

namespace suf
{
    namespace
    {
        // A YAML mapping plus the dotted path that leads to it, for error messages.
        class Section
        {
            public:
                Section(YAML::Node node, std::string path): m_node(std::move(node)), m_path(std::move(path))
                {
                    if (!m_node.IsMap())
                        throw ConfigError(where() + ": expected a mapping");
                }

                [[nodiscard]] std::string where() const
                {
                    return m_path.empty() ? std::string("<root>") : m_path;
                }

                [[nodiscard]] std::string keyPath(const std::string &key) const
                {
                    return m_path.empty() ? key : m_path + "." + key;
                }

                [[nodiscard]] bool has(const std::string &key) const
                {
                    const YAML::Node n = m_node[key];
                    return n.IsDefined() && !n.IsNull();
                }

                [[nodiscard]] YAML::Node raw(const std::string &key) const
                {
                    const YAML::Node n = m_node[key];
                    if (!n.IsDefined() || n.IsNull())
                        throw ConfigError(keyPath(key) + ": missing required key");
                    return n;
                }

                [[nodiscard]] Section section(const std::string &key) const
                {
                    return {raw(key), keyPath(key)};
                }

                template <typename T>
                [[nodiscard]] T get(const std::string &key) const
                {
                    try
                    {
                        return raw(key).as<T>();
                    }
                    catch (const YAML::Exception &e)
                    {
                        throw ConfigError(keyPath(key) + ": " + e.msg);
                    }
                }

                // extra='forbid': every key present must be one we know.
                void allowOnly(std::initializer_list<const char *> keys) const
                {
                    const std::set<std::string> allowed(keys.begin(), keys.end());
                    for (auto it = m_node.begin(); it != m_node.end(); ++it)
                    {
                        const auto k = it->first.as<std::string>();
                        if (!allowed.contains(k))
                            throw ConfigError(keyPath(k) + ": unknown key");
                    }
                }

                [[nodiscard]] const YAML::Node &node() const
                {
                    return m_node;
                }

            private:
                YAML::Node  m_node;
                std::string m_path;
        };

        [[noreturn]] void fail(const Section &s, const std::string &key, const std::string &msg)
        {
            throw ConfigError(s.keyPath(key) + ": " + msg);
        }

        double positive(const Section &s, const std::string &key)
        {
            const auto v = s.get<double>(key);
            if (!(v > 0.0))
                fail(s, key, "must be > 0");
            return v;
        }

        double nonNegative(const Section &s, const std::string &key)
        {
            const auto v = s.get<double>(key);
            if (!(v >= 0.0))
                fail(s, key, "must be >= 0");
            return v;
        }

        double probability(const Section &s, const std::string &key)
        {
            const auto v = s.get<double>(key);
            if (!(v >= 0.0 && v <= 1.0))
                fail(s, key, "must lie in [0, 1]");
            return v;
        }

        std::string oneOf(const Section &s, const std::string &key, std::initializer_list<const char *> choices)
        {
            const auto v = s.get<std::string>(key);
            for (const char *c : choices)
            {
                if (v == c)
                    return v;
            }
            fail(s, key, "unsupported value '" + v + "'");
        }

        HourSet hours(const Section &s, const std::string &key)
        {
            const YAML::Node n = s.raw(key);
            if (!n.IsSequence())
                fail(s, key, "expected a list of hours");
            HourSet out;
            for (const auto &item : n)
            {
                int h = 0;
                try
                {
                    h = item.as<int>();
                }
                catch (const YAML::Exception &e)
                {
                    fail(s, key, e.msg);
                }
                if (h < 0 || h > 24)
                    fail(s, key, "hour " + std::to_string(h) + " outside 0..24");
                out.set(static_cast<size_t>(h == 24 ? 0 : h));
            }
            return out;
        }

        std::filesystem::path existingFile(const Section &s, const std::string &key,
                                           const std::filesystem::path &baseDir)
        {
            std::filesystem::path p = s.get<std::string>(key);
            if (p.is_relative())
                p = baseDir / p;
            if (!std::filesystem::is_regular_file(p))
                fail(s, key, "file not found: " + p.string());
            return p;
        }

        Range range(const Section &s)
        {
            s.allowOnly({"min", "max"});
            Range r;
            r.min = positive(s, "min");
            r.max = positive(s, "max");
            if (r.max <= r.min)
                fail(s, "max", "must be > min");
            return r;
        }

        RangeOrValue rangeOrValue(const Section &s, const std::string &key, const std::string &legacyKey)
        {
            const bool        hasKey = s.has(key);
            const std::string use    = hasKey ? key : legacyKey;
            if (hasKey && s.has(legacyKey))
                fail(s, legacyKey, "conflicts with '" + key + "'");
            if (!hasKey && !s.has(legacyKey))
                fail(s, key, "missing required key");

            RangeOrValue out;
            if (const YAML::Node n = s.raw(use); n.IsMap())
            {
                out.range = range(Section(n, s.keyPath(use)));
                out.value = out.range->min;
            }
            else
            {
                out.value = positive(s, use);
            }
            return out;
        }

        ModelParameters parseModel(const Section &s)
        {
            s.allowOnly({"Site", "Experiment", "agents"});
            ModelParameters m;
            m.site       = s.get<std::string>("Site");
            m.experiment = s.get<std::string>("Experiment");

            const Section agents = s.section("agents");
            agents.allowOnly({"Rattlesnake"});
            m.rattlesnakeCount = agents.get<int>("Rattlesnake");
            if (m.rattlesnakeCount < 0)
                fail(agents, "Rattlesnake", "must be >= 0");
            return m;
        }

        LandscapeParameters parseLandscape(const Section &s, const std::filesystem::path &baseDir)
        {
            s.allowOnly({"Thermal_Database_fp", "ENV_Temperature_Cols", "Width", "Height", "spatially_explicit",
                         "torus", "moore"});
            LandscapeParameters l;
            l.thermalDatabase = existingFile(s, "Thermal_Database_fp", baseDir);

            const Section cols = s.section("ENV_Temperature_Cols");
            cols.allowOnly({"Open", "Burrow"});
            l.openColumn   = cols.get<std::string>("Open");
            l.burrowColumn = cols.get<std::string>("Burrow");

            l.spatiallyExplicit = s.get<bool>("spatially_explicit");
            l.torus             = s.get<bool>("torus");
            l.moore             = s.get<bool>("moore");

            for (const char *dim : {"Width", "Height"})
            {
                if (!s.has(dim))
                    continue;
                const int v = s.get<int>(dim);
                if (v < 1)
                    fail(s, dim, "must be >= 1");
                (std::string(dim) == "Width" ? l.width : l.height) = v;
            }

            if (l.spatiallyExplicit)
            {
                if (!l.width || !l.height)
                    fail(s, "spatially_explicit", "Width and Height are required when spatially_explicit is true");
            }
            else
            {
                l.width.reset();
                l.height.reset();
            }
            return l;
        }

        RattlesnakeParameters parseRattlesnake(const Section &s, const std::filesystem::path &baseDir)
        {
            s.allowOnly({"species", "thermoregulation_strategy", "body_size_config", "active_hours",
                         "Initial_Body_Temperature", "initial_calories", "utility", "thermal_preference",
                         "voluntary_ct", "strike_performance", "delta_t", "smr", "Brumation",
                         "behavior_activity_coefficients"});
            RattlesnakeParameters r;
            r.species                  = oneOf(s, "species", {"Rattlesnake"});
            r.thermoregulationStrategy = oneOf(s, "thermoregulation_strategy", {"Ectotherm", "Endotherm"});

            {
                const Section b = s.section("body_size_config");
                b.allowOnly({"distribution", "mean", "std", "min", "max"});
                r.bodySize.distribution = oneOf(b, "distribution", {"normal"});
                r.bodySize.mean         = positive(b, "mean");
                r.bodySize.sd           = nonNegative(b, "std");
                r.bodySize.min          = positive(b, "min");
                r.bodySize.max          = positive(b, "max");
                if (r.bodySize.max <= r.bodySize.min)
                    fail(b, "max", "must be > min");
            }

            r.activeHours            = hours(s, "active_hours");
            r.initialBodyTemperature = s.get<double>("Initial_Body_Temperature");
            r.initialCalories        = nonNegative(s, "initial_calories");

            {
                const Section u = s.section("utility");
                u.allowOnly({"max_meals", "max_thermal_accuracy"});
                r.maxMeals = u.get<int>("max_meals");
                if (r.maxMeals < 0)
                    fail(u, "max_meals", "must be >= 0");
                if (u.has("max_thermal_accuracy"))
                    r.maxThermalAccuracy = nonNegative(u, "max_thermal_accuracy");
            }

            {
                const Section t = s.section("thermal_preference");
                t.allowOnly({"k", "t_pref_min", "t_pref_max", "t_opt"});
                r.thermal.k        = positive(t, "k");
                r.thermal.tPrefMin = t.get<double>("t_pref_min");
                r.thermal.tPrefMax = t.get<double>("t_pref_max");
                r.thermal.tOpt     = t.get<double>("t_opt");
                if (!(r.thermal.tPrefMin <= r.thermal.tOpt && r.thermal.tOpt <= r.thermal.tPrefMax))
                    fail(t, "t_opt", "must lie within [t_pref_min, t_pref_max]");
            }

            {
                const Section c = s.section("voluntary_ct");
                c.allowOnly({"min_temp", "max_temp", "max_steps"});
                r.voluntaryCt.minTemp  = c.get<double>("min_temp");
                r.voluntaryCt.maxTemp  = c.get<double>("max_temp");
                r.voluntaryCt.maxSteps = c.get<int>("max_steps");
                if (r.voluntaryCt.maxTemp <= r.voluntaryCt.minTemp)
                    fail(c, "max_temp", "must be > min_temp");
                if (r.voluntaryCt.maxSteps < 0)
                    fail(c, "max_steps", "must be >= 0");
            }

            r.strikePerformance = probability(s, "strike_performance");
            r.deltaT            = s.get<int>("delta_t");
            if (r.deltaT < 1)
                fail(s, "delta_t", "must be >= 1");

            {
                const Section m = s.section("smr");
                m.allowOnly({"X1_mass", "X2_temp", "X3_const"});
                r.smr.x1Mass  = m.get<double>("X1_mass");
                r.smr.x2Temp  = m.get<double>("X2_temp");
                r.smr.x3Const = m.get<double>("X3_const");
            }

            {
                const Section b = s.section("Brumation");
                b.allowOnly({"file_path", "scale", "temperature"});
                r.brumation.filePath    = existingFile(b, "file_path", baseDir);
                r.brumation.scale       = oneOf(b, "scale", {"Day", "Hour"});
                r.brumation.temperature = b.get<double>("temperature");
            }

            {
                const Section a = s.section("behavior_activity_coefficients");
                a.allowOnly({"Rest", "Thermoregulate", "Forage", "Search", "Brumation"});
                for (int i = 0; i < kBehaviorCount; ++i)
                {
                    const std::string label(toString(static_cast<Behavior>(i)));
                    r.activityCoefficients[static_cast<size_t>(i)] = positive(a, label);
                }
            }
            return r;
        }

        InteractionParameters parseInteraction(const Section &s)
        {
            s.allowOnly({"Rattlesnake-KangarooRat"});
            const Section k = s.section("Rattlesnake-KangarooRat");
            k.allowOnly({"calories_per_gram", "digestion_efficiency", "expected_prey_body_size", "handling_time",
                         "attack_rate", "attack_rate_range", "prey_density", "prey_density_range",
                         "searching_behavior", "prey_active_hours"});

            InteractionParameters i;
            i.caloriesPerGram      = positive(k, "calories_per_gram");
            i.digestionEfficiency  = probability(k, "digestion_efficiency");
            i.expectedPreyBodySize = positive(k, "expected_prey_body_size");
            i.handlingTime         = positive(k, "handling_time");
            i.attackRate           = rangeOrValue(k, "attack_rate", "attack_rate_range");
            i.preyDensity          = rangeOrValue(k, "prey_density", "prey_density_range");
            i.searchingBehavior    = k.get<bool>("searching_behavior");
            i.preyActiveHours      = hours(k, "prey_active_hours");
            return i;
        }
    } // namespace

    double RangeOrValue::sample(const Rng &rng) const
    {
        if (range)
            return rng.uniform(range->min, range->max);
        return value;
    }

    double Config::maxMetabolicState() const
    {
        return static_cast<double>(rattlesnake.maxMeals) * interaction.expectedPreyBodySize *
               interaction.caloriesPerGram * interaction.digestionEfficiency;
    }

    HourSet makeHourSet(const std::initializer_list<int> hours)
    {
        HourSet out;
        for (const int h : hours)
            out.set(static_cast<size_t>(h == 24 ? 0 : h));
        return out;
    }

    Config parseConfig(const std::string &yamlText, const std::filesystem::path &baseDir)
    {
        YAML::Node root;
        try
        {
            root = YAML::Load(yamlText);
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError(std::string("malformed YAML: ") + e.what());
        }

        const Section top(root, "");
        top.allowOnly({"Model_Parameters", "Landscape_Parameters", "Rattlesnake_Parameters",
                       "Interaction_Parameters"});

        Config c;
        c.model       = parseModel(top.section("Model_Parameters"));
        c.landscape   = parseLandscape(top.section("Landscape_Parameters"), baseDir);
        c.rattlesnake = parseRattlesnake(top.section("Rattlesnake_Parameters"), baseDir);
        c.interaction = parseInteraction(top.section("Interaction_Parameters"));
        return c;
    }

    Config loadConfig(const std::filesystem::path &path)
    {
        std::ifstream f(path);
        if (!f)
            throw ConfigError("cannot open config file: " + path.string());
        std::stringstream ss;
        ss << f.rdbuf();
        return parseConfig(ss.str(), path.parent_path());
    }
} // namespace suf
