#include "suf/CommandLineArgs.hpp"

#include <charconv>
#include <cstddef>
#include <string_view>

namespace suf
{
    namespace
    {
        std::string normalizeName(std::string_view s)
        {
            std::string out(s);
            for (char &c : out)
                if (c == '_')
                    c = '-';
            return out;
        }

        template<typename T> std::optional<T> parseInteger(const std::string_view s)
        {
            T v{};
            const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
            if (ec != std::errc{} || ptr != s.data() + s.size())
                return std::nullopt;
            return v;
        }
    } // namespace

    CommandLineArgs parseCommandLineArgs(const int argc, const char *const *argv)
    {
        CommandLineArgs out;

        for (int i = 1; i < argc; ++i)
        {
            const std::string_view raw(argv[i]);
            if (raw.empty())
                continue;

            if (raw == "--help" || raw == "-h")
            {
                out.showHelp = true;
                continue;
            }
            if (raw == "--verbose" || raw == "-v")
            {
                out.verbose = true;
                continue;
            }
            if (!raw.starts_with("--"))
            {
                out.errors.emplace_back("unexpected argument: " + std::string(raw));
                continue;
            }

            std::string_view           name = raw;
            std::optional<std::string> value;
            if (const size_t eq = raw.find('='); eq != std::string_view::npos)
            {
                name  = raw.substr(0, eq);
                value = std::string(raw.substr(eq + 1));
            }
            const std::string opt = normalizeName(name);

            if (opt != "--config" && opt != "--seed" && opt != "--output" && opt != "--sim-id" &&
                opt != "--keep-data" && opt != "--max-steps")
            {
                out.errors.emplace_back("unknown option: " + std::string(raw));
                continue;
            }

            if (!value)
            {
                if (i + 1 >= argc)
                {
                    out.errors.emplace_back("missing value for " + opt);
                    continue;
                }
                value = argv[++i];
            }

            const auto badValue = [&]
            {
                out.errors.emplace_back("bad value for " + opt + ": '" + *value + "'");
            };

            if (opt == "--config")
                out.config = *value;
            else if (opt == "--output")
                out.output = *value;
            else if (opt == "--sim-id")
                out.simId = *value;
            else if (opt == "--seed")
            {
                if (const auto v = parseInteger<uint64_t>(*value))
                    out.seed = *v;
                else
                    badValue();
            }
            else
            {
                const auto v = parseInteger<int>(*value);
                if (!v || *v < 0)
                    badValue();
                else if (opt == "--keep-data")
                    out.keepData = *v;
                else
                    out.maxSteps = *v;
            }
        }

        if (!out.showHelp && !out.config)
            out.errors.emplace_back("--config is required");
        return out;
    }

    std::string buildCommandLineHelpText(const std::string &program)
    {
        return "usage: " + program + " --config <file.yaml> [options]\n"
               "  --config <file>     YAML configuration (.yaml / .yml)\n"
               "  --seed <N>          random seed (default 42)\n"
               "  --output <dir>      output directory, created if missing (default .)\n"
               "  --sim-id <label>    simulation label used in output names (default 1)\n"
               "  --keep-data <N>     write a per-tick CSV for every Nth organism, 0 = none (default 0)\n"
               "  --max-steps <N>     stop after N ticks, 0 = whole thermal profile (default 0)\n"
               "  --verbose, -v       debug logging\n"
               "  --help, -h          this text\n";
    }
} // namespace suf
