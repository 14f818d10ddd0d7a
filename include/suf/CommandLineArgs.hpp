#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace suf
{
    // Parsed command line of the suffugium executables.
    // Both "--opt value" and "--opt=value" are accepted; '_' and '-' are interchangeable in option names.
    struct CommandLineArgs
    {
        bool showHelp = false; // --help / -h

        std::optional<std::filesystem::path> config; // --config <file.yaml>
        uint64_t                             seed = 42;        // --seed <N>
        std::filesystem::path                output{"."};      // --output <dir>
        std::string                          simId{"1"};       // --sim-id <label>
        int                                  keepData = 0;     // --keep-data <N>
        int                                  maxSteps = 0;     // --max-steps <N>
        bool                                 verbose  = false; // --verbose

        // Unknown options and malformed values, verbatim.
        std::vector<std::string> errors;

        [[nodiscard]] bool ok() const
        {
            return errors.empty();
        }
    };

    [[nodiscard]] CommandLineArgs parseCommandLineArgs(int argc, const char *const *argv);

    [[nodiscard]] std::string buildCommandLineHelpText(const std::string &program);
} // namespace suf
