#pragma once
#include <filesystem>
#include <spdlog/spdlog.h>

namespace suf
{
    /**
     * Installs the "suffugium" logger as spdlog's default: colored console plus
     * <outputDir>/run.log (truncated). An empty outputDir logs to the console only.
     */
    void initLogging(const std::filesystem::path &outputDir, spdlog::level::level_enum level = spdlog::level::info);
} // namespace suf
