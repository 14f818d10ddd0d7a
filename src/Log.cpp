#include "suf/Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace suf
{
    namespace
    {
        std::shared_ptr<spdlog::logger> g_logger;
    }

    void initLogging(const std::filesystem::path &outputDir, const spdlog::level::level_enum level)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!outputDir.empty())
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>((outputDir / "run.log").string(), true));

        if (g_logger)
            spdlog::drop(g_logger->name());
        g_logger = std::make_shared<spdlog::logger>("suffugium", sinks.begin(), sinks.end());
        g_logger->set_level(level);
        g_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(g_logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    }
} // namespace suf
