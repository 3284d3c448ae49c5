#include "logger.h"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chkcert
{
    spdlog::level::level_enum ParseLevel(const std::string& level_name, spdlog::level::level_enum fallback)
    {
        if (level_name == "trace") return spdlog::level::trace;
        if (level_name == "debug") return spdlog::level::debug;
        if (level_name == "info") return spdlog::level::info;
        if (level_name == "warn" || level_name == "warning") return spdlog::level::warn;
        if (level_name == "error") return spdlog::level::err;
        if (level_name == "critical") return spdlog::level::critical;
        if (level_name == "off") return spdlog::level::off;
        return fallback;
    }

    Logger MakeLogger(bool verbose, const std::string& level_name)
    {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        auto logger = std::make_shared<spdlog::logger>("check_certificates", sink);
        // Without -v only errors reach the terminal, so table output stays clean.
        auto level = verbose ? spdlog::level::debug : spdlog::level::err;
        logger->set_level(ParseLevel(level_name, level));
        logger->flush_on(spdlog::level::warn);
        return logger;
    }

    Logger MakeNullLogger()
    {
        auto logger = std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
        logger->set_level(spdlog::level::off);
        return logger;
    }
} // namespace chkcert
