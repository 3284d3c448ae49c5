#ifndef __CHKCERT_LOGGER_H__
#define __CHKCERT_LOGGER_H__

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace chkcert
{
    using Logger = std::shared_ptr<spdlog::logger>;

    // Builds the stderr logger handed to every component. verbose selects
    // debug level; level_name (trace, debug, info, warn, error, critical, off)
    // overrides it when not empty.
    Logger MakeLogger(bool verbose, const std::string& level_name = "");

    // Logger with no sinks, for callers and tests that want silence.
    Logger MakeNullLogger();

    spdlog::level::level_enum ParseLevel(const std::string& level_name, spdlog::level::level_enum fallback);
} // namespace chkcert

#endif
