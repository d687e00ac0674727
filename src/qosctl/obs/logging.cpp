/**
 * @file logging.cpp
 * @brief spdlog default logger configuration.
 */
#include "qosctl/obs/logging.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace qosctl::obs {

    Result<void> init_logging(const LoggingConfig& cfg) {
        // from_str() maps unknown names to "off", so "off" has to be checked by name.
        const auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off") {
            return make_error(ErrorKind::Parse, fmt::format("unknown log level '{}'", cfg.level));
        }

        auto logger = spdlog::get("qosctl");
        if (!logger) {
            logger = spdlog::stdout_color_mt("qosctl");
        }
        logger->set_level(level);
        logger->set_pattern(cfg.pattern);
        spdlog::set_default_logger(logger);
        return {};
    }

} // namespace qosctl::obs
