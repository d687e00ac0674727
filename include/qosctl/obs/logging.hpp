#pragma once
/**
 * @file logging.hpp
 * @brief Process-wide spdlog setup.
 */

#include <string>

#include "qosctl/domain/errors.hpp"

namespace qosctl::obs {

    /** @struct LoggingConfig
     *  @brief Default logger settings (level name + spdlog pattern).
     */
    struct LoggingConfig {
        std::string level{"info"};                                   ///< trace|debug|info|warn|error|critical|off
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};  ///< spdlog pattern
    };

    /**
     * @brief Install a colored stdout logger as the spdlog default.
     * @return Parse error for an unknown level name; the logger is left untouched then.
     */
    Result<void> init_logging(const LoggingConfig& cfg);

} // namespace qosctl::obs
