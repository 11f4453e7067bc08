#pragma once

#include "stratus/core/result.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace stratus {

struct LoggingConfig {
    std::string level = "info";       ///< spdlog level name
    std::string file;                 ///< optional rotating log file
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
    bool verbose = false;             ///< forces debug level
};

Result<LoggingConfig> logging_config_from_json(const nlohmann::json& j);

/**
 * @brief Build the process logger and install it as spdlog's default
 *
 * Called once by each executable before anything else logs; library code
 * logs through the default logger only.
 */
Result<std::shared_ptr<spdlog::logger>> configure_logging(const LoggingConfig& config,
                                                          const std::string& name);

} // namespace stratus
