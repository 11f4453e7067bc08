#include "stratus/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace stratus {

Result<LoggingConfig> logging_config_from_json(const nlohmann::json& j) {
    LoggingConfig config;
    if (j.is_null()) {
        return Ok(config);
    }
    if (!j.is_object()) {
        return Err<LoggingConfig>(std::string("'logging' must be an object"));
    }

    try {
        config.level = j.value("level", config.level);
        config.file = j.value("file", config.file);
        config.max_file_size = j.value("max_file_size", config.max_file_size);
        config.max_files = j.value("max_files", config.max_files);
        config.verbose = j.value("verbose", config.verbose);
    } catch (const nlohmann::json::exception& e) {
        return Err<LoggingConfig>(std::string("Invalid logging section: ") + e.what());
    }

    if (spdlog::level::from_str(config.level) == spdlog::level::off && config.level != "off") {
        return Err<LoggingConfig>("Unknown log level: " + config.level);
    }
    return Ok(config);
}

Result<std::shared_ptr<spdlog::logger>> configure_logging(const LoggingConfig& config,
                                                          const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            return Err<std::shared_ptr<spdlog::logger>>("Failed to open log file " + config.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::from_str(config.level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return Ok(logger);
}

} // namespace stratus
