#include "stratus/agent/config.hpp"

#include <fstream>

namespace stratus::agent {
namespace fs = std::filesystem;

Result<AgentConfig> agent_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<AgentConfig>(std::string("Agent configuration must be a JSON object"));
    }

    AgentConfig config;
    try {
        config.bind_address = j.value("bind_address", config.bind_address);

        const int port = j.value("port", static_cast<int>(config.port));
        if (port < 0 || port > 65535) {
            return Err<AgentConfig>("Agent port out of range: " + std::to_string(port));
        }
        config.port = static_cast<std::uint16_t>(port);

        config.root = j.at("root").get<std::string>();
        config.max_segment_size = j.value("max_segment_size", config.max_segment_size);

        const auto& credentials = j.at("credentials");
        config.credentials.username = credentials.at("username").get<std::string>();
        config.credentials.password = credentials.at("password").get<std::string>();

        if (j.contains("commands")) {
            for (const auto& [name, argv] : j.at("commands").items()) {
                config.commands[name] = argv.get<CommandTemplate>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<AgentConfig>(std::string("Invalid agent configuration: ") + e.what());
    }

    if (config.root.empty()) {
        return Err<AgentConfig>(std::string("Agent 'root' must not be empty"));
    }
    if (config.credentials.empty()) {
        return Err<AgentConfig>(std::string("Agent credentials need a username"));
    }
    if (config.max_segment_size == 0) {
        return Err<AgentConfig>(std::string("'max_segment_size' must be > 0"));
    }
    for (const auto& [name, argv] : config.commands) {
        if (argv.empty()) {
            return Err<AgentConfig>("Command '" + name + "' has an empty argv");
        }
    }

    auto logging = logging_config_from_json(j.contains("logging") ? j.at("logging") : nlohmann::json());
    if (logging.is_error()) {
        return Forward<AgentConfig>(logging);
    }
    config.logging = logging.value();

    return Ok(config);
}

Result<AgentConfig> load_agent_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<AgentConfig>("Failed to open agent configuration: " + path.string());
    }

    nlohmann::json j;
    try {
        input >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return Err<AgentConfig>("Failed to parse " + path.string() + ": " + e.what());
    }

    auto config = agent_config_from_json(j);
    if (config.is_error()) {
        return Forward<AgentConfig>(config, path.string());
    }

    // A relative root is relative to the configuration file
    if (config.value().root.is_relative()) {
        config.value().root = path.parent_path() / config.value().root;
    }
    return config;
}

} // namespace stratus::agent
