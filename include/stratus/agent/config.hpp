#pragma once

#include "stratus/agent/command_runner.hpp"
#include "stratus/agent/protocol.hpp"
#include "stratus/core/logging.hpp"
#include "stratus/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace stratus::agent {

// Command catalog keys
constexpr const char* kInstallProductCommand = "install_product";
constexpr const char* kFirewallRuleCommand = "firewall_rule";
constexpr const char* kSqlAuthenticationCommand = "sql_authentication";

/**
 * @brief Settings of one agent process
 *
 * Example agent.json:
 * {
 *   "bind_address": "0.0.0.0",
 *   "port": 5986,
 *   "root": "/srv/stratus",
 *   "credentials": {"username": "deploy", "password": "..."},
 *   "commands": {
 *     "install_product": ["WebpiCmd.exe", "/Install", "/Products:{product}", "/AcceptEula"],
 *     "firewall_rule": ["netsh", "advfirewall", "firewall", "add", "rule", "name={name}",
 *                       "dir=in", "action=allow", "protocol={protocol}", "localport={port}"],
 *     "sql_authentication": ["powershell", "-File", "C:\\stratus\\set-sql-auth.ps1",
 *                            "-Mode", "{mode}", "-Instance", "{instance}"]
 *   },
 *   "logging": {"level": "info"}
 * }
 */
struct AgentConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = kDefaultAgentPort;
    std::filesystem::path root;
    Credentials credentials;
    std::size_t max_segment_size = 16 * 1024 * 1024;
    std::map<std::string, CommandTemplate> commands;
    LoggingConfig logging;
};

Result<AgentConfig> agent_config_from_json(const nlohmann::json& j);
Result<AgentConfig> load_agent_config(const std::filesystem::path& path);

} // namespace stratus::agent
