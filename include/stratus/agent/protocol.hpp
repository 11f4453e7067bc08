/**
 * @file protocol.hpp
 * @brief Versioned wire contract between the deployer and the remote agent
 *
 * The agent exposes a fixed set of discrete operations instead of accepting
 * executable payloads. Requests are HTTP/1.1, JSON bodies except for
 * file appends, which carry the segment as raw octets.
 *
 *   GET  /v1/ping                  -> {protocol_version, agent, root}
 *   POST /v1/files/reset           {path}                 -> {path}
 *   POST /v1/files/resolve         {path}                 -> {path}
 *   POST /v1/files/append          X-Stratus-Path + bytes -> {bytes_written, size}
 *   POST /v1/files/stat            {path}                 -> {path, exists, size, modified_time}
 *   POST /v1/products/install      {product}              -> {exit_code, output}
 *   POST /v1/firewall/rules        {name, protocol, port} -> {exit_code, output}
 *   POST /v1/sql/authentication    {mode, instance}       -> {exit_code, output}
 *
 * Failures answer with a non-2xx status and {error}.
 */

#pragma once

#include "stratus/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace stratus::agent {

constexpr int kProtocolVersion = 1;
constexpr const char* kAgentName = "stratus-agent";

constexpr const char* kProtocolHeader = "X-Stratus-Protocol";
constexpr const char* kPathHeader = "X-Stratus-Path";

namespace routes {
constexpr const char* kPing = "/v1/ping";
constexpr const char* kResetFile = "/v1/files/reset";
constexpr const char* kResolvePath = "/v1/files/resolve";
constexpr const char* kAppendFile = "/v1/files/append";
constexpr const char* kStatFile = "/v1/files/stat";
constexpr const char* kInstallProduct = "/v1/products/install";
constexpr const char* kFirewallRules = "/v1/firewall/rules";
constexpr const char* kSqlAuthentication = "/v1/sql/authentication";
} // namespace routes

struct Credentials {
    std::string username;
    std::string password;

    bool empty() const { return username.empty(); }
};

inline bool operator==(const Credentials& a, const Credentials& b) {
    return a.username == b.username && a.password == b.password;
}

/**
 * @brief Result of a stat call on the agent
 */
struct RemoteFileInfo {
    std::string path;
    bool exists = false;
    std::uint64_t size = 0;
    std::int64_t modified_time = 0;  ///< seconds since epoch, 0 when absent
};

/**
 * @brief Outcome of a command-catalog operation
 */
struct CommandOutcome {
    int exit_code = 0;
    std::string output;
};

enum class FirewallProtocol {
    TCP,
    UDP
};

struct FirewallRule {
    std::string name;
    FirewallProtocol protocol = FirewallProtocol::TCP;
    std::uint16_t port = 0;
};

enum class SqlAuthenticationMode {
    Windows,
    Mixed
};

struct AgentInfo {
    int protocol_version = 0;
    std::string agent;
    std::string root;
};

/**
 * @brief Host and port of an agent, parsed from "http://host:port[/]"
 */
struct AgentEndpoint {
    std::string host;
    std::uint16_t port = 0;

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

constexpr std::uint16_t kDefaultAgentPort = 5986;

Result<AgentEndpoint> parse_agent_uri(const std::string& uri);

std::string to_string(FirewallProtocol protocol);
Result<FirewallProtocol> parse_firewall_protocol(const std::string& text);

std::string to_string(SqlAuthenticationMode mode);
Result<SqlAuthenticationMode> parse_sql_authentication_mode(const std::string& text);

// JSON (de)serialization of the protocol payloads
nlohmann::json to_json(const RemoteFileInfo& info);
Result<RemoteFileInfo> remote_file_info_from_json(const nlohmann::json& j);

nlohmann::json to_json(const CommandOutcome& outcome);
Result<CommandOutcome> command_outcome_from_json(const nlohmann::json& j);

nlohmann::json to_json(const FirewallRule& rule);
Result<FirewallRule> firewall_rule_from_json(const nlohmann::json& j);

nlohmann::json to_json(const AgentInfo& info);
Result<AgentInfo> agent_info_from_json(const nlohmann::json& j);

// HTTP Basic credentials
std::string base64_encode(const std::string& input);
std::optional<std::string> base64_decode(const std::string& input);
std::string basic_authorization(const Credentials& credentials);
std::optional<Credentials> parse_basic_authorization(const std::string& header);

} // namespace stratus::agent
