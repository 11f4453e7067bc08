#include "stratus/agent/protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace stratus::agent {
namespace {

constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

Result<AgentEndpoint> parse_agent_uri(const std::string& uri) {
    std::string rest = uri;
    const auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        const auto name = lowercase(rest.substr(0, scheme));
        if (name != "http") {
            return Err<AgentEndpoint>("Unsupported agent URI scheme '" + name + "' in " + uri);
        }
        rest = rest.substr(scheme + 3);
    }

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    AgentEndpoint endpoint;
    const auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = rest;
        endpoint.port = kDefaultAgentPort;
    } else {
        endpoint.host = rest.substr(0, colon);
        const std::string port = rest.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
            return Err<AgentEndpoint>("Invalid port in agent URI: " + uri);
        }
        const unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) {
            return Err<AgentEndpoint>("Port out of range in agent URI: " + uri);
        }
        endpoint.port = static_cast<std::uint16_t>(value);
    }

    if (endpoint.host.empty()) {
        return Err<AgentEndpoint>("Missing host in agent URI: " + uri);
    }
    return Ok(endpoint);
}

std::string to_string(FirewallProtocol protocol) {
    return protocol == FirewallProtocol::UDP ? "UDP" : "TCP";
}

Result<FirewallProtocol> parse_firewall_protocol(const std::string& text) {
    const auto value = lowercase(text);
    if (value == "tcp") {
        return Ok(FirewallProtocol::TCP);
    }
    if (value == "udp") {
        return Ok(FirewallProtocol::UDP);
    }
    return Err<FirewallProtocol>("Unknown firewall protocol: " + text);
}

std::string to_string(SqlAuthenticationMode mode) {
    return mode == SqlAuthenticationMode::Mixed ? "mixed" : "windows";
}

Result<SqlAuthenticationMode> parse_sql_authentication_mode(const std::string& text) {
    const auto value = lowercase(text);
    if (value == "mixed") {
        return Ok(SqlAuthenticationMode::Mixed);
    }
    if (value == "windows") {
        return Ok(SqlAuthenticationMode::Windows);
    }
    return Err<SqlAuthenticationMode>("Unknown SQL authentication mode: " + text);
}

nlohmann::json to_json(const RemoteFileInfo& info) {
    nlohmann::json j;
    j["path"] = info.path;
    j["exists"] = info.exists;
    j["size"] = info.size;
    j["modified_time"] = info.modified_time;
    return j;
}

Result<RemoteFileInfo> remote_file_info_from_json(const nlohmann::json& j) {
    try {
        RemoteFileInfo info;
        info.path = j.at("path").get<std::string>();
        info.exists = j.at("exists").get<bool>();
        info.size = j.value("size", static_cast<std::uint64_t>(0));
        info.modified_time = j.value("modified_time", static_cast<std::int64_t>(0));
        return Ok(info);
    } catch (const nlohmann::json::exception& e) {
        return Err<RemoteFileInfo>(std::string("Invalid stat payload: ") + e.what());
    }
}

nlohmann::json to_json(const CommandOutcome& outcome) {
    nlohmann::json j;
    j["exit_code"] = outcome.exit_code;
    j["output"] = outcome.output;
    return j;
}

Result<CommandOutcome> command_outcome_from_json(const nlohmann::json& j) {
    try {
        CommandOutcome outcome;
        outcome.exit_code = j.at("exit_code").get<int>();
        outcome.output = j.value("output", std::string());
        return Ok(outcome);
    } catch (const nlohmann::json::exception& e) {
        return Err<CommandOutcome>(std::string("Invalid command payload: ") + e.what());
    }
}

nlohmann::json to_json(const FirewallRule& rule) {
    nlohmann::json j;
    j["name"] = rule.name;
    j["protocol"] = to_string(rule.protocol);
    j["port"] = rule.port;
    return j;
}

Result<FirewallRule> firewall_rule_from_json(const nlohmann::json& j) {
    FirewallRule rule;
    try {
        rule.name = j.at("name").get<std::string>();
        const auto port = j.at("port").get<int>();
        if (port <= 0 || port > 65535) {
            return Err<FirewallRule>("Firewall port out of range: " + std::to_string(port));
        }
        rule.port = static_cast<std::uint16_t>(port);
        auto protocol = parse_firewall_protocol(j.value("protocol", std::string("TCP")));
        if (protocol.is_error()) {
            return Forward<FirewallRule>(protocol);
        }
        rule.protocol = protocol.value();
    } catch (const nlohmann::json::exception& e) {
        return Err<FirewallRule>(std::string("Invalid firewall rule payload: ") + e.what());
    }

    if (rule.name.empty()) {
        return Err<FirewallRule>(std::string("Firewall rule name must not be empty"));
    }
    return Ok(rule);
}

nlohmann::json to_json(const AgentInfo& info) {
    nlohmann::json j;
    j["protocol_version"] = info.protocol_version;
    j["agent"] = info.agent;
    j["root"] = info.root;
    return j;
}

Result<AgentInfo> agent_info_from_json(const nlohmann::json& j) {
    try {
        AgentInfo info;
        info.protocol_version = j.at("protocol_version").get<int>();
        info.agent = j.value("agent", std::string());
        info.root = j.value("root", std::string());
        return Ok(info);
    } catch (const nlohmann::json::exception& e) {
        return Err<AgentInfo>(std::string("Invalid ping payload: ") + e.what());
    }
}

std::string base64_encode(const std::string& input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < input.size()) {
        const auto n = (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16) |
                       (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 1])) << 8) |
                       static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 2]));
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += kBase64Alphabet[n & 0x3F];
        i += 3;
    }

    const std::size_t remaining = input.size() - i;
    if (remaining == 1) {
        const auto n = static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16;
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        const auto n = (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16) |
                       (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 1])) << 8);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::optional<std::string> base64_decode(const std::string& input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    std::array<int, 256> lookup;
    lookup.fill(-1);
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(kBase64Alphabet[i])] = i;
    }

    std::string out;
    out.reserve(input.size() / 4 * 3);
    for (std::size_t i = 0; i < input.size(); i += 4) {
        std::uint32_t n = 0;
        int padding = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            const char c = input[i + k];
            if (c == '=') {
                // Padding is only legal in the last two positions of the last quad
                if (i + 4 != input.size() || k < 2) {
                    return std::nullopt;
                }
                ++padding;
                n <<= 6;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            const int value = lookup[static_cast<unsigned char>(c)];
            if (value < 0) {
                return std::nullopt;
            }
            n = (n << 6) | static_cast<std::uint32_t>(value);
        }
        out += static_cast<char>((n >> 16) & 0xFF);
        if (padding < 2) {
            out += static_cast<char>((n >> 8) & 0xFF);
        }
        if (padding < 1) {
            out += static_cast<char>(n & 0xFF);
        }
    }
    return out;
}

std::string basic_authorization(const Credentials& credentials) {
    return "Basic " + base64_encode(credentials.username + ":" + credentials.password);
}

std::optional<Credentials> parse_basic_authorization(const std::string& header) {
    constexpr const char* kPrefix = "Basic ";
    if (header.compare(0, 6, kPrefix) != 0) {
        return std::nullopt;
    }

    auto decoded = base64_decode(header.substr(6));
    if (!decoded) {
        return std::nullopt;
    }

    const auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return Credentials{decoded->substr(0, colon), decoded->substr(colon + 1)};
}

} // namespace stratus::agent
