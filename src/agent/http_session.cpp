#include "stratus/agent/http_session.hpp"

#include <spdlog/spdlog.h>

namespace stratus::agent {
namespace {

using json = nlohmann::json;

std::string describe_failure(const network::HttpResponse& response) {
    const std::string body = response.body_as_string();
    try {
        const auto j = json::parse(body);
        if (j.is_object() && j.contains("error") && j.at("error").is_string()) {
            return j.at("error").get<std::string>();
        }
    } catch (const json::parse_error&) {
        // Not a protocol error body; fall through to the raw text
    }
    return body.empty() ? response.reason_phrase : body;
}

} // namespace

HttpAgentSession::HttpAgentSession(AgentEndpoint endpoint, Credentials credentials)
    : client_(endpoint.host, endpoint.port)
    , credentials_(std::move(credentials))
    , endpoint_name_(endpoint.to_string()) {
}

Result<AgentInfo> HttpAgentSession::handshake() {
    auto response = call(make_request(network::HttpMethod::GET, routes::kPing));
    if (response.is_error()) {
        return Forward<AgentInfo>(response);
    }
    auto info = agent_info_from_json(response.value());
    if (info.is_error()) {
        return info;
    }
    if (info.value().protocol_version != kProtocolVersion) {
        return Err<AgentInfo>("Agent at " + endpoint_name_ + " speaks protocol " +
                              std::to_string(info.value().protocol_version) + ", expected " +
                              std::to_string(kProtocolVersion));
    }
    return info;
}

Result<std::string> HttpAgentSession::reset_file(const std::string& path) {
    return path_call(routes::kResetFile, path);
}

Result<std::string> HttpAgentSession::resolve_path(const std::string& path) {
    return path_call(routes::kResolvePath, path);
}

Result<std::uint64_t> HttpAgentSession::append(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    auto request = make_request(network::HttpMethod::POST, routes::kAppendFile);
    request.set_header(kPathHeader, path);
    request.set_header("Content-Type", "application/octet-stream");
    request.set_body(bytes);

    auto response = call(std::move(request));
    if (response.is_error()) {
        return Forward<std::uint64_t>(response);
    }

    try {
        const auto written = response.value().at("bytes_written").get<std::uint64_t>();
        if (written != bytes.size()) {
            return Err<std::uint64_t>("Agent wrote " + std::to_string(written) + " of " +
                                      std::to_string(bytes.size()) + " bytes to " + path);
        }
        return Ok(response.value().at("size").get<std::uint64_t>());
    } catch (const json::exception& e) {
        return Err<std::uint64_t>(std::string("Invalid append payload: ") + e.what());
    }
}

Result<RemoteFileInfo> HttpAgentSession::stat(const std::string& path) {
    auto response = post_json(routes::kStatFile, json{{"path", path}});
    if (response.is_error()) {
        return Forward<RemoteFileInfo>(response);
    }
    return remote_file_info_from_json(response.value());
}

Result<CommandOutcome> HttpAgentSession::install_product(const std::string& product) {
    return command_call(routes::kInstallProduct, json{{"product", product}});
}

Result<CommandOutcome> HttpAgentSession::add_firewall_rule(const FirewallRule& rule) {
    return command_call(routes::kFirewallRules, to_json(rule));
}

Result<CommandOutcome> HttpAgentSession::set_sql_authentication(SqlAuthenticationMode mode, const std::string& instance) {
    return command_call(routes::kSqlAuthentication, json{{"mode", to_string(mode)}, {"instance", instance}});
}

void HttpAgentSession::close() {
    if (open_) {
        spdlog::debug("Closed session to {}", endpoint_name_);
    }
    open_ = false;
}

network::HttpRequest HttpAgentSession::make_request(network::HttpMethod method, const std::string& route) const {
    network::HttpRequest request;
    request.method = method;
    request.url = route;
    request.set_header(kProtocolHeader, std::to_string(kProtocolVersion));
    request.set_header("Authorization", basic_authorization(credentials_));
    return request;
}

Result<json> HttpAgentSession::call(network::HttpRequest request) {
    if (!open_) {
        return Err<json>("Session to " + endpoint_name_ + " is closed");
    }

    const std::string route = request.url;
    auto response = client_.send(std::move(request));
    if (response.is_error()) {
        return Forward<json>(response);
    }

    const auto& http = response.value();
    if (!http.is_success()) {
        return Err<json>(route + " on " + endpoint_name_ + " failed (" + std::to_string(http.status_code) +
                         "): " + describe_failure(http));
    }

    try {
        return Ok(json::parse(http.body_as_string()));
    } catch (const json::parse_error& e) {
        return Err<json>(route + " on " + endpoint_name_ + " returned invalid JSON: " + e.what());
    }
}

Result<json> HttpAgentSession::post_json(const std::string& route, const json& body) {
    auto request = make_request(network::HttpMethod::POST, route);
    request.set_header("Content-Type", "application/json");
    request.set_body(body.dump());
    return call(std::move(request));
}

Result<std::string> HttpAgentSession::path_call(const std::string& route, const std::string& path) {
    auto response = post_json(route, json{{"path", path}});
    if (response.is_error()) {
        return Forward<std::string>(response);
    }
    const auto& body = response.value();
    if (!body.contains("path") || !body.at("path").is_string()) {
        return Err<std::string>(route + " on " + endpoint_name_ + " returned no path");
    }
    return Ok(body.at("path").get<std::string>());
}

Result<CommandOutcome> HttpAgentSession::command_call(const std::string& route, const json& body) {
    auto response = post_json(route, body);
    if (response.is_error()) {
        return Forward<CommandOutcome>(response);
    }
    return command_outcome_from_json(response.value());
}

Result<std::unique_ptr<RemoteSession>> HttpSessionFactory::open(const std::string& uri, const Credentials& credentials) {
    auto endpoint = parse_agent_uri(uri);
    if (endpoint.is_error()) {
        return Forward<std::unique_ptr<RemoteSession>>(endpoint);
    }

    auto session = std::make_unique<HttpAgentSession>(endpoint.value(), credentials);
    auto info = session->handshake();
    if (info.is_error()) {
        return Forward<std::unique_ptr<RemoteSession>>(info, "Failed to open session to " + uri);
    }

    spdlog::info("Opened session to {} (agent root {})", session->endpoint(), info.value().root);
    return Ok(std::unique_ptr<RemoteSession>(std::move(session)));
}

} // namespace stratus::agent
