#pragma once

#include "stratus/agent/session.hpp"
#include "stratus/network/http_client.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace stratus::agent {

/**
 * @brief RemoteSession speaking the agent protocol over HTTP
 */
class HttpAgentSession : public RemoteSession {
public:
    HttpAgentSession(AgentEndpoint endpoint, Credentials credentials);

    /**
     * @brief Ping the agent and check that it speaks our protocol version
     */
    Result<AgentInfo> handshake();

    const std::string& endpoint() const override { return endpoint_name_; }
    bool is_open() const override { return open_; }

    Result<std::string> reset_file(const std::string& path) override;
    Result<std::string> resolve_path(const std::string& path) override;
    Result<std::uint64_t> append(const std::string& path, const std::vector<std::uint8_t>& bytes) override;
    Result<RemoteFileInfo> stat(const std::string& path) override;

    Result<CommandOutcome> install_product(const std::string& product) override;
    Result<CommandOutcome> add_firewall_rule(const FirewallRule& rule) override;
    Result<CommandOutcome> set_sql_authentication(SqlAuthenticationMode mode, const std::string& instance) override;

    void close() override;

private:
    network::HttpRequest make_request(network::HttpMethod method, const std::string& route) const;

    // Sends the request and returns the decoded JSON body of a 2xx response
    Result<nlohmann::json> call(network::HttpRequest request);
    Result<nlohmann::json> post_json(const std::string& route, const nlohmann::json& body);

    Result<std::string> path_call(const std::string& route, const std::string& path);
    Result<CommandOutcome> command_call(const std::string& route, const nlohmann::json& body);

    network::HttpClient client_;
    Credentials credentials_;
    std::string endpoint_name_;
    bool open_ = true;
};

class HttpSessionFactory : public SessionFactory {
public:
    Result<std::unique_ptr<RemoteSession>> open(const std::string& uri, const Credentials& credentials) override;
};

} // namespace stratus::agent
