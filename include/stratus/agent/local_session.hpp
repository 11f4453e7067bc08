#pragma once

#include "stratus/agent/service.hpp"
#include "stratus/agent/session.hpp"

#include <string>

namespace stratus::agent {

/**
 * @brief RemoteSession calling an AgentService in the same process
 *
 * Used for deployments whose "remote" side is the local host and by tests
 * that need real file semantics without sockets.
 */
class LocalAgentSession : public RemoteSession {
public:
    explicit LocalAgentSession(AgentService& service, std::string name = "local");

    const std::string& endpoint() const override { return name_; }
    bool is_open() const override { return open_; }

    Result<std::string> reset_file(const std::string& path) override;
    Result<std::string> resolve_path(const std::string& path) override;
    Result<std::uint64_t> append(const std::string& path, const std::vector<std::uint8_t>& bytes) override;
    Result<RemoteFileInfo> stat(const std::string& path) override;

    Result<CommandOutcome> install_product(const std::string& product) override;
    Result<CommandOutcome> add_firewall_rule(const FirewallRule& rule) override;
    Result<CommandOutcome> set_sql_authentication(SqlAuthenticationMode mode, const std::string& instance) override;

    void close() override { open_ = false; }

private:
    template<typename T>
    Result<T> closed_error() const {
        return Err<T>("Session to " + name_ + " is closed");
    }

    AgentService& service_;
    std::string name_;
    bool open_ = true;
};

} // namespace stratus::agent
