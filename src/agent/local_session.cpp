#include "stratus/agent/local_session.hpp"

namespace stratus::agent {

LocalAgentSession::LocalAgentSession(AgentService& service, std::string name)
    : service_(service)
    , name_(std::move(name)) {
}

Result<std::string> LocalAgentSession::reset_file(const std::string& path) {
    if (!open_) {
        return closed_error<std::string>();
    }
    return service_.reset_file(path);
}

Result<std::string> LocalAgentSession::resolve_path(const std::string& path) {
    if (!open_) {
        return closed_error<std::string>();
    }
    return service_.resolve_path(path);
}

Result<std::uint64_t> LocalAgentSession::append(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    if (!open_) {
        return closed_error<std::uint64_t>();
    }
    return service_.append(path, bytes);
}

Result<RemoteFileInfo> LocalAgentSession::stat(const std::string& path) {
    if (!open_) {
        return closed_error<RemoteFileInfo>();
    }
    return service_.stat(path);
}

Result<CommandOutcome> LocalAgentSession::install_product(const std::string& product) {
    if (!open_) {
        return closed_error<CommandOutcome>();
    }
    return service_.install_product(product);
}

Result<CommandOutcome> LocalAgentSession::add_firewall_rule(const FirewallRule& rule) {
    if (!open_) {
        return closed_error<CommandOutcome>();
    }
    return service_.add_firewall_rule(rule);
}

Result<CommandOutcome> LocalAgentSession::set_sql_authentication(SqlAuthenticationMode mode, const std::string& instance) {
    if (!open_) {
        return closed_error<CommandOutcome>();
    }
    return service_.set_sql_authentication(mode, instance);
}

} // namespace stratus::agent
