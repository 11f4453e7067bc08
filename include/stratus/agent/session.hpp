#pragma once

#include "stratus/agent/protocol.hpp"
#include "stratus/core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stratus::agent {

/**
 * @brief Open handle to a remote agent
 *
 * Owned by one caller at a time and closed explicitly. Every call is one
 * synchronous round trip; calls after close() fail.
 */
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual const std::string& endpoint() const = 0;
    virtual bool is_open() const = 0;

    virtual Result<std::string> reset_file(const std::string& path) = 0;
    virtual Result<std::string> resolve_path(const std::string& path) = 0;

    /**
     * @return destination size after the append
     */
    virtual Result<std::uint64_t> append(const std::string& path, const std::vector<std::uint8_t>& bytes) = 0;

    virtual Result<RemoteFileInfo> stat(const std::string& path) = 0;

    virtual Result<CommandOutcome> install_product(const std::string& product) = 0;
    virtual Result<CommandOutcome> add_firewall_rule(const FirewallRule& rule) = 0;
    virtual Result<CommandOutcome> set_sql_authentication(SqlAuthenticationMode mode, const std::string& instance) = 0;

    virtual void close() = 0;
};

/**
 * @brief Opens sessions from an agent URI and credentials
 */
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual Result<std::unique_ptr<RemoteSession>> open(const std::string& uri, const Credentials& credentials) = 0;
};

} // namespace stratus::agent
