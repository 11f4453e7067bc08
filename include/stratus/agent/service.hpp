#pragma once

#include "stratus/agent/command_runner.hpp"
#include "stratus/agent/protocol.hpp"
#include "stratus/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace stratus::agent {

/**
 * @brief Operations the agent performs on its own host
 *
 * Relative paths resolve against the agent root, which is what "the remote
 * session's path rules" means for the deployer. Command operations only run
 * entries of the command catalog.
 */
class AgentService {
public:
    AgentService(std::filesystem::path root,
                 std::map<std::string, CommandTemplate> commands,
                 CommandRunner& runner);

    const std::filesystem::path& root() const noexcept { return root_; }

    AgentInfo info() const;

    Result<std::string> resolve_path(const std::string& path) const;

    /**
     * @brief Delete any existing file, create the parent directories and
     *        leave an empty file behind
     * @return the resolved path
     */
    Result<std::string> reset_file(const std::string& path) const;

    /**
     * @brief Open in append mode, write, close
     * @return file size after the write
     */
    Result<std::uint64_t> append(const std::string& path, const std::vector<std::uint8_t>& bytes) const;

    Result<RemoteFileInfo> stat(const std::string& path) const;

    Result<CommandOutcome> install_product(const std::string& product);
    Result<CommandOutcome> add_firewall_rule(const FirewallRule& rule);
    Result<CommandOutcome> set_sql_authentication(SqlAuthenticationMode mode, const std::string& instance);

private:
    Result<CommandOutcome> run_catalog_command(const std::string& name,
                                               const std::map<std::string, std::string>& values);

    std::filesystem::path root_;
    std::map<std::string, CommandTemplate> commands_;
    CommandRunner& runner_;
};

} // namespace stratus::agent
