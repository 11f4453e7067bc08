#include "stratus/agent/service.hpp"
#include "stratus/agent/config.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>

namespace stratus::agent {
namespace fs = std::filesystem;
namespace {

std::int64_t to_unix_seconds(fs::file_time_type time) {
    // file_clock has no portable to_sys before C++20
    const auto now_file = fs::file_time_type::clock::now();
    const auto now_sys = std::chrono::system_clock::now();
    const auto sys_time = now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(time - now_file);
    return std::chrono::duration_cast<std::chrono::seconds>(sys_time.time_since_epoch()).count();
}

bool is_valid_token(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (unsigned char c : value) {
        if (c < 0x20 || c == 0x7F) {
            return false;
        }
    }
    return true;
}

} // namespace

AgentService::AgentService(fs::path root,
                           std::map<std::string, CommandTemplate> commands,
                           CommandRunner& runner)
    : root_(fs::absolute(std::move(root)).lexically_normal())
    , commands_(std::move(commands))
    , runner_(runner) {
}

AgentInfo AgentService::info() const {
    return AgentInfo{kProtocolVersion, kAgentName, root_.string()};
}

Result<std::string> AgentService::resolve_path(const std::string& path) const {
    if (path.empty()) {
        return Err<std::string>(std::string("Path must not be empty"));
    }
    fs::path candidate(path);
    if (candidate.is_relative()) {
        candidate = root_ / candidate;
    }
    candidate = candidate.lexically_normal();
    if (!candidate.has_filename()) {
        return Err<std::string>("Path does not name a file: " + path);
    }
    return Ok(candidate.string());
}

Result<std::string> AgentService::reset_file(const std::string& path) const {
    auto resolved = resolve_path(path);
    if (resolved.is_error()) {
        return resolved;
    }
    const fs::path target(resolved.value());

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        return Err<std::string>("Destination is a directory: " + target.string());
    }
    fs::remove(target, ec);
    if (ec) {
        return Err<std::string>("Failed to delete " + target.string() + ": " + ec.message());
    }

    const auto parent = target.parent_path();
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<std::string>("Failed to create directory " + parent.string() + ": " + ec.message());
    }

    std::ofstream create(target, std::ios::binary | std::ios::trunc);
    if (!create) {
        return Err<std::string>("Failed to create " + target.string());
    }

    spdlog::debug("Reset destination {}", target.string());
    return resolved;
}

Result<std::uint64_t> AgentService::append(const std::string& path, const std::vector<std::uint8_t>& bytes) const {
    auto resolved = resolve_path(path);
    if (resolved.is_error()) {
        return Forward<std::uint64_t>(resolved);
    }
    const fs::path target(resolved.value());

    {
        std::ofstream output(target, std::ios::binary | std::ios::app);
        if (!output) {
            return Err<std::uint64_t>("Failed to open " + target.string() + " for append");
        }
        output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!output) {
            return Err<std::uint64_t>("Failed to write " + std::to_string(bytes.size()) + " bytes to " + target.string());
        }
    }

    std::error_code ec;
    const auto size = fs::file_size(target, ec);
    if (ec) {
        return Err<std::uint64_t>("Failed to stat " + target.string() + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<RemoteFileInfo> AgentService::stat(const std::string& path) const {
    auto resolved = resolve_path(path);
    if (resolved.is_error()) {
        return Forward<RemoteFileInfo>(resolved);
    }

    RemoteFileInfo info;
    info.path = resolved.value();

    std::error_code ec;
    const fs::path target(info.path);
    if (!fs::is_regular_file(target, ec)) {
        return Ok(info);
    }

    info.exists = true;
    info.size = fs::file_size(target, ec);
    if (ec) {
        return Err<RemoteFileInfo>("Failed to stat " + info.path + ": " + ec.message());
    }
    const auto modified = fs::last_write_time(target, ec);
    if (!ec) {
        info.modified_time = to_unix_seconds(modified);
    }
    return Ok(info);
}

Result<CommandOutcome> AgentService::install_product(const std::string& product) {
    if (!is_valid_token(product)) {
        return Err<CommandOutcome>(std::string("Product name must be non-empty printable text"));
    }
    return run_catalog_command(kInstallProductCommand, {{"product", product}});
}

Result<CommandOutcome> AgentService::add_firewall_rule(const FirewallRule& rule) {
    if (!is_valid_token(rule.name)) {
        return Err<CommandOutcome>(std::string("Firewall rule name must be non-empty printable text"));
    }
    if (rule.port == 0) {
        return Err<CommandOutcome>("Firewall rule '" + rule.name + "' needs a port");
    }
    return run_catalog_command(kFirewallRuleCommand, {
        {"name", rule.name},
        {"protocol", to_string(rule.protocol)},
        {"port", std::to_string(rule.port)},
    });
}

Result<CommandOutcome> AgentService::set_sql_authentication(SqlAuthenticationMode mode, const std::string& instance) {
    if (!is_valid_token(instance)) {
        return Err<CommandOutcome>(std::string("SQL instance name must be non-empty printable text"));
    }
    return run_catalog_command(kSqlAuthenticationCommand, {
        {"mode", to_string(mode)},
        {"instance", instance},
    });
}

Result<CommandOutcome> AgentService::run_catalog_command(const std::string& name,
                                                         const std::map<std::string, std::string>& values) {
    const auto it = commands_.find(name);
    if (it == commands_.end()) {
        return Err<CommandOutcome>("Command '" + name + "' is not in the agent catalog");
    }

    auto argv = expand_template(it->second, values);
    if (argv.is_error()) {
        return Forward<CommandOutcome>(argv, "Command '" + name + "'");
    }

    spdlog::info("Running catalog command '{}'", name);
    auto outcome = runner_.run(argv.value());
    if (outcome.is_error()) {
        return outcome;
    }
    if (outcome.value().exit_code != 0) {
        return Err<CommandOutcome>("Command '" + name + "' exited with code " +
                                   std::to_string(outcome.value().exit_code) + ": " + outcome.value().output);
    }
    return outcome;
}

} // namespace stratus::agent
