#pragma once

#include "stratus/agent/protocol.hpp"
#include "stratus/core/logging.hpp"
#include "stratus/core/result.hpp"
#include "stratus/netcfg/network_config.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stratus::deploy {

struct FileUpload {
    std::filesystem::path source;
    std::string destination;    ///< path on the web server's agent
};

struct NetworkSettings {
    std::string site;
    std::string subnet;
    std::string address_prefix = netcfg::kDefaultAddressPrefix;
    std::string subnet_prefix;  ///< empty means address_prefix
};

struct CertificateSettings {
    std::filesystem::path path;  ///< PFX file
    std::string password;
};

struct WebTierConfig {
    std::string role = "web";
    std::string host_name;
    std::string image;
    std::string size = "Small";
    std::string agent_uri;
    std::uint16_t agent_port = agent::kDefaultAgentPort;
    std::uint16_t http_port = 80;
    std::string product;        ///< package-installer catalog entry
    std::vector<FileUpload> files;
};

struct SqlTierConfig {
    std::string role = "sql";
    std::string host_name;
    std::string image;
    std::string size = "Medium";
    std::string agent_uri;
    std::uint16_t agent_port = agent::kDefaultAgentPort;
    std::uint16_t sql_port = 1433;
    std::string instance = "MSSQLSERVER";
};

/**
 * @brief Everything one deployment run needs
 *
 * Example deploy.json:
 * {
 *   "service_name": "contoso-web",
 *   "location": "West US",
 *   "affinity_group": "contoso-ag",
 *   "network": {"site": "contoso-vnet", "subnet": "webappsubnet"},
 *   "certificate": {"path": "certs/service.pfx", "password": "..."},
 *   "web": {"image": "win2012-iis", "agent_uri": "http://10.0.0.4:5986",
 *           "product": "WebMatrix", "files": [{"source": "site.zip", "destination": "site/site.zip"}]},
 *   "sql": {"image": "sql2012-std", "agent_uri": "http://10.0.0.5:5986"},
 *   "transfer": {"segment_size": 1048576},
 *   "state_file": "state.json",
 *   "logging": {"level": "info"}
 * }
 */
struct DeploymentConfig {
    std::string service_name;
    std::string location;
    std::string affinity_group;
    std::string label;
    NetworkSettings network;
    std::optional<CertificateSettings> certificate;
    WebTierConfig web;
    SqlTierConfig sql;
    std::size_t segment_size = 1024 * 1024;
    std::filesystem::path state_file;
    std::optional<agent::Credentials> credentials;
    LoggingConfig logging;

    netcfg::SiteRequest site_request() const;
};

Result<DeploymentConfig> deployment_config_from_json(const nlohmann::json& j);

/**
 * @brief Load and validate a deployment file
 *
 * Relative source, certificate and state paths are resolved against the
 * directory of the file.
 */
Result<DeploymentConfig> load_deployment_config(const std::filesystem::path& path);

} // namespace stratus::deploy
