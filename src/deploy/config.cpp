#include "stratus/deploy/config.hpp"

#include <fstream>

namespace stratus::deploy {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<std::uint16_t> read_port(const json& j, const char* key, std::uint16_t fallback) {
    const int port = j.value(key, static_cast<int>(fallback));
    if (port <= 0 || port > 65535) {
        return Err<std::uint16_t>(std::string("'") + key + "' out of range: " + std::to_string(port));
    }
    return Ok(static_cast<std::uint16_t>(port));
}

Result<void> read_web(const json& j, WebTierConfig& web) {
    web.role = j.value("role", web.role);
    web.host_name = j.value("host_name", web.host_name);
    web.image = j.at("image").get<std::string>();
    web.size = j.value("size", web.size);
    web.agent_uri = j.at("agent_uri").get<std::string>();
    web.product = j.value("product", web.product);

    auto agent_port = read_port(j, "agent_port", web.agent_port);
    if (agent_port.is_error()) {
        return Forward<void>(agent_port, "web");
    }
    web.agent_port = agent_port.value();

    auto http_port = read_port(j, "http_port", web.http_port);
    if (http_port.is_error()) {
        return Forward<void>(http_port, "web");
    }
    web.http_port = http_port.value();

    for (const auto& entry : j.value("files", json::array())) {
        FileUpload upload;
        upload.source = entry.at("source").get<std::string>();
        upload.destination = entry.at("destination").get<std::string>();
        if (upload.source.empty() || upload.destination.empty()) {
            return Err<void>(std::string("web.files entries need a source and a destination"));
        }
        web.files.push_back(std::move(upload));
    }
    return Ok();
}

Result<void> read_sql(const json& j, SqlTierConfig& sql) {
    sql.role = j.value("role", sql.role);
    sql.host_name = j.value("host_name", sql.host_name);
    sql.image = j.at("image").get<std::string>();
    sql.size = j.value("size", sql.size);
    sql.agent_uri = j.at("agent_uri").get<std::string>();
    sql.instance = j.value("instance", sql.instance);

    auto agent_port = read_port(j, "agent_port", sql.agent_port);
    if (agent_port.is_error()) {
        return Forward<void>(agent_port, "sql");
    }
    sql.agent_port = agent_port.value();

    auto sql_port = read_port(j, "port", sql.sql_port);
    if (sql_port.is_error()) {
        return Forward<void>(sql_port, "sql");
    }
    sql.sql_port = sql_port.value();
    return Ok();
}

Result<void> validate(const DeploymentConfig& config) {
    if (config.service_name.empty()) {
        return Err<void>(std::string("'service_name' must not be empty"));
    }
    if (config.location.empty()) {
        return Err<void>(std::string("'location' must not be empty"));
    }
    if (config.affinity_group.empty()) {
        return Err<void>(std::string("'affinity_group' must not be empty"));
    }
    if (config.segment_size == 0) {
        return Err<void>(std::string("'transfer.segment_size' must be > 0"));
    }
    if (config.web.role == config.sql.role) {
        return Err<void>("web and sql tiers share the role name '" + config.web.role + "'");
    }
    if (config.web.http_port == config.web.agent_port) {
        return Err<void>(std::string("web.http_port and web.agent_port must differ"));
    }
    if (config.credentials && config.credentials->empty()) {
        return Err<void>(std::string("'credentials' needs a username"));
    }
    return netcfg::validate(config.site_request());
}

} // namespace

netcfg::SiteRequest DeploymentConfig::site_request() const {
    netcfg::SiteRequest request;
    request.name = network.site;
    request.affinity_group = affinity_group;
    request.address_prefix = network.address_prefix;
    request.subnet_name = network.subnet;
    request.subnet_prefix = network.subnet_prefix;
    return request;
}

Result<DeploymentConfig> deployment_config_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<DeploymentConfig>(std::string("Deployment configuration must be a JSON object"));
    }

    DeploymentConfig config;
    try {
        config.service_name = j.at("service_name").get<std::string>();
        config.location = j.at("location").get<std::string>();
        config.affinity_group = j.at("affinity_group").get<std::string>();
        config.label = j.value("label", config.service_name);

        const auto& network = j.at("network");
        config.network.site = network.at("site").get<std::string>();
        config.network.subnet = network.at("subnet").get<std::string>();
        config.network.address_prefix = network.value("address_prefix", config.network.address_prefix);
        config.network.subnet_prefix = network.value("subnet_prefix", config.network.subnet_prefix);

        if (j.contains("certificate") && !j.at("certificate").is_null()) {
            const auto& certificate = j.at("certificate");
            CertificateSettings settings;
            settings.path = certificate.at("path").get<std::string>();
            settings.password = certificate.value("password", std::string());
            config.certificate = settings;
        }

        auto web = read_web(j.at("web"), config.web);
        if (web.is_error()) {
            return Forward<DeploymentConfig>(web);
        }
        auto sql = read_sql(j.at("sql"), config.sql);
        if (sql.is_error()) {
            return Forward<DeploymentConfig>(sql);
        }

        if (j.contains("transfer")) {
            config.segment_size = j.at("transfer").value("segment_size", config.segment_size);
        }
        config.state_file = j.value("state_file", std::string());

        if (j.contains("credentials") && !j.at("credentials").is_null()) {
            const auto& credentials = j.at("credentials");
            config.credentials = agent::Credentials{credentials.at("username").get<std::string>(),
                                                    credentials.value("password", std::string())};
        }
    } catch (const json::exception& e) {
        return Err<DeploymentConfig>(std::string("Invalid deployment configuration: ") + e.what());
    }

    if (config.web.host_name.empty()) {
        config.web.host_name = config.service_name + "-" + config.web.role;
    }
    if (config.sql.host_name.empty()) {
        config.sql.host_name = config.service_name + "-" + config.sql.role;
    }

    auto logging = logging_config_from_json(j.contains("logging") ? j.at("logging") : json());
    if (logging.is_error()) {
        return Forward<DeploymentConfig>(logging);
    }
    config.logging = logging.value();

    auto valid = validate(config);
    if (valid.is_error()) {
        return Forward<DeploymentConfig>(valid);
    }
    return Ok(config);
}

Result<DeploymentConfig> load_deployment_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<DeploymentConfig>("Failed to open deployment configuration: " + path.string());
    }

    json j;
    try {
        input >> j;
    } catch (const json::parse_error& e) {
        return Err<DeploymentConfig>("Failed to parse " + path.string() + ": " + e.what());
    }

    auto loaded = deployment_config_from_json(j);
    if (loaded.is_error()) {
        return Forward<DeploymentConfig>(loaded, path.string());
    }

    DeploymentConfig config = loaded.take();
    const fs::path base = path.parent_path();
    for (auto& upload : config.web.files) {
        if (upload.source.is_relative()) {
            upload.source = base / upload.source;
        }
    }
    if (config.certificate && config.certificate->path.is_relative()) {
        config.certificate->path = base / config.certificate->path;
    }
    if (!config.state_file.empty() && config.state_file.is_relative()) {
        config.state_file = base / config.state_file;
    }
    return Ok(config);
}

} // namespace stratus::deploy
