#include "stratus/deploy/vm_builder.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>

namespace stratus::deploy {
namespace fs = std::filesystem;

namespace {

cloud::VirtualMachineSpec base_spec(const DeploymentConfig& config,
                                    const std::string& role,
                                    const std::string& host_name,
                                    const std::string& image,
                                    const std::string& size,
                                    const agent::Credentials& admin) {
    cloud::VirtualMachineSpec spec;
    spec.service = config.service_name;
    spec.role_name = role;
    spec.host_name = host_name;
    spec.image = image;
    spec.size = size;
    spec.admin_username = admin.username;
    spec.admin_password = admin.password;
    spec.virtual_network = config.network.site;
    spec.subnet = config.network.subnet;
    return spec;
}

Result<std::string> sha1_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        return Err<std::string>(std::string("Failed to allocate digest context"));
    }

    unsigned char digest[EVP_MAX_MD_SIZE] = {0};
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        return Err<std::string>(std::string("Failed to compute certificate thumbprint"));
    }

    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return Ok(oss.str());
}

} // namespace

cloud::VirtualMachineSpec build_sql_vm(const DeploymentConfig& config, const agent::Credentials& admin) {
    const auto& sql = config.sql;
    auto spec = base_spec(config, sql.role, sql.host_name, sql.image, sql.size, admin);
    spec.availability_set = config.service_name + "-" + sql.role;
    spec.endpoints.push_back(cloud::InputEndpoint{"sql", "tcp", 0, sql.sql_port});
    spec.endpoints.push_back(cloud::InputEndpoint{kAgentEndpointName, "tcp", sql.agent_port, sql.agent_port});
    return spec;
}

cloud::VirtualMachineSpec build_web_vm(const DeploymentConfig& config, const agent::Credentials& admin) {
    const auto& web = config.web;
    auto spec = base_spec(config, web.role, web.host_name, web.image, web.size, admin);
    spec.availability_set = config.service_name + "-" + web.role;
    spec.endpoints.push_back(cloud::InputEndpoint{"http", "tcp", web.http_port, web.http_port});
    spec.endpoints.push_back(cloud::InputEndpoint{kAgentEndpointName, "tcp", web.agent_port, web.agent_port});
    return spec;
}

Result<cloud::Certificate> load_certificate(const std::string& service, const CertificateSettings& settings) {
    std::error_code ec;
    if (!fs::is_regular_file(settings.path, ec)) {
        return Err<cloud::Certificate>("Certificate file not found: " + settings.path.string());
    }

    std::ifstream input(settings.path, std::ios::binary);
    if (!input) {
        return Err<cloud::Certificate>("Failed to open certificate file: " + settings.path.string());
    }
    const std::string bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        return Err<cloud::Certificate>("Certificate file is empty: " + settings.path.string());
    }

    auto thumbprint = sha1_hex(bytes);
    if (thumbprint.is_error()) {
        return Forward<cloud::Certificate>(thumbprint);
    }

    cloud::Certificate certificate;
    certificate.service = service;
    certificate.thumbprint = thumbprint.take();
    certificate.format = "pfx";
    certificate.data = agent::base64_encode(bytes);
    certificate.password = settings.password;
    return Ok(std::move(certificate));
}

} // namespace stratus::deploy
