#include "stratus/cloud/state_cloud.hpp"
#include "stratus/netcfg/network_config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace stratus::cloud {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kAffinityGroups = "affinity_groups";
constexpr const char* kCloudServices = "cloud_services";
constexpr const char* kCertificates = "certificates";
constexpr const char* kVirtualMachines = "virtual_machines";
constexpr const char* kNetworkConfig = "network_config";

json empty_state() {
    json state;
    state[kAffinityGroups] = json::array();
    state[kCloudServices] = json::array();
    state[kCertificates] = json::array();
    state[kVirtualMachines] = json::array();
    state[kNetworkConfig] = nullptr;
    return state;
}

json endpoint_to_json(const InputEndpoint& endpoint) {
    return json{{"name", endpoint.name},
                {"protocol", endpoint.protocol},
                {"public_port", endpoint.public_port},
                {"local_port", endpoint.local_port}};
}

// Field readers for hand-edited state: a field of the wrong type reads as absent
std::string text_field(const json& entry, const char* key, const std::string& fallback = {}) {
    const auto it = entry.find(key);
    return it != entry.end() && it->is_string() ? it->get<std::string>() : fallback;
}

std::uint16_t port_field(const json& entry, const char* key) {
    const auto it = entry.find(key);
    if (it == entry.end() || !it->is_number_unsigned() || it->get<std::uint64_t>() > 65535) {
        return 0;
    }
    return static_cast<std::uint16_t>(it->get<std::uint64_t>());
}

InputEndpoint endpoint_from_json(const json& j) {
    InputEndpoint endpoint;
    endpoint.name = text_field(j, "name");
    endpoint.protocol = text_field(j, "protocol", "tcp");
    endpoint.public_port = port_field(j, "public_port");
    endpoint.local_port = port_field(j, "local_port");
    return endpoint;
}

} // namespace

Result<std::unique_ptr<JsonStateCloud>> JsonStateCloud::open(const fs::path& path) {
    json state = empty_state();

    std::error_code ec;
    if (!path.empty() && fs::exists(path, ec)) {
        std::ifstream input(path);
        if (!input) {
            return Err<std::unique_ptr<JsonStateCloud>>("Failed to open state file: " + path.string());
        }
        try {
            json loaded;
            input >> loaded;
            if (!loaded.is_object()) {
                return Err<std::unique_ptr<JsonStateCloud>>("State file is not a JSON object: " + path.string());
            }
            // Missing collections are treated as empty
            for (auto& [key, value] : loaded.items()) {
                state[key] = value;
            }
            for (const char* collection : {kAffinityGroups, kCloudServices, kCertificates, kVirtualMachines}) {
                if (!state[collection].is_array()) {
                    return Err<std::unique_ptr<JsonStateCloud>>("State file " + path.string() + ": '" +
                                                                collection + "' must be an array");
                }
            }
            if (!state[kNetworkConfig].is_null() && !state[kNetworkConfig].is_string()) {
                return Err<std::unique_ptr<JsonStateCloud>>("State file " + path.string() + ": '" +
                                                            kNetworkConfig + "' must be null or an XML string");
            }
        } catch (const json::parse_error& e) {
            return Err<std::unique_ptr<JsonStateCloud>>("Failed to parse state file " + path.string() + ": " + e.what());
        }
        spdlog::debug("Loaded control-plane state from {}", path.string());
    }

    return Ok(std::unique_ptr<JsonStateCloud>(new JsonStateCloud(path, std::move(state))));
}

JsonStateCloud::JsonStateCloud(fs::path path, json state)
    : path_(std::move(path))
    , state_(std::move(state)) {
}

Result<std::optional<AffinityGroup>> JsonStateCloud::get_affinity_group(const std::string& name) {
    const json* entry = find_entry(kAffinityGroups, name);
    if (!entry) {
        return Ok(std::optional<AffinityGroup>());
    }
    AffinityGroup group;
    group.name = text_field(*entry, "name");
    group.location = text_field(*entry, "location");
    group.label = text_field(*entry, "label");
    return Ok(std::optional<AffinityGroup>(std::move(group)));
}

Result<void> JsonStateCloud::create_affinity_group(const AffinityGroup& group) {
    if (group.name.empty() || group.location.empty()) {
        return Err<void>(std::string("Affinity group needs a name and a location"));
    }
    if (find_entry(kAffinityGroups, group.name)) {
        return Err<void>("Affinity group '" + group.name + "' already exists");
    }
    state_[kAffinityGroups].push_back(json{{"name", group.name},
                                           {"location", group.location},
                                           {"label", group.label}});
    return save();
}

Result<std::optional<std::string>> JsonStateCloud::get_network_config() {
    const auto& xml = state_[kNetworkConfig];
    if (xml.is_null()) {
        return Ok(std::optional<std::string>());
    }
    return Ok(std::optional<std::string>(xml.get<std::string>()));
}

Result<void> JsonStateCloud::set_network_config(const std::string& xml) {
    auto parsed = netcfg::parse_network_config(xml);
    if (parsed.is_error()) {
        return Forward<void>(parsed, "Rejected network configuration");
    }
    for (const auto& site : parsed.value().sites) {
        if (!site.affinity_group.empty() && !find_entry(kAffinityGroups, site.affinity_group)) {
            return Err<void>("Network site '" + site.name + "' references unknown affinity group '" +
                             site.affinity_group + "'");
        }
    }
    state_[kNetworkConfig] = xml;
    return save();
}

Result<std::optional<CloudService>> JsonStateCloud::get_cloud_service(const std::string& name) {
    const json* entry = find_entry(kCloudServices, name);
    if (!entry) {
        return Ok(std::optional<CloudService>());
    }
    CloudService service;
    service.name = text_field(*entry, "name");
    service.affinity_group = text_field(*entry, "affinity_group");
    service.label = text_field(*entry, "label");
    return Ok(std::optional<CloudService>(std::move(service)));
}

Result<void> JsonStateCloud::create_cloud_service(const CloudService& service) {
    if (service.name.empty()) {
        return Err<void>(std::string("Cloud service needs a name"));
    }
    if (find_entry(kCloudServices, service.name)) {
        return Err<void>("Cloud service '" + service.name + "' already exists");
    }
    if (!find_entry(kAffinityGroups, service.affinity_group)) {
        return Err<void>("Cloud service '" + service.name + "' references unknown affinity group '" +
                         service.affinity_group + "'");
    }
    state_[kCloudServices].push_back(json{{"name", service.name},
                                          {"affinity_group", service.affinity_group},
                                          {"label", service.label}});
    return save();
}

Result<void> JsonStateCloud::add_certificate(const Certificate& certificate) {
    if (!find_entry(kCloudServices, certificate.service)) {
        return Err<void>("Certificate targets unknown cloud service '" + certificate.service + "'");
    }
    if (certificate.data.empty()) {
        return Err<void>("Certificate for '" + certificate.service + "' has no data");
    }
    for (const auto& entry : state_[kCertificates]) {
        if (!entry.is_object()) {
            continue;
        }
        if (text_field(entry, "service") == certificate.service &&
            text_field(entry, "thumbprint") == certificate.thumbprint) {
            return Err<void>("Certificate " + certificate.thumbprint + " already uploaded to '" +
                             certificate.service + "'");
        }
    }
    // The password is consumed by the provider and never stored
    state_[kCertificates].push_back(json{{"service", certificate.service},
                                         {"thumbprint", certificate.thumbprint},
                                         {"format", certificate.format},
                                         {"data", certificate.data}});
    return save();
}

Result<std::optional<VirtualMachine>> JsonStateCloud::get_virtual_machine(const std::string& service,
                                                                          const std::string& role_name) {
    for (const auto& entry : state_[kVirtualMachines]) {
        if (!entry.is_object()) {
            continue;
        }
        if (text_field(entry, "service") != service ||
            text_field(entry, "role_name") != role_name) {
            continue;
        }
        VirtualMachine vm;
        vm.service = service;
        vm.role_name = role_name;
        vm.host_name = text_field(entry, "host_name");
        vm.image = text_field(entry, "image");
        vm.size = text_field(entry, "size");
        vm.subnet = text_field(entry, "subnet");
        vm.status = text_field(entry, "status");
        const auto endpoints = entry.find("endpoints");
        if (endpoints != entry.end() && endpoints->is_array()) {
            for (const auto& endpoint : *endpoints) {
                if (endpoint.is_object()) {
                    vm.endpoints.push_back(endpoint_from_json(endpoint));
                }
            }
        }
        return Ok(std::optional<VirtualMachine>(std::move(vm)));
    }
    return Ok(std::optional<VirtualMachine>());
}

Result<void> JsonStateCloud::create_virtual_machine(const VirtualMachineSpec& spec) {
    if (!find_entry(kCloudServices, spec.service)) {
        return Err<void>("Virtual machine '" + spec.role_name + "' targets unknown cloud service '" +
                         spec.service + "'");
    }
    if (spec.role_name.empty() || spec.image.empty() || spec.size.empty()) {
        return Err<void>(std::string("Virtual machine needs a role name, an image and a size"));
    }
    if (spec.admin_username.empty() || spec.admin_password.empty()) {
        return Err<void>("Virtual machine '" + spec.role_name + "' needs admin credentials");
    }

    auto existing = get_virtual_machine(spec.service, spec.role_name);
    if (existing.is_error()) {
        return Forward<void>(existing);
    }
    if (existing.value()) {
        return Err<void>("Virtual machine '" + spec.role_name + "' already exists in '" + spec.service + "'");
    }

    if (!spec.subnet.empty()) {
        const auto& xml = state_[kNetworkConfig];
        if (xml.is_null()) {
            return Err<void>("Subnet '" + spec.subnet + "' requested but no network configuration exists");
        }
        auto config = netcfg::parse_network_config(xml.get<std::string>());
        if (config.is_error()) {
            return Forward<void>(config);
        }
        const auto* site = config.value().find_site(spec.virtual_network);
        if (!site) {
            return Err<void>("Unknown virtual network '" + spec.virtual_network + "'");
        }
        const bool has_subnet = std::any_of(site->subnets.begin(), site->subnets.end(),
                                            [&spec](const netcfg::Subnet& s) { return s.name == spec.subnet; });
        if (!has_subnet) {
            return Err<void>("Subnet '" + spec.subnet + "' not found in virtual network '" +
                             spec.virtual_network + "'");
        }
    }

    json endpoints = json::array();
    for (const auto& endpoint : spec.endpoints) {
        endpoints.push_back(endpoint_to_json(endpoint));
    }

    state_[kVirtualMachines].push_back(json{{"service", spec.service},
                                            {"role_name", spec.role_name},
                                            {"host_name", spec.host_name},
                                            {"image", spec.image},
                                            {"size", spec.size},
                                            {"virtual_network", spec.virtual_network},
                                            {"subnet", spec.subnet},
                                            {"availability_set", spec.availability_set},
                                            {"status", "ReadyRole"},
                                            {"endpoints", endpoints}});
    return save();
}

Result<void> JsonStateCloud::save() const {
    if (path_.empty()) {
        return Ok();
    }

    const fs::path temp = path_.string() + ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            return Err<void>("Failed to write state file: " + temp.string());
        }
        output << state_.dump(2) << '\n';
        if (!output) {
            return Err<void>("Failed to write state file: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path_, ec);
    if (ec) {
        return Err<void>("Failed to replace state file " + path_.string() + ": " + ec.message());
    }
    return Ok();
}

const json* JsonStateCloud::find_entry(const char* collection, const std::string& name) const {
    const auto it = state_.find(collection);
    if (it == state_.end() || !it->is_array()) {
        return nullptr;
    }
    for (const auto& entry : *it) {
        if (entry.is_object() && text_field(entry, "name") == name) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace stratus::cloud
