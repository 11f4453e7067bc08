#pragma once

#include "stratus/cloud/cloud_api.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>

namespace stratus::cloud {

/**
 * @brief CloudApi over a JSON state file
 *
 * Stands in for the provider's control plane: dry runs, local rehearsals and
 * tests. The file is read once by open() and rewritten atomically after
 * every successful mutation. An empty path keeps the state in memory only.
 *
 * Enforces the provider's referential rules that the deployer relies on:
 * services need their affinity group, certificates and VMs need their
 * service, and a VM's subnet must exist in the network configuration.
 */
class JsonStateCloud : public CloudApi {
public:
    static Result<std::unique_ptr<JsonStateCloud>> open(const std::filesystem::path& path);

    Result<std::optional<AffinityGroup>> get_affinity_group(const std::string& name) override;
    Result<void> create_affinity_group(const AffinityGroup& group) override;

    Result<std::optional<std::string>> get_network_config() override;
    Result<void> set_network_config(const std::string& xml) override;

    Result<std::optional<CloudService>> get_cloud_service(const std::string& name) override;
    Result<void> create_cloud_service(const CloudService& service) override;

    Result<void> add_certificate(const Certificate& certificate) override;

    Result<std::optional<VirtualMachine>> get_virtual_machine(const std::string& service,
                                                              const std::string& role_name) override;
    Result<void> create_virtual_machine(const VirtualMachineSpec& spec) override;

    const nlohmann::json& state() const noexcept { return state_; }

private:
    JsonStateCloud(std::filesystem::path path, nlohmann::json state);

    Result<void> save() const;
    const nlohmann::json* find_entry(const char* collection, const std::string& name) const;

    std::filesystem::path path_;
    nlohmann::json state_;
};

} // namespace stratus::cloud
