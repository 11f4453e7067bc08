#pragma once

#include "stratus/cloud/types.hpp"
#include "stratus/core/result.hpp"

#include <optional>
#include <string>

namespace stratus::cloud {

/**
 * @brief The slice of the cloud management API the deployer consumes
 *
 * Queries distinguish "absent" (empty optional) from failure (error).
 * Creates fail when the resource already exists or the provider refuses,
 * with the provider's diagnostic in the error.
 */
class CloudApi {
public:
    virtual ~CloudApi() = default;

    virtual Result<std::optional<AffinityGroup>> get_affinity_group(const std::string& name) = 0;
    virtual Result<void> create_affinity_group(const AffinityGroup& group) = 0;

    // The subscription-wide network configuration XML; empty when none was ever set
    virtual Result<std::optional<std::string>> get_network_config() = 0;
    virtual Result<void> set_network_config(const std::string& xml) = 0;

    virtual Result<std::optional<CloudService>> get_cloud_service(const std::string& name) = 0;
    virtual Result<void> create_cloud_service(const CloudService& service) = 0;

    virtual Result<void> add_certificate(const Certificate& certificate) = 0;

    virtual Result<std::optional<VirtualMachine>> get_virtual_machine(const std::string& service,
                                                                      const std::string& role_name) = 0;
    virtual Result<void> create_virtual_machine(const VirtualMachineSpec& spec) = 0;
};

} // namespace stratus::cloud
