#pragma once

#include "stratus/core/result.hpp"

#include <string>
#include <vector>

namespace stratus::netcfg {

constexpr const char* kNetworkConfigNamespace =
    "http://schemas.microsoft.com/ServiceHosting/2011/07/NetworkConfiguration";
constexpr const char* kDefaultAddressPrefix = "10.0.0.0/8";

struct DnsServer {
    std::string name;
    std::string address;
};

struct Subnet {
    std::string name;
    std::string address_prefix;
};

struct VirtualNetworkSite {
    std::string name;
    std::string affinity_group;
    std::vector<std::string> address_prefixes;
    std::vector<Subnet> subnets;
    std::vector<std::string> dns_server_refs;
};

/**
 * @brief Typed view of the NetworkConfiguration document
 *
 * Only the parts the deployer reads or writes are modelled; sites keep their
 * order so serialize(parse(x)) is stable.
 */
struct NetworkConfiguration {
    std::string xmlns = kNetworkConfigNamespace;
    std::vector<DnsServer> dns_servers;
    std::vector<VirtualNetworkSite> sites;

    const VirtualNetworkSite* find_site(const std::string& name) const;
};

bool operator==(const Subnet& a, const Subnet& b);
bool operator==(const VirtualNetworkSite& a, const VirtualNetworkSite& b);
bool operator==(const NetworkConfiguration& a, const NetworkConfiguration& b);
inline bool operator!=(const NetworkConfiguration& a, const NetworkConfiguration& b) { return !(a == b); }

/**
 * @brief Desired state of one virtual network site
 */
struct SiteRequest {
    std::string name;
    std::string affinity_group;
    std::string address_prefix = kDefaultAddressPrefix;
    std::string subnet_name;
    std::string subnet_prefix;   ///< empty means address_prefix
};

Result<void> validate(const SiteRequest& request);

/**
 * @brief The document used when the control plane has no configuration yet
 */
NetworkConfiguration blank_network_config();

Result<NetworkConfiguration> parse_network_config(const std::string& xml);

std::string serialize_network_config(const NetworkConfiguration& config);

/**
 * @brief Find-or-insert the requested site
 *
 * An existing site gets the requested affinity group and a single address
 * prefix; the named subnet is updated or appended, other subnets stay. A
 * missing site is appended with exactly one subnet. The input is not
 * modified.
 */
NetworkConfiguration merge_site(const NetworkConfiguration& config, const SiteRequest& request);

} // namespace stratus::netcfg
