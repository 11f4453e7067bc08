#include "stratus/netcfg/network_config.hpp"

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <algorithm>
#include <sstream>

namespace stratus::netcfg {
namespace pt = boost::property_tree;

namespace {

constexpr const char* kRoot = "NetworkConfiguration";
constexpr const char* kVnetConfig = "VirtualNetworkConfiguration";

std::string attribute(const pt::ptree& node, const std::string& name) {
    return node.get<std::string>("<xmlattr>." + name, "");
}

std::vector<std::string> prefixes_of(const pt::ptree& node) {
    std::vector<std::string> prefixes;
    for (const auto& [key, child] : node) {
        if (key == "AddressPrefix") {
            prefixes.push_back(child.get_value<std::string>());
        }
    }
    return prefixes;
}

Result<VirtualNetworkSite> read_site(const pt::ptree& node) {
    VirtualNetworkSite site;
    site.name = attribute(node, "name");
    if (site.name.empty()) {
        return Err<VirtualNetworkSite>(std::string("VirtualNetworkSite without a name attribute"));
    }
    site.affinity_group = attribute(node, "AffinityGroup");

    if (auto space = node.get_child_optional("AddressSpace")) {
        site.address_prefixes = prefixes_of(*space);
    }

    if (auto subnets = node.get_child_optional("Subnets")) {
        for (const auto& [key, child] : *subnets) {
            if (key != "Subnet") {
                continue;
            }
            Subnet subnet;
            subnet.name = attribute(child, "name");
            subnet.address_prefix = child.get<std::string>("AddressPrefix", "");
            if (subnet.name.empty()) {
                return Err<VirtualNetworkSite>("Subnet without a name in site " + site.name);
            }
            site.subnets.push_back(std::move(subnet));
        }
    }

    if (auto refs = node.get_child_optional("DnsServersRef")) {
        for (const auto& [key, child] : *refs) {
            if (key == "DnsServerRef") {
                site.dns_server_refs.push_back(attribute(child, "name"));
            }
        }
    }
    return Ok(std::move(site));
}

pt::ptree write_site(const VirtualNetworkSite& site) {
    pt::ptree node;
    node.put("<xmlattr>.name", site.name);
    if (!site.affinity_group.empty()) {
        node.put("<xmlattr>.AffinityGroup", site.affinity_group);
    }

    pt::ptree space;
    for (const auto& prefix : site.address_prefixes) {
        space.add("AddressPrefix", prefix);
    }
    node.add_child("AddressSpace", space);

    pt::ptree subnets;
    for (const auto& subnet : site.subnets) {
        pt::ptree child;
        child.put("<xmlattr>.name", subnet.name);
        child.put("AddressPrefix", subnet.address_prefix);
        subnets.add_child("Subnet", child);
    }
    node.add_child("Subnets", subnets);

    if (!site.dns_server_refs.empty()) {
        pt::ptree refs;
        for (const auto& ref : site.dns_server_refs) {
            pt::ptree child;
            child.put("<xmlattr>.name", ref);
            refs.add_child("DnsServerRef", child);
        }
        node.add_child("DnsServersRef", refs);
    }
    return node;
}

} // namespace

const VirtualNetworkSite* NetworkConfiguration::find_site(const std::string& name) const {
    const auto it = std::find_if(sites.begin(), sites.end(),
                                 [&name](const VirtualNetworkSite& site) { return site.name == name; });
    return it == sites.end() ? nullptr : &*it;
}

bool operator==(const Subnet& a, const Subnet& b) {
    return a.name == b.name && a.address_prefix == b.address_prefix;
}

bool operator==(const VirtualNetworkSite& a, const VirtualNetworkSite& b) {
    return a.name == b.name && a.affinity_group == b.affinity_group &&
           a.address_prefixes == b.address_prefixes && a.subnets == b.subnets &&
           a.dns_server_refs == b.dns_server_refs;
}

bool operator==(const NetworkConfiguration& a, const NetworkConfiguration& b) {
    const bool dns_equal = std::equal(a.dns_servers.begin(), a.dns_servers.end(),
                                      b.dns_servers.begin(), b.dns_servers.end(),
                                      [](const DnsServer& x, const DnsServer& y) {
                                          return x.name == y.name && x.address == y.address;
                                      });
    return a.xmlns == b.xmlns && dns_equal && a.sites == b.sites;
}

Result<void> validate(const SiteRequest& request) {
    if (request.name.empty()) {
        return Err<void>(std::string("Network site name must not be empty"));
    }
    if (request.affinity_group.empty()) {
        return Err<void>("Network site '" + request.name + "' needs an affinity group");
    }
    if (request.address_prefix.find('/') == std::string::npos) {
        return Err<void>("Address prefix '" + request.address_prefix + "' is not in CIDR notation");
    }
    if (request.subnet_name.empty()) {
        return Err<void>("Network site '" + request.name + "' needs a subnet name");
    }
    if (!request.subnet_prefix.empty() && request.subnet_prefix.find('/') == std::string::npos) {
        return Err<void>("Subnet prefix '" + request.subnet_prefix + "' is not in CIDR notation");
    }
    return Ok();
}

NetworkConfiguration blank_network_config() {
    return NetworkConfiguration{};
}

Result<NetworkConfiguration> parse_network_config(const std::string& xml) {
    pt::ptree tree;
    try {
        std::istringstream stream(xml);
        pt::read_xml(stream, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        return Err<NetworkConfiguration>(std::string("Malformed network configuration: ") + e.what());
    }

    auto root = tree.get_child_optional(kRoot);
    if (!root) {
        return Err<NetworkConfiguration>(std::string("Network configuration has no NetworkConfiguration root"));
    }

    NetworkConfiguration config;
    config.xmlns = attribute(*root, "xmlns");
    if (config.xmlns.empty()) {
        config.xmlns = kNetworkConfigNamespace;
    }

    auto vnet = root->get_child_optional(kVnetConfig);
    if (!vnet) {
        return Ok(std::move(config));
    }

    if (auto servers = vnet->get_child_optional("Dns.DnsServers")) {
        for (const auto& [key, child] : *servers) {
            if (key == "DnsServer") {
                config.dns_servers.push_back(DnsServer{attribute(child, "name"), attribute(child, "IPAddress")});
            }
        }
    }

    if (auto sites = vnet->get_child_optional("VirtualNetworkSites")) {
        for (const auto& [key, child] : *sites) {
            if (key != "VirtualNetworkSite") {
                continue;
            }
            auto site = read_site(child);
            if (site.is_error()) {
                return Forward<NetworkConfiguration>(site);
            }
            config.sites.push_back(site.take());
        }
    }

    return Ok(std::move(config));
}

std::string serialize_network_config(const NetworkConfiguration& config) {
    pt::ptree root;
    root.put("<xmlattr>.xmlns", config.xmlns);

    pt::ptree vnet;
    pt::ptree dns;
    if (!config.dns_servers.empty()) {
        pt::ptree servers;
        for (const auto& server : config.dns_servers) {
            pt::ptree child;
            child.put("<xmlattr>.name", server.name);
            child.put("<xmlattr>.IPAddress", server.address);
            servers.add_child("DnsServer", child);
        }
        dns.add_child("DnsServers", servers);
    }
    vnet.add_child("Dns", dns);

    pt::ptree sites;
    for (const auto& site : config.sites) {
        sites.add_child("VirtualNetworkSite", write_site(site));
    }
    vnet.add_child("VirtualNetworkSites", sites);
    root.add_child(kVnetConfig, vnet);

    pt::ptree document;
    document.add_child(kRoot, root);

    std::ostringstream out;
    pt::write_xml(out, document, pt::xml_writer_make_settings<std::string>(' ', 2));
    return out.str();
}

NetworkConfiguration merge_site(const NetworkConfiguration& config, const SiteRequest& request) {
    NetworkConfiguration merged = config;
    const std::string subnet_prefix = request.subnet_prefix.empty() ? request.address_prefix : request.subnet_prefix;

    auto it = std::find_if(merged.sites.begin(), merged.sites.end(),
                           [&request](const VirtualNetworkSite& site) { return site.name == request.name; });

    if (it == merged.sites.end()) {
        VirtualNetworkSite site;
        site.name = request.name;
        site.affinity_group = request.affinity_group;
        site.address_prefixes = {request.address_prefix};
        site.subnets = {Subnet{request.subnet_name, subnet_prefix}};
        merged.sites.push_back(std::move(site));
        return merged;
    }

    it->affinity_group = request.affinity_group;
    it->address_prefixes = {request.address_prefix};

    auto subnet = std::find_if(it->subnets.begin(), it->subnets.end(),
                               [&request](const Subnet& s) { return s.name == request.subnet_name; });
    if (subnet == it->subnets.end()) {
        it->subnets.push_back(Subnet{request.subnet_name, subnet_prefix});
    } else {
        subnet->address_prefix = subnet_prefix;
    }
    return merged;
}

} // namespace stratus::netcfg
