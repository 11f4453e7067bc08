#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stratus::cloud {

struct AffinityGroup {
    std::string name;
    std::string location;
    std::string label;
};

struct CloudService {
    std::string name;
    std::string affinity_group;
    std::string label;
};

/**
 * @brief Service certificate, uploaded as base64 PFX data
 */
struct Certificate {
    std::string service;
    std::string thumbprint;     ///< SHA-1 of the PFX bytes, hex
    std::string format = "pfx";
    std::string data;           ///< base64
    std::string password;
};

struct InputEndpoint {
    std::string name;
    std::string protocol = "tcp";
    std::uint16_t public_port = 0;   ///< 0 keeps the endpoint internal
    std::uint16_t local_port = 0;
};

struct VirtualMachineSpec {
    std::string service;
    std::string role_name;
    std::string host_name;
    std::string image;
    std::string size;
    std::string admin_username;
    std::string admin_password;
    std::string virtual_network;
    std::string subnet;
    std::string availability_set;
    std::vector<InputEndpoint> endpoints;
};

struct VirtualMachine {
    std::string service;
    std::string role_name;
    std::string host_name;
    std::string image;
    std::string size;
    std::string subnet;
    std::string status;
    std::vector<InputEndpoint> endpoints;
};

} // namespace stratus::cloud
