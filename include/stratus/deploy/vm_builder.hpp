#pragma once

#include "stratus/agent/protocol.hpp"
#include "stratus/cloud/types.hpp"
#include "stratus/core/result.hpp"
#include "stratus/deploy/config.hpp"

namespace stratus::deploy {

constexpr const char* kAgentEndpointName = "stratus-agent";

/**
 * @brief Back-end VM: SQL endpoint kept internal, agent endpoint published
 */
cloud::VirtualMachineSpec build_sql_vm(const DeploymentConfig& config, const agent::Credentials& admin);

/**
 * @brief Front-end VM: HTTP and agent endpoints published
 */
cloud::VirtualMachineSpec build_web_vm(const DeploymentConfig& config, const agent::Credentials& admin);

/**
 * @brief Read a PFX file and prepare it for upload
 *
 * The thumbprint is the upper-case hex SHA-1 of the file bytes.
 */
Result<cloud::Certificate> load_certificate(const std::string& service, const CertificateSettings& settings);

} // namespace stratus::deploy
