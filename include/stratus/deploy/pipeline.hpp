#pragma once

#include "stratus/agent/session.hpp"
#include "stratus/cloud/cloud_api.hpp"
#include "stratus/core/result.hpp"
#include "stratus/deploy/config.hpp"
#include "stratus/deploy/credentials.hpp"
#include "stratus/events/event_bus.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stratus::deploy {

/**
 * @brief The linear provisioning sequence of a two-tier deployment
 *
 * 1. the cloud service must not exist yet
 * 2. ensure the affinity group
 * 3. ensure the network site and subnet
 * 4. create the cloud service
 * 5. upload the service certificate (when configured)
 * 6. create the SQL VM, then the web VM
 * 7. SQL post-configuration: mixed-mode authentication, firewall rule
 * 8. web post-configuration: file transfers, product install, firewall rule
 *
 * Every step failure ends the run; nothing is rolled back. Credentials are
 * requested once, on the first step that needs them.
 */
class DeploymentPipeline {
public:
    DeploymentPipeline(DeploymentConfig config,
                       cloud::CloudApi& cloud,
                       agent::SessionFactory& sessions,
                       CredentialProvider& credentials,
                       events::EventBus& bus);

    Result<void> run();

private:
    struct Step {
        std::string name;
        std::function<Result<void>()> action;
    };

    std::vector<Step> build_steps();

    Result<void> check_service_absent();
    Result<void> ensure_affinity_group();
    Result<void> ensure_network_site();
    Result<void> create_cloud_service();
    Result<void> upload_certificate();
    Result<void> create_virtual_machines();
    Result<void> configure_sql_server();
    Result<void> configure_web_server();

    Result<agent::Credentials> admin_credentials();
    Result<std::unique_ptr<agent::RemoteSession>> open_session(const std::string& uri);

    DeploymentConfig config_;
    cloud::CloudApi& cloud_;
    agent::SessionFactory& sessions_;
    CredentialProvider& credential_provider_;
    events::EventBus& bus_;
    std::optional<agent::Credentials> credentials_;
};

} // namespace stratus::deploy
