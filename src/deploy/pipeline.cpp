#include "stratus/deploy/pipeline.hpp"
#include "stratus/cloud/convergence.hpp"
#include "stratus/deploy/vm_builder.hpp"
#include "stratus/events/events.hpp"
#include "stratus/transfer/chunked_transfer.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace stratus::deploy {

namespace {

// Closes the session on every exit path of a post-configuration step
class SessionGuard {
public:
    explicit SessionGuard(agent::RemoteSession& session) : session_(session) {}
    ~SessionGuard() { session_.close(); }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

private:
    agent::RemoteSession& session_;
};

void log_command_output(const char* what, const agent::CommandOutcome& outcome) {
    if (!outcome.output.empty()) {
        spdlog::debug("{} output:\n{}", what, outcome.output);
    }
}

} // namespace

DeploymentPipeline::DeploymentPipeline(DeploymentConfig config,
                                       cloud::CloudApi& cloud,
                                       agent::SessionFactory& sessions,
                                       CredentialProvider& credentials,
                                       events::EventBus& bus)
    : config_(std::move(config))
    , cloud_(cloud)
    , sessions_(sessions)
    , credential_provider_(credentials)
    , bus_(bus) {
}

std::vector<DeploymentPipeline::Step> DeploymentPipeline::build_steps() {
    std::vector<Step> steps;
    steps.push_back({"check cloud service", [this] { return check_service_absent(); }});
    steps.push_back({"ensure affinity group", [this] { return ensure_affinity_group(); }});
    steps.push_back({"ensure network site", [this] { return ensure_network_site(); }});
    steps.push_back({"create cloud service", [this] { return create_cloud_service(); }});
    if (config_.certificate) {
        steps.push_back({"upload certificate", [this] { return upload_certificate(); }});
    }
    steps.push_back({"create virtual machines", [this] { return create_virtual_machines(); }});
    steps.push_back({"configure sql server", [this] { return configure_sql_server(); }});
    steps.push_back({"configure web server", [this] { return configure_web_server(); }});
    return steps;
}

Result<void> DeploymentPipeline::run() {
    const auto started_at = std::chrono::steady_clock::now();
    auto steps = build_steps();

    spdlog::info("Deploying '{}' to {} ({} steps)", config_.service_name, config_.location, steps.size());

    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        bus_.emit(events::StepStartedEvent{i, steps.size(), step.name});
        const auto step_started = std::chrono::steady_clock::now();

        auto result = step.action();
        if (result.is_error()) {
            bus_.emit(events::DeploymentFailedEvent{config_.service_name, step.name, result.error()});
            return Forward<void>(result, step.name);
        }

        bus_.emit(events::StepCompletedEvent{
            i, step.name,
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - step_started)});
    }

    bus_.emit(events::DeploymentCompletedEvent{
        config_.service_name,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at)});
    return Ok();
}

Result<void> DeploymentPipeline::check_service_absent() {
    auto existing = cloud_.get_cloud_service(config_.service_name);
    if (existing.is_error()) {
        return Forward<void>(existing, "Failed to query cloud service");
    }
    if (existing.value()) {
        return Err<void>("Cloud service '" + config_.service_name + "' already exists");
    }
    return Ok();
}

Result<void> DeploymentPipeline::ensure_affinity_group() {
    cloud::AffinityGroup group{config_.affinity_group, config_.location, config_.affinity_group};
    auto outcome = cloud::ensure_affinity_group(cloud_, group, &bus_);
    if (outcome.is_error()) {
        return Forward<void>(outcome);
    }
    spdlog::debug("Affinity group '{}': {}", group.name, cloud::to_string(outcome.value()));
    return Ok();
}

Result<void> DeploymentPipeline::ensure_network_site() {
    auto outcome = cloud::ensure_network_site(cloud_, config_.site_request(), &bus_);
    if (outcome.is_error()) {
        return Forward<void>(outcome);
    }
    spdlog::debug("Network site '{}': {}", config_.network.site, cloud::to_string(outcome.value()));
    return Ok();
}

Result<void> DeploymentPipeline::create_cloud_service() {
    cloud::CloudService service{config_.service_name, config_.affinity_group, config_.label};
    auto created = cloud_.create_cloud_service(service);
    if (created.is_error()) {
        return created;
    }
    bus_.emit(events::ResourceCreatedEvent{"cloud-service", service.name});
    return Ok();
}

Result<void> DeploymentPipeline::upload_certificate() {
    auto certificate = load_certificate(config_.service_name, *config_.certificate);
    if (certificate.is_error()) {
        return Forward<void>(certificate);
    }
    auto added = cloud_.add_certificate(certificate.value());
    if (added.is_error()) {
        return added;
    }
    bus_.emit(events::ResourceCreatedEvent{"certificate", certificate.value().thumbprint});
    return Ok();
}

Result<void> DeploymentPipeline::create_virtual_machines() {
    auto admin = admin_credentials();
    if (admin.is_error()) {
        return Forward<void>(admin);
    }

    // Back end first so the web tier never comes up without its database
    for (const auto& spec : {build_sql_vm(config_, admin.value()), build_web_vm(config_, admin.value())}) {
        spdlog::info("Creating virtual machine '{}' ({}, {})", spec.role_name, spec.image, spec.size);
        auto created = cloud_.create_virtual_machine(spec);
        if (created.is_error()) {
            return Forward<void>(created, "Failed to create virtual machine '" + spec.role_name + "'");
        }
        bus_.emit(events::ResourceCreatedEvent{"virtual-machine", spec.role_name});
    }
    return Ok();
}

Result<void> DeploymentPipeline::configure_sql_server() {
    auto opened = open_session(config_.sql.agent_uri);
    if (opened.is_error()) {
        return Forward<void>(opened);
    }
    auto session = opened.take();
    SessionGuard guard(*session);

    auto auth = session->set_sql_authentication(agent::SqlAuthenticationMode::Mixed, config_.sql.instance);
    if (auth.is_error()) {
        return Forward<void>(auth, "Failed to enable mixed-mode authentication");
    }
    log_command_output("sql authentication", auth.value());

    agent::FirewallRule rule{"SQL Server", agent::FirewallProtocol::TCP, config_.sql.sql_port};
    auto firewall = session->add_firewall_rule(rule);
    if (firewall.is_error()) {
        return Forward<void>(firewall, "Failed to open port " + std::to_string(rule.port));
    }
    log_command_output("firewall rule", firewall.value());

    spdlog::info("SQL server '{}' configured", config_.sql.role);
    return Ok();
}

Result<void> DeploymentPipeline::configure_web_server() {
    auto opened = open_session(config_.web.agent_uri);
    if (opened.is_error()) {
        return Forward<void>(opened);
    }
    auto session = opened.take();
    SessionGuard guard(*session);

    const transfer::ChunkedFileTransfer transfer(config_.segment_size, &bus_);
    for (const auto& upload : config_.web.files) {
        auto sent = transfer.send_file(upload.source, upload.destination, *session);
        if (sent.is_error()) {
            return Forward<void>(sent);
        }
    }

    if (config_.web.product.empty()) {
        spdlog::info("No product configured, skipping install");
    } else {
        spdlog::info("Installing '{}' on '{}'", config_.web.product, config_.web.role);
        auto installed = session->install_product(config_.web.product);
        if (installed.is_error()) {
            return Forward<void>(installed, "Failed to install '" + config_.web.product + "'");
        }
        log_command_output("product install", installed.value());
    }

    agent::FirewallRule rule{"HTTP", agent::FirewallProtocol::TCP, config_.web.http_port};
    auto firewall = session->add_firewall_rule(rule);
    if (firewall.is_error()) {
        return Forward<void>(firewall, "Failed to open port " + std::to_string(rule.port));
    }
    log_command_output("firewall rule", firewall.value());

    spdlog::info("Web server '{}' configured", config_.web.role);
    return Ok();
}

Result<agent::Credentials> DeploymentPipeline::admin_credentials() {
    if (credentials_) {
        return Ok(*credentials_);
    }
    auto provided = credential_provider_.credentials();
    if (provided.is_error()) {
        return provided;
    }
    credentials_ = provided.value();
    return provided;
}

Result<std::unique_ptr<agent::RemoteSession>> DeploymentPipeline::open_session(const std::string& uri) {
    auto admin = admin_credentials();
    if (admin.is_error()) {
        return Forward<std::unique_ptr<agent::RemoteSession>>(admin);
    }
    spdlog::info("Connecting to agent at {}", uri);
    auto session = sessions_.open(uri, admin.value());
    if (session.is_error()) {
        return Forward<std::unique_ptr<agent::RemoteSession>>(session, "Failed to connect to " + uri);
    }
    return session;
}

} // namespace stratus::deploy
