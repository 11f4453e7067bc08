#include "stratus/cloud/convergence.hpp"
#include "stratus/events/events.hpp"

#include <spdlog/spdlog.h>

namespace stratus::cloud {

namespace {

constexpr const char* kAffinityGroupKind = "affinity-group";
constexpr const char* kNetworkSiteKind = "network-site";

} // namespace

const char* to_string(ConvergenceOutcome outcome) {
    switch (outcome) {
        case ConvergenceOutcome::Created: return "created";
        case ConvergenceOutcome::Updated: return "updated";
        case ConvergenceOutcome::Unchanged: return "unchanged";
        case ConvergenceOutcome::Mismatch: return "mismatch";
    }
    return "unknown";
}

Result<ConvergenceOutcome> ensure_affinity_group(CloudApi& cloud,
                                                 const AffinityGroup& group,
                                                 events::EventBus* bus) {
    auto existing = cloud.get_affinity_group(group.name);
    if (existing.is_error()) {
        return Forward<ConvergenceOutcome>(existing, "Failed to query affinity group '" + group.name + "'");
    }

    if (const auto& found = existing.value()) {
        if (found->location == group.location) {
            spdlog::debug("Affinity group '{}' already exists in {}", group.name, group.location);
            return Ok(ConvergenceOutcome::Unchanged);
        }
        const std::string detail = "exists in '" + found->location + "', requested '" + group.location + "'";
        spdlog::warn("Affinity group '{}' {}", group.name, detail);
        if (bus) {
            bus->emit(events::ResourceMismatchEvent{kAffinityGroupKind, group.name, detail});
        }
        return Ok(ConvergenceOutcome::Mismatch);
    }

    auto created = cloud.create_affinity_group(group);
    if (created.is_error()) {
        return Forward<ConvergenceOutcome>(created, "Failed to create affinity group '" + group.name + "'");
    }
    if (bus) {
        bus->emit(events::ResourceCreatedEvent{kAffinityGroupKind, group.name});
    }
    return Ok(ConvergenceOutcome::Created);
}

Result<ConvergenceOutcome> ensure_network_site(CloudApi& cloud,
                                               const netcfg::SiteRequest& request,
                                               events::EventBus* bus) {
    auto valid = netcfg::validate(request);
    if (valid.is_error()) {
        return Forward<ConvergenceOutcome>(valid);
    }

    auto fetched = cloud.get_network_config();
    if (fetched.is_error()) {
        return Forward<ConvergenceOutcome>(fetched, "Failed to fetch network configuration");
    }

    netcfg::NetworkConfiguration current;
    if (fetched.value()) {
        auto parsed = netcfg::parse_network_config(*fetched.value());
        if (parsed.is_error()) {
            return Forward<ConvergenceOutcome>(parsed);
        }
        current = parsed.take();
    } else {
        spdlog::info("No network configuration found, starting from a blank document");
        current = netcfg::blank_network_config();
    }

    const bool site_existed = current.find_site(request.name) != nullptr;
    const netcfg::NetworkConfiguration merged = netcfg::merge_site(current, request);

    // A document that was never set always gets pushed, even if the merge is trivial
    if (fetched.value() && merged == current) {
        spdlog::debug("Network site '{}' already up to date", request.name);
        return Ok(ConvergenceOutcome::Unchanged);
    }

    auto pushed = cloud.set_network_config(netcfg::serialize_network_config(merged));
    if (pushed.is_error()) {
        return Forward<ConvergenceOutcome>(pushed, "Failed to update network configuration");
    }

    if (site_existed) {
        spdlog::info("Updated network site '{}' (subnet '{}')", request.name, request.subnet_name);
        return Ok(ConvergenceOutcome::Updated);
    }
    if (bus) {
        bus->emit(events::ResourceCreatedEvent{kNetworkSiteKind, request.name});
    }
    return Ok(ConvergenceOutcome::Created);
}

} // namespace stratus::cloud
