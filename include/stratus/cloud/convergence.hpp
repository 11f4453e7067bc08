#pragma once

#include "stratus/cloud/cloud_api.hpp"
#include "stratus/core/result.hpp"
#include "stratus/events/event_bus.hpp"
#include "stratus/netcfg/network_config.hpp"

#include <string>

namespace stratus::cloud {

enum class ConvergenceOutcome {
    Created,     ///< resource was absent and has been created
    Updated,     ///< document existed and was rewritten
    Unchanged,   ///< already in the requested state, nothing pushed
    Mismatch     ///< exists with other attributes; left alone, warned
};

const char* to_string(ConvergenceOutcome outcome);

/**
 * @brief Make sure an affinity group with this name exists
 *
 * Absent: created in the requested location. Present in another location:
 * warning and ResourceMismatchEvent, no mutation, not an error.
 */
Result<ConvergenceOutcome> ensure_affinity_group(CloudApi& cloud,
                                                 const AffinityGroup& group,
                                                 events::EventBus* bus = nullptr);

/**
 * @brief Make sure the network configuration contains the requested site
 *
 * Fetches the document (bootstrapping a blank one when the control plane has
 * none), merges the site, and pushes the result back unless the merge was a
 * no-op.
 */
Result<ConvergenceOutcome> ensure_network_site(CloudApi& cloud,
                                               const netcfg::SiteRequest& request,
                                               events::EventBus* bus = nullptr);

} // namespace stratus::cloud
