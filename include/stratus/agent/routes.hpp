#pragma once

#include "stratus/agent/protocol.hpp"
#include "stratus/agent/service.hpp"
#include "stratus/network/http_router.hpp"

namespace stratus::agent {

/**
 * @brief Bind the protocol endpoints of `service` onto `router`
 *
 * Installs two middlewares ahead of the routes: credential check (401) and
 * protocol version check (400). `service` must outlive the router.
 */
void register_agent_routes(network::HttpRouter& router, AgentService& service, const Credentials& credentials);

} // namespace stratus::agent
