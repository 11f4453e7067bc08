#include "stratus/agent/routes.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace stratus::agent {
namespace {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using network::make_json_error;
using network::make_json_response;

Result<json> parse_body(const HttpContext& ctx) {
    try {
        auto body = json::parse(ctx.request.body_as_string());
        if (!body.is_object()) {
            return Err<json>(std::string("Request body must be a JSON object"));
        }
        return Ok(std::move(body));
    } catch (const json::parse_error& e) {
        return Err<json>(std::string("Invalid JSON body: ") + e.what());
    }
}

Result<std::string> required_string(const json& body, const char* field) {
    const auto it = body.find(field);
    if (it == body.end() || !it->is_string()) {
        return Err<std::string>(std::string("Missing string field '") + field + "'");
    }
    return Ok(it->get<std::string>());
}

// An absent field takes the fallback; a present one must be a string
Result<std::string> optional_string(const json& body, const char* field, const std::string& fallback) {
    const auto it = body.find(field);
    if (it == body.end()) {
        return Ok(fallback);
    }
    if (!it->is_string()) {
        return Err<std::string>(std::string("Field '") + field + "' must be a string");
    }
    return Ok(it->get<std::string>());
}

HttpResponse ok_json(const json& body) {
    return make_json_response(HttpStatus::OK, body.dump());
}

HttpResponse bad_request(const std::string& message) {
    spdlog::warn("Rejected request: {}", message);
    return make_json_error(HttpStatus::BAD_REQUEST, message);
}

HttpResponse operation_failed(const std::string& message) {
    spdlog::error("Operation failed: {}", message);
    return make_json_error(HttpStatus::INTERNAL_SERVER_ERROR, message);
}

HttpResponse command_response(const Result<CommandOutcome>& outcome) {
    if (outcome.is_error()) {
        return operation_failed(outcome.error());
    }
    return ok_json(to_json(outcome.value()));
}

// Handlers for JSON requests carrying a single "path" field
template<typename Operation>
network::RouteHandler path_handler(Operation operation) {
    return [operation](const HttpContext& ctx) {
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return bad_request(body.error());
        }
        auto path = required_string(body.value(), "path");
        if (path.is_error()) {
            return bad_request(path.error());
        }
        return operation(path.value());
    };
}

} // namespace

void register_agent_routes(network::HttpRouter& router, AgentService& service, const Credentials& credentials) {
    router.use([credentials](const HttpContext& ctx, HttpResponse& response) {
        const auto presented = parse_basic_authorization(ctx.request.get_header("Authorization"));
        if (!presented || !(*presented == credentials)) {
            spdlog::warn("Rejected request to {}: bad credentials", ctx.request.url);
            response = make_json_error(HttpStatus::UNAUTHORIZED, "Invalid credentials");
            response.set_header("WWW-Authenticate", "Basic realm=\"stratus\"");
            return false;
        }
        return true;
    });

    router.use([](const HttpContext& ctx, HttpResponse& response) {
        const std::string version = ctx.request.get_header(kProtocolHeader);
        if (version != std::to_string(kProtocolVersion)) {
            response = bad_request("Unsupported protocol version '" + version + "', agent speaks " +
                                   std::to_string(kProtocolVersion));
            return false;
        }
        return true;
    });

    router.get(routes::kPing, [&service](const HttpContext&) {
        return ok_json(to_json(service.info()));
    });

    router.post(routes::kResetFile, path_handler([&service](const std::string& path) {
        auto resolved = service.reset_file(path);
        if (resolved.is_error()) {
            return operation_failed(resolved.error());
        }
        return ok_json(json{{"path", resolved.value()}});
    }));

    router.post(routes::kResolvePath, path_handler([&service](const std::string& path) {
        auto resolved = service.resolve_path(path);
        if (resolved.is_error()) {
            return bad_request(resolved.error());
        }
        return ok_json(json{{"path", resolved.value()}});
    }));

    router.post(routes::kStatFile, path_handler([&service](const std::string& path) {
        auto info = service.stat(path);
        if (info.is_error()) {
            return operation_failed(info.error());
        }
        return ok_json(to_json(info.value()));
    }));

    router.post(routes::kAppendFile, [&service](const HttpContext& ctx) {
        const std::string path = ctx.request.get_header(kPathHeader);
        if (path.empty()) {
            return bad_request(std::string("Missing ") + kPathHeader + " header");
        }
        auto size = service.append(path, ctx.request.body);
        if (size.is_error()) {
            return operation_failed(size.error());
        }
        return ok_json(json{{"bytes_written", ctx.request.body.size()}, {"size", size.value()}});
    });

    router.post(routes::kInstallProduct, [&service](const HttpContext& ctx) {
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return bad_request(body.error());
        }
        auto product = required_string(body.value(), "product");
        if (product.is_error()) {
            return bad_request(product.error());
        }
        return command_response(service.install_product(product.value()));
    });

    router.post(routes::kFirewallRules, [&service](const HttpContext& ctx) {
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return bad_request(body.error());
        }
        auto rule = firewall_rule_from_json(body.value());
        if (rule.is_error()) {
            return bad_request(rule.error());
        }
        return command_response(service.add_firewall_rule(rule.value()));
    });

    router.post(routes::kSqlAuthentication, [&service](const HttpContext& ctx) {
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return bad_request(body.error());
        }
        auto mode_text = required_string(body.value(), "mode");
        if (mode_text.is_error()) {
            return bad_request(mode_text.error());
        }
        auto mode = parse_sql_authentication_mode(mode_text.value());
        if (mode.is_error()) {
            return bad_request(mode.error());
        }
        auto instance = optional_string(body.value(), "instance", "MSSQLSERVER");
        if (instance.is_error()) {
            return bad_request(instance.error());
        }
        return command_response(service.set_sql_authentication(mode.value(), instance.value()));
    });
}

} // namespace stratus::agent
