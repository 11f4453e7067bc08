#include "stratus/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace stratus {
namespace network {

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }

            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else if (pattern[i] == '*') {
            regex_pattern += "(.*)";
            ++i;
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

std::string url_path(const std::string& url) {
    const auto query = url.find('?');
    return query == std::string::npos ? url : url.substr(0, query);
}

HttpResponse make_json_response(HttpStatus status, const std::string& json_body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(json_body);
    return response;
}

HttpResponse make_json_error(HttpStatus status, const std::string& message) {
    return make_json_response(status, nlohmann::json{{"error", message}}.dump());
}

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {

    std::string regex_str = pattern_to_regex(pattern, param_names);

    try {
        regex = std::regex(regex_str);
    } catch (const std::regex_error& e) {
        spdlog::error("Invalid route pattern '{}': {}", pattern, e.what());
        regex = std::regex("^" + std::regex_replace(pattern, std::regex(R"([.^$|()\[\]{}*+?\\])"), R"(\$&)") + "$");
    }
}

bool Route::matches(HttpMethod req_method, const std::string& url) const {
    if (method != req_method) {
        return false;
    }
    return std::regex_match(url_path(url), regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& url) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;
    const std::string path = url_path(url);

    if (std::regex_match(path, match, regex)) {
        // match[0] is the full string, match[1+] are capture groups
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }

    return params;
}

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const Route* route = find_route(request.method, request.url);
    if (!route) {
        if (path_exists(request.url)) {
            return make_json_error(HttpStatus::METHOD_NOT_ALLOWED,
                                   "Method " + HttpMethodUtils::to_string(request.method) +
                                   " not allowed for " + url_path(request.url));
        }
        return not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(request.url);

    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} threw exception: {}", route->pattern, e.what());
        response = make_json_error(HttpStatus::INTERNAL_SERVER_ERROR, e.what());
    }

    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;

    for (const auto& route : routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.pattern;
        route_list.push_back(oss.str());
    }

    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return make_json_error(HttpStatus::NOT_FOUND, "No route for " + url_path(ctx.request.url));
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& url) const {
    for (const auto& route : routes_) {
        if (route.matches(method, url)) {
            return &route;
        }
    }
    return nullptr;
}

bool HttpRouter::path_exists(const std::string& url) const {
    const std::string path = url_path(url);
    for (const auto& route : routes_) {
        if (std::regex_match(path, route.regex)) {
            return true;
        }
    }
    return false;
}

} // namespace network
} // namespace stratus
