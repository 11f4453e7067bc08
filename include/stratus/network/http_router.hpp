#pragma once

#include "stratus/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stratus {
namespace network {

/**
 * @brief Request context with URL parameters extracted from the route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :name

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware run before route handlers
 *
 * Returning false short-circuits the request; the response it filled in is
 * sent as is.
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& url) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& url) const;
};

/**
 * @brief Method + pattern dispatch for the agent's HTTP endpoints
 *
 * @code
 * HttpRouter router;
 * router.use(require_protocol_version);
 * router.post("/v1/files/append", handle_append);
 * HttpResponse res = router.handle_request(request);
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware, executed in registration order
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request to the first matching route
     *
     * A path that exists under a different method yields 405, an unknown
     * path the not-found handler. Handler exceptions become 500 responses.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& url) const;
    bool path_exists(const std::string& url) const;
};

/**
 * @brief Convert a URL pattern to a regex
 *
 *   "/v1/items/:id" -> "^/v1/items/([^/]+)$"
 *
 * The query string is not part of the match; callers strip it first.
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/**
 * @brief Path component of a request URL (everything before '?')
 */
std::string url_path(const std::string& url);

/**
 * @brief JSON response helpers shared by the agent routes
 */
HttpResponse make_json_response(HttpStatus status, const std::string& json_body);
HttpResponse make_json_error(HttpStatus status, const std::string& message);

} // namespace network
} // namespace stratus
