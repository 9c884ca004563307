#pragma once

#include "acerelay/server/RequestContext.hpp"

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace acerelay::server {

// Method + path routing. ":name" captures one path segment, a trailing
// "*name" captures the rest of the path including slashes. Routes are tried
// in registration order and the query string is ignored.
class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    void addRoute(std::string method, std::string path, Handler handler);
    Handler resolve(std::string_view method,
                    std::string_view target,
                    std::unordered_map<std::string, std::string>& params) const;

    [[nodiscard]] std::size_t size() const noexcept { return routes_.size(); }

private:
    struct RouteEntry {
        std::string method;
        std::string path;
        std::regex pattern;
        std::vector<std::string> tokens;
        Handler handler;
    };

    std::vector<RouteEntry> routes_;
};

} // namespace acerelay::server
