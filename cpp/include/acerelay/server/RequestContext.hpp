#pragma once

#include <boost/beast/http.hpp>
#include <chrono>
#include <string>
#include <unordered_map>

namespace acerelay::server {

struct RequestContext {
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    HttpRequest request;
    HttpResponse response;
    std::unordered_map<std::string, std::string> pathParameters;
    std::chrono::steady_clock::time_point startedAt;

    [[nodiscard]] std::string param(const std::string& name) const {
        auto it = pathParameters.find(name);
        return it == pathParameters.end() ? std::string{} : it->second;
    }
};

} // namespace acerelay::server
