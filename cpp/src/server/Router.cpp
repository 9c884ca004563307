#include "acerelay/server/Router.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace acerelay::server {
namespace {
std::string normalizeMethod(std::string_view method) {
    std::string result(method);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string escapeLiteral(const std::string& token) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : token) {
        if (special.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}
}

void Router::addRoute(std::string method, std::string path, Handler handler) {
    RouteEntry entry;
    entry.method = normalizeMethod(method);
    entry.path = std::move(path);
    entry.handler = std::move(handler);

    std::string token;
    std::ostringstream regexBuilder;
    regexBuilder << '^';

    std::istringstream iss(entry.path);
    bool wildcard = false;
    while (std::getline(iss, token, '/')) {
        if (token.empty()) {
            continue;
        }
        if (wildcard) {
            throw std::invalid_argument("wildcard must be the last segment of route " + entry.path);
        }
        regexBuilder << '/';
        if (token.front() == ':') {
            entry.tokens.push_back(token.substr(1));
            regexBuilder << "([^/]+)";
        } else if (token.front() == '*') {
            entry.tokens.push_back(token.substr(1));
            regexBuilder << "(.+)";
            wildcard = true;
        } else {
            regexBuilder << escapeLiteral(token);
        }
    }

    regexBuilder << "/?$";
    entry.pattern = std::regex(regexBuilder.str());

    routes_.push_back(std::move(entry));
}

Router::Handler Router::resolve(std::string_view method,
                                std::string_view target,
                                std::unordered_map<std::string, std::string>& params) const {
    const auto normalized = normalizeMethod(method);
    std::string path(target.substr(0, target.find('?')));
    if (path.empty()) {
        path = "/";
    }

    for (const auto& entry : routes_) {
        if (!entry.method.empty() && entry.method != normalized) {
            continue;
        }

        std::smatch match;
        if (std::regex_match(path, match, entry.pattern)) {
            params.clear();
            for (std::size_t i = 0; i < entry.tokens.size(); ++i) {
                if (i + 1 < match.size()) {
                    params.emplace(entry.tokens[i], match[i + 1].str());
                }
            }
            return entry.handler;
        }
    }

    return nullptr;
}

} // namespace acerelay::server
