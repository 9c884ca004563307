#pragma once

#include "acerelay/relay/StreamRelay.hpp"
#include "acerelay/server/RequestContext.hpp"
#include "acerelay/util/JsonResponse.hpp"
#include "acerelay/util/JsonUtil.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace acerelay::controller {

inline void sendJson(server::RequestContext& ctx, const boost::json::value& value, unsigned status = 200) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(value);
}

inline void sendMessage(server::RequestContext& ctx, unsigned status, std::string_view message) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::makeMessageBody(message);
}

inline void sendRelay(server::RequestContext& ctx, relay::RelayResponse relayed) {
    ctx.response.result(relayed.status);
    for (const auto& [name, value] : relayed.headers) {
        ctx.response.set(name, value);
    }
    ctx.response.body() = std::move(relayed.body);
}

// Positive decimal number, optionally followed by an extension ("12.m3u8").
inline std::optional<std::int64_t> parseNumericId(std::string_view text) {
    text = text.substr(0, text.find('.'));
    if (text.empty() || text.size() > 18 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoll(std::string(text));
}

} // namespace acerelay::controller
