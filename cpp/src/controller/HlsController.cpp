#include "acerelay/controller/HlsController.hpp"
#include "acerelay/controller/ResponseUtil.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/util/Logging.hpp"

#include <boost/json.hpp>

#include <string>

namespace acerelay::controller {

HlsController::HlsController(app::AppContext& context)
    : context_(context) {}

void HlsController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/hls/m/*path", [this](auto& ctx) { handleMultistream(ctx); });
    router.addRoute("GET", "/hls/c/*path", [this](auto& ctx) { handleContent(ctx, "/hls/c/"); });
    router.addRoute("GET", "/ace/c/*path", [this](auto& ctx) { handleContent(ctx, "/ace/c/"); });
    router.addRoute("GET", "/hls/:content_id", [this](auto& ctx) { handleManifest(ctx); });
    router.addRoute("GET", "/xc/:xc_id", [this](auto& ctx) { handleXcStream(ctx); });
    router.addRoute("GET", "/api/xc/:content_id", [this](auto& ctx) { handleXcId(ctx); });
    router.addRoute("GET", "/api/infohash/:infohash", [this](auto& ctx) { handleInfohash(ctx); });
}

void HlsController::handleManifest(server::RequestContext& ctx) {
    sendRelay(ctx, context_.relay().relayManifest(ctx.param("content_id")));
}

void HlsController::handleMultistream(server::RequestContext& ctx) {
    sendRelay(ctx, context_.relay().relayMultistream(ctx.param("path")));
}

void HlsController::handleContent(server::RequestContext& ctx, std::string_view prefix) {
    sendRelay(ctx, context_.relay().relayContent(prefix, ctx.param("path")));
}

void HlsController::handleXcStream(server::RequestContext& ctx) {
    const auto raw = ctx.param("xc_id");
    auto xcId = parseNumericId(raw);
    if (!xcId) {
        sendMessage(ctx, 400, "Client requested invalid XC id: " + raw);
        return;
    }
    auto contentId = context_.xcIds().contentIdFor(*xcId);
    if (!contentId) {
        sendMessage(ctx, 404, "Content id not found for XC id " + std::to_string(*xcId));
        return;
    }
    util::log(util::LogLevel::trace, "XC stream " + std::to_string(*xcId) + " -> " + model::shortId(*contentId));
    sendRelay(ctx, context_.relay().relayManifest(*contentId));
}

void HlsController::handleXcId(server::RequestContext& ctx) {
    const auto raw = ctx.param("content_id");
    auto contentId = model::ContentId::parse(raw);
    if (!contentId) {
        sendMessage(ctx, 400, "Invalid content_id: " + raw);
        return;
    }
    auto xcId = context_.xcIds().xcIdFor(contentId->str());
    if (!xcId) {
        sendMessage(ctx, 500, "Failed to allocate XC id for " + contentId->str());
        return;
    }
    boost::json::object body;
    body["content_id"] = contentId->str();
    body["xc_id"] = *xcId;
    sendJson(ctx, body);
}

// Known pairs come from the mapping file; unknown infohashes are asked of the
// engine and remembered.
void HlsController::handleInfohash(server::RequestContext& ctx) {
    const auto raw = ctx.param("infohash");
    auto infohash = model::ContentId::parse(raw);
    if (!infohash) {
        sendMessage(ctx, 400, "Invalid infohash: " + raw);
        return;
    }
    auto contentId = context_.infohashMap().contentIdFor(infohash->str());
    if (!contentId) {
        contentId = context_.engine().fetchContentIdForInfohash(infohash->str());
        if (!contentId) {
            sendMessage(ctx, 404, "Content id not found for infohash " + infohash->str());
            return;
        }
        context_.infohashMap().add(*contentId, infohash->str());
    }
    boost::json::object body;
    body["infohash"] = infohash->str();
    body["content_id"] = *contentId;
    sendJson(ctx, body);
}

} // namespace acerelay::controller
