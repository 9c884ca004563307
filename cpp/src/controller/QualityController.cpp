#include "acerelay/controller/QualityController.hpp"
#include "acerelay/controller/ResponseUtil.hpp"
#include "acerelay/model/ContentId.hpp"

#include <boost/json.hpp>

namespace acerelay::controller {
namespace {

boost::json::object toJson(const quality::QualityView& view) {
    boost::json::object obj;
    obj["quality"] = view.score;
    obj["has_ever_worked"] = view.hasEverWorked;
    obj["m3u_failures"] = view.m3uFailures;
    obj["last_message"] = view.lastMessage;
    return obj;
}

} // namespace

QualityController::QualityController(app::AppContext& context)
    : context_(context) {}

void QualityController::registerRoutes(server::Router& router) {
    router.addRoute("POST", "/api/quality/check", [this](auto& ctx) { handleCheck(ctx); });
    router.addRoute("GET", "/api/quality", [this](auto& ctx) { handleAll(ctx); });
    router.addRoute("GET", "/api/quality/:content_id", [this](auto& ctx) { handleOne(ctx); });
}

void QualityController::handleAll(server::RequestContext& ctx) {
    boost::json::object body;
    for (const auto& [id, view] : context_.quality().all()) {
        body[id] = toJson(view);
    }
    sendJson(ctx, body);
}

// Invalid ids surface as ServiceError and become a 400 in the server.
void QualityController::handleOne(server::RequestContext& ctx) {
    const auto id = ctx.param("content_id");
    auto body = toJson(context_.quality().get(id));
    body["content_id"] = model::ContentId::parse(id)->str();
    sendJson(ctx, body);
}

void QualityController::handleCheck(server::RequestContext& ctx) {
    if (!context_.qualityCheck().start()) {
        sendMessage(ctx, 409, "Quality check already running");
        return;
    }
    sendMessage(ctx, 202, "Quality check started");
}

} // namespace acerelay::controller
