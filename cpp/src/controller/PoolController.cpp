#include "acerelay/controller/PoolController.hpp"
#include "acerelay/controller/ResponseUtil.hpp"
#include "acerelay/model/ContentId.hpp"

#include <boost/json.hpp>

#include <string>

namespace acerelay::controller {
namespace {

std::optional<model::ContentId> requireContentId(server::RequestContext& ctx) {
    const auto raw = ctx.param("content_id");
    auto id = model::ContentId::parse(raw);
    if (!id) {
        sendMessage(ctx, 400, "Invalid content_id: " + raw);
    }
    return id;
}

std::optional<int> requireSlot(server::RequestContext& ctx) {
    const auto raw = ctx.param("pid");
    auto slot = parseNumericId(raw);
    if (!slot || *slot > 0xFFFF) {
        sendMessage(ctx, 400, "Invalid pid: " + raw);
        return std::nullopt;
    }
    return static_cast<int>(*slot);
}

} // namespace

PoolController::PoolController(app::AppContext& context)
    : context_(context) {}

void PoolController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/api/ace-pool", [this](auto& ctx) { handlePool(ctx); });
    router.addRoute("GET", "/api/ace-pool/content_id/:content_id", [this](auto& ctx) { handleByContentId(ctx); });
    router.addRoute("DELETE", "/api/ace-pool/content_id/:content_id", [this](auto& ctx) { handleRemove(ctx); });
    router.addRoute("GET", "/api/ace-pool/pid/:pid", [this](auto& ctx) { handleBySlot(ctx); });
    router.addRoute("GET", "/api/ace-pool/stats/content_id/:content_id", [this](auto& ctx) { handleStatsByContentId(ctx); });
    router.addRoute("GET", "/api/ace-pool/stats/pid/:pid", [this](auto& ctx) { handleStatsBySlot(ctx); });
    router.addRoute("GET", "/api/health", [this](auto& ctx) { handleHealth(ctx); });
}

void PoolController::handlePool(server::RequestContext& ctx) {
    sendJson(ctx, pool::toJson(context_.pool().snapshot()));
}

void PoolController::handleByContentId(server::RequestContext& ctx) {
    auto id = requireContentId(ctx);
    if (!id) {
        return;
    }
    auto view = context_.pool().viewByContentId(id->str());
    if (!view) {
        sendMessage(ctx, 404, "No engine instance for content_id " + id->str());
        return;
    }
    sendJson(ctx, pool::toJson(*view));
}

void PoolController::handleRemove(server::RequestContext& ctx) {
    auto id = requireContentId(ctx);
    if (!id) {
        return;
    }
    const bool removed = context_.pool().remove(id->str(), "api");
    boost::json::object body;
    body["content_id"] = id->str();
    body["removed"] = removed;
    sendJson(ctx, body);
}

void PoolController::handleBySlot(server::RequestContext& ctx) {
    auto slot = requireSlot(ctx);
    if (!slot) {
        return;
    }
    auto view = context_.pool().viewBySlot(*slot);
    if (!view) {
        sendMessage(ctx, 404, "No engine instance with pid " + std::to_string(*slot));
        return;
    }
    sendJson(ctx, pool::toJson(*view));
}

void PoolController::handleStatsByContentId(server::RequestContext& ctx) {
    auto id = requireContentId(ctx);
    if (!id) {
        return;
    }
    auto stat = context_.pool().statsByContentId(id->str());
    if (!stat) {
        sendMessage(ctx, 404, "No stats available for content_id " + id->str());
        return;
    }
    sendJson(ctx, *stat);
}

void PoolController::handleStatsBySlot(server::RequestContext& ctx) {
    auto slot = requireSlot(ctx);
    if (!slot) {
        return;
    }
    auto stat = context_.pool().statsBySlot(*slot);
    if (!stat) {
        sendMessage(ctx, 404, "No stats available for pid " + std::to_string(*slot));
        return;
    }
    sendJson(ctx, *stat);
}

void PoolController::handleHealth(server::RequestContext& ctx) {
    auto& pool = context_.pool();
    boost::json::object body;
    body["healthy"] = pool.healthy();
    body["engine_version"] = pool.engineVersion();
    body["pool_size"] = pool.size();
    body["max_size"] = pool.maxSize();
    sendJson(ctx, body);
}

} // namespace acerelay::controller
