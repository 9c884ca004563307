#pragma once

#include "acerelay/app/AppContext.hpp"
#include "acerelay/server/Router.hpp"

namespace acerelay::controller {

class PoolController {
public:
    explicit PoolController(app::AppContext& context);

    void registerRoutes(server::Router& router);

private:
    void handlePool(server::RequestContext& ctx);
    void handleByContentId(server::RequestContext& ctx);
    void handleRemove(server::RequestContext& ctx);
    void handleBySlot(server::RequestContext& ctx);
    void handleStatsByContentId(server::RequestContext& ctx);
    void handleStatsBySlot(server::RequestContext& ctx);
    void handleHealth(server::RequestContext& ctx);

    app::AppContext& context_;
};

} // namespace acerelay::controller
