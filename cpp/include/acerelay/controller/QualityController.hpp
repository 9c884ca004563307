#pragma once

#include "acerelay/app/AppContext.hpp"
#include "acerelay/server/Router.hpp"

namespace acerelay::controller {

class QualityController {
public:
    explicit QualityController(app::AppContext& context);

    void registerRoutes(server::Router& router);

private:
    void handleAll(server::RequestContext& ctx);
    void handleOne(server::RequestContext& ctx);
    void handleCheck(server::RequestContext& ctx);

    app::AppContext& context_;
};

} // namespace acerelay::controller
