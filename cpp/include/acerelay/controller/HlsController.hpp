#pragma once

#include "acerelay/app/AppContext.hpp"
#include "acerelay/server/Router.hpp"

namespace acerelay::controller {

class HlsController {
public:
    explicit HlsController(app::AppContext& context);

    void registerRoutes(server::Router& router);

private:
    void handleManifest(server::RequestContext& ctx);
    void handleMultistream(server::RequestContext& ctx);
    void handleContent(server::RequestContext& ctx, std::string_view prefix);
    void handleXcStream(server::RequestContext& ctx);
    void handleXcId(server::RequestContext& ctx);
    void handleInfohash(server::RequestContext& ctx);

    app::AppContext& context_;
};

} // namespace acerelay::controller
