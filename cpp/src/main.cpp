#include "acerelay/app/AppContext.hpp"
#include "acerelay/config/AppConfig.hpp"
#include "acerelay/controller/HlsController.hpp"
#include "acerelay/controller/PoolController.hpp"
#include "acerelay/controller/QualityController.hpp"
#include "acerelay/server/HttpServer.hpp"
#include "acerelay/server/Router.hpp"
#include "acerelay/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace acerelay;
    util::initLogging(util::LogLevel::info);

    const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1])
                                                      : std::filesystem::path("instance") / "config.json";
    auto config = config::loadAppConfig(configPath);
    util::initLogging(util::parseLogLevel(config.logLevel));

    try {
        std::filesystem::create_directories(config.instanceDir);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Cannot create instance directory " + config.instanceDir.string() + ": " + ex.what());
        return 1;
    }

    boost::asio::io_context io;
    app::AppContext context{config, io};

    auto router = std::make_shared<server::Router>();
    controller::HlsController hlsController{context};
    hlsController.registerRoutes(*router);

    controller::PoolController poolController{context};
    poolController.registerRoutes(*router);

    controller::QualityController qualityController{context};
    qualityController.registerRoutes(*router);

    auto server = std::make_shared<server::HttpServer>(io, router, config.listenHost, config.listenPort);
    try {
        server->start();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error,
                  "Cannot listen on " + config.listenHost + ":" + std::to_string(config.listenPort) + ": " + ex.what());
        return 1;
    }

    context.startBackground();

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        util::log(util::LogLevel::info, "Received signal " + std::to_string(signal) + ", shutting down");
        server->stop();
        io.stop();
    });

    std::vector<std::thread> ioThreads;
    ioThreads.reserve(config.ioThreads - 1);
    for (unsigned int i = 0; i < config.ioThreads - 1; ++i) {
        ioThreads.emplace_back([&io]() { io.run(); });
    }

    util::log(util::LogLevel::info,
              "acerelay serving " + config.externalUrl + " from engine " + config.engineAddress);
    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    context.shutdown();
    return 0;
}
