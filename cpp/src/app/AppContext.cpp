#include "acerelay/app/AppContext.hpp"
#include "acerelay/util/Logging.hpp"

#include <chrono>
#include <utility>

namespace acerelay::app {

AppContext::AppContext(config::AppConfig config, boost::asio::io_context& io, util::Clock clock)
    : config_(std::move(config))
    , io_(io)
    , workers_(config_.workerThreads)
    , engine_(httpClient_, config_.engineAddress)
    , infohashMap_(config_.infohashMapPath())
    , xcIds_(config_.xcIdMapPath())
    , quality_(config_.qualityStorePath(), clock)
    , pool_(engine_, workers_, pool::PoolSettings{config_.maxStreams, config_.transcodeAudio, config_.externalUrl}, clock)
    , relay_(httpClient_, pool_, quality_, config_.externalUrl)
    , qualityCheck_(quality_, relay_, workers_) {
    pool_.setInfohashObserver([this](const model::ContentId& contentId, const std::string& infohash) {
        infohashMap_.add(contentId.str(), infohash);
    });
}

AppContext::~AppContext() {
    shutdown();
}

void AppContext::startBackground() {
    if (poolboy_) {
        return;
    }
    poolboy_ = std::make_shared<util::PeriodicTask>(
        "poolboy", io_, workers_,
        std::chrono::duration_cast<std::chrono::milliseconds>(pool::kMaintenanceInterval),
        [this]() { pool_.runMaintenance(); });
    poolboy_->start();
    util::log(util::LogLevel::info,
              "Engine pool of " + std::to_string(pool_.maxSize()) + " slots against " + engine_.baseAddress());
}

void AppContext::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;
    if (poolboy_) {
        poolboy_->stop();
    }
    qualityCheck_.stop();
    workers_.join();
}

} // namespace acerelay::app
