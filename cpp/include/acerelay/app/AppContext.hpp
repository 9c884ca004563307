#pragma once

#include "acerelay/config/AppConfig.hpp"
#include "acerelay/engine/EngineApi.hpp"
#include "acerelay/pool/ResourcePool.hpp"
#include "acerelay/quality/QualityTracker.hpp"
#include "acerelay/relay/StreamRelay.hpp"
#include "acerelay/service/QualityCheckService.hpp"
#include "acerelay/store/ContentIdInfohashMap.hpp"
#include "acerelay/store/XcIdMap.hpp"
#include "acerelay/util/Clock.hpp"
#include "acerelay/util/HttpClient.hpp"
#include "acerelay/util/PeriodicTask.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <memory>

namespace acerelay::app {

// Everything the process shares, built once from the configuration. Members
// are declared in dependency order so destruction runs in reverse.
class AppContext {
public:
    AppContext(config::AppConfig config, boost::asio::io_context& io, util::Clock clock = util::systemClock());
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    // Starts the poolboy maintenance task.
    void startBackground();
    // Stops background work and waits for the worker pool to drain.
    void shutdown();

    [[nodiscard]] const config::AppConfig& config() const noexcept { return config_; }
    boost::asio::thread_pool& workers() noexcept { return workers_; }
    util::HttpClient& httpClient() noexcept { return httpClient_; }
    engine::EngineApi& engine() noexcept { return engine_; }
    store::ContentIdInfohashMap& infohashMap() noexcept { return infohashMap_; }
    store::XcIdMap& xcIds() noexcept { return xcIds_; }
    quality::QualityTracker& quality() noexcept { return quality_; }
    pool::ResourcePool& pool() noexcept { return pool_; }
    relay::StreamRelay& relay() noexcept { return relay_; }
    service::QualityCheckService& qualityCheck() noexcept { return qualityCheck_; }

private:
    config::AppConfig config_;
    boost::asio::io_context& io_;
    boost::asio::thread_pool workers_;
    util::HttpClient httpClient_;
    engine::EngineApi engine_;
    store::ContentIdInfohashMap infohashMap_;
    store::XcIdMap xcIds_;
    quality::QualityTracker quality_;
    pool::ResourcePool pool_;
    relay::StreamRelay relay_;
    service::QualityCheckService qualityCheck_;
    std::shared_ptr<util::PeriodicTask> poolboy_;
    bool shutDown_{false};
};

} // namespace acerelay::app
