#pragma once

#include "acerelay/server/HttpServer.hpp"
#include "acerelay/server/Router.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace acerelay::test {

// Loopback stand-in for the media engine's HTTP API. Serves playback start,
// manifests, stats, stop, version, segment and infohash lookup endpoints and
// records every request target it receives.
class FakeEngine {
public:
    FakeEngine()
        : router_(std::make_shared<server::Router>()) {
        registerRoutes();
        server_ = std::make_shared<server::HttpServer>(io_, router_, "127.0.0.1", 0);
        server_->start();
        for (int i = 0; i < 2; ++i) {
            threads_.emplace_back([this]() { io_.run(); });
        }
    }

    ~FakeEngine() {
        server_->stop();
        io_.stop();
        for (auto& thread : threads_) {
            thread.join();
        }
    }

    FakeEngine(const FakeEngine&) = delete;
    FakeEngine& operator=(const FakeEngine&) = delete;

    std::string address() const { return "http://127.0.0.1:" + std::to_string(server_->port()); }

    // Playlist ending in segment `sequence` under this engine's address.
    std::string playlist(int sequence, bool withMediaLine = false) const {
        std::string text = "#EXTM3U\n#EXT-X-VERSION:3\n#EXT-X-TARGETDURATION:4\n";
        text += "#EXT-X-MEDIA-SEQUENCE:" + std::to_string(sequence - 1) + "\n";
        if (withMediaLine) {
            text += "#EXT-X-MEDIA:URI=\"" + address() + "/hls/m/alt/audio.m3u8\",TYPE=AUDIO\n";
        }
        text += "#EXTINF:4.000,\n" + address() + "/ace/c/session/" + std::to_string(sequence - 1) + ".ts\n";
        text += "#EXTINF:4.000,\n" + address() + "/ace/c/session/" + std::to_string(sequence) + ".ts\n";
        return text;
    }

    void setManifest(std::string body, unsigned status = 200) {
        std::scoped_lock lock(mutex_);
        manifest_ = std::move(body);
        manifestStatus_ = status;
    }

    void setManifestDelay(std::chrono::milliseconds delay) {
        std::scoped_lock lock(mutex_);
        manifestDelay_ = delay;
    }

    void setPlaybackAvailable(bool available) {
        std::scoped_lock lock(mutex_);
        playbackAvailable_ = available;
    }

    void setVersionAvailable(bool available) {
        std::scoped_lock lock(mutex_);
        versionAvailable_ = available;
    }

    std::vector<std::string> requests() const {
        std::scoped_lock lock(mutex_);
        return requests_;
    }

    std::size_t count(std::string_view prefix) const {
        std::scoped_lock lock(mutex_);
        return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(), [prefix](const std::string& target) {
            return target.rfind(prefix, 0) == 0;
        }));
    }

    static std::string queryParam(std::string_view target, std::string_view key) {
        auto pos = target.find('?');
        if (pos == std::string_view::npos) {
            return {};
        }
        auto query = target.substr(pos + 1);
        std::size_t start = 0;
        while (start <= query.size()) {
            auto end = query.find('&', start);
            if (end == std::string_view::npos) {
                end = query.size();
            }
            auto token = query.substr(start, end - start);
            auto eq = token.find('=');
            if (eq != std::string_view::npos && token.substr(0, eq) == key) {
                return std::string(token.substr(eq + 1));
            }
            start = end + 1;
        }
        return {};
    }

    // Infohash the fake reports for a content id.
    static std::string infohashFor(std::string contentId) {
        std::reverse(contentId.begin(), contentId.end());
        return contentId;
    }

private:
    static std::string targetOf(const server::RequestContext& ctx) {
        auto target = ctx.request.target();
        return std::string(target.data(), target.size());
    }

    void record(const server::RequestContext& ctx) {
        std::scoped_lock lock(mutex_);
        requests_.push_back(targetOf(ctx));
    }

    static void reply(server::RequestContext& ctx, unsigned status, std::string body, const char* contentType) {
        ctx.response.result(status);
        ctx.response.set(boost::beast::http::field::content_type, contentType);
        ctx.response.body() = std::move(body);
    }

    void registerRoutes() {
        router_->addRoute("GET", "/ace/manifest.m3u8", [this](server::RequestContext& ctx) {
            record(ctx);
            const auto target = targetOf(ctx);
            const auto contentId = queryParam(target, "content_id");
            const auto pid = queryParam(target, "pid");
            bool available = false;
            {
                std::scoped_lock lock(mutex_);
                available = playbackAvailable_;
            }
            boost::json::object root;
            if (!available) {
                root["response"] = nullptr;
                root["error"] = "failed to start playback";
            } else {
                boost::json::object response;
                const auto base = address() + "/ace/";
                response["playback_url"] = base + "m/" + contentId + "/" + pid + ".m3u8";
                response["stat_url"] = base + "stat/" + contentId + "/" + pid;
                response["command_url"] = base + "cmd/" + contentId + "/" + pid;
                response["infohash"] = infohashFor(contentId);
                response["playback_session_id"] = "session-" + pid;
                response["is_live"] = 1;
                root["response"] = std::move(response);
                root["error"] = nullptr;
            }
            reply(ctx, 200, boost::json::serialize(root), "application/json");
        });

        router_->addRoute("GET", "/ace/m/:content_id/:file", [this](server::RequestContext& ctx) {
            record(ctx);
            serveManifest(ctx);
        });

        router_->addRoute("GET", "/hls/m/*path", [this](server::RequestContext& ctx) {
            record(ctx);
            serveManifest(ctx);
        });

        router_->addRoute("GET", "/ace/stat/:content_id/:pid", [this](server::RequestContext& ctx) {
            record(ctx);
            reply(ctx, 200, R"({"response":{"status":"dl","peers":3,"speed_down":512},"error":null})", "application/json");
        });

        router_->addRoute("GET", "/ace/cmd/:content_id/:pid", [this](server::RequestContext& ctx) {
            record(ctx);
            reply(ctx, 200, R"({"response":"ok","error":null})", "application/json");
        });

        router_->addRoute("GET", "/webui/api/service", [this](server::RequestContext& ctx) {
            record(ctx);
            bool available = false;
            {
                std::scoped_lock lock(mutex_);
                available = versionAvailable_;
            }
            if (!available) {
                reply(ctx, 500, "engine down", "text/plain");
                return;
            }
            reply(ctx, 200, R"({"result":{"code":0,"version":"3.2.3"},"error":null})", "application/json");
        });

        router_->addRoute("GET", "/ace/c/*path", [this](server::RequestContext& ctx) {
            record(ctx);
            reply(ctx, 200, "TSDATA", "application/octet-stream");
        });

        router_->addRoute("GET", "/server/api", [this](server::RequestContext& ctx) {
            record(ctx);
            const auto infohash = queryParam(targetOf(ctx), "infohash");
            boost::json::object result;
            result["content_id"] = infohashFor(infohash);
            boost::json::object root;
            root["result"] = std::move(result);
            reply(ctx, 200, boost::json::serialize(root), "application/json");
        });
    }

    void serveManifest(server::RequestContext& ctx) {
        std::string body;
        unsigned status = 200;
        std::chrono::milliseconds delay{0};
        {
            std::scoped_lock lock(mutex_);
            body = manifest_;
            status = manifestStatus_;
            delay = manifestDelay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (body.empty() && status == 200) {
            body = playlist(42);
        }
        reply(ctx, status, std::move(body), "application/vnd.apple.mpegurl");
    }

    boost::asio::io_context io_;
    std::shared_ptr<server::Router> router_;
    std::shared_ptr<server::HttpServer> server_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::string manifest_;
    unsigned manifestStatus_{200};
    std::chrono::milliseconds manifestDelay_{0};
    bool playbackAvailable_{true};
    bool versionAvailable_{true};
};

} // namespace acerelay::test
