#pragma once

#include "acerelay/util/HttpClient.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace acerelay::engine {

inline constexpr std::chrono::seconds kControlTimeout{3};

// Binding returned by the engine's playback-start endpoint.
struct PlaybackSession {
    std::string playbackUrl;
    std::string statUrl;
    std::string commandUrl;
    std::string infohash;
    std::string playbackSessionId;
    bool isLive{};
};

std::optional<PlaybackSession> parsePlaybackResponse(const boost::json::value& json);

// Client for one media engine's HTTP API. All calls are bounded by the
// control-plane timeout and never throw: failures are logged and reported as
// an empty result.
class EngineApi {
public:
    EngineApi(util::HttpClient& client, std::string baseAddress);

    [[nodiscard]] const std::string& baseAddress() const noexcept { return baseAddress_; }

    std::string playbackStartUrl(const std::string& contentId, int pid, bool transcodeAudio) const;

    std::optional<PlaybackSession> startPlayback(const std::string& contentId, int pid, bool transcodeAudio);
    std::optional<boost::json::value> fetchStat(const std::string& statUrl);
    bool stop(const std::string& commandUrl);
    std::optional<std::string> fetchVersion();
    bool touchPlayback(const std::string& playbackUrl);
    std::optional<std::string> fetchContentIdForInfohash(const std::string& infohash);

private:
    std::optional<boost::json::value> getJson(const std::string& url, const char* what);

    util::HttpClient& client_;
    std::string baseAddress_;
};

} // namespace acerelay::engine
