#include "acerelay/engine/EngineApi.hpp"
#include "acerelay/hls/Manifest.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/util/JsonUtil.hpp"
#include "acerelay/util/Logging.hpp"

#include <boost/beast/http.hpp>

#include <exception>
#include <utility>

namespace acerelay::engine {
namespace {

bool isSuccess(const util::HttpClient::HttpResponse& response) {
    return response.result_int() >= 200 && response.result_int() < 300;
}

} // namespace

std::optional<PlaybackSession> parsePlaybackResponse(const boost::json::value& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    const auto& root = json.as_object();
    if (auto error = root.if_contains("error"); error && !error->is_null()) {
        util::log(util::LogLevel::error,
                  "Engine playback start returned error: " + util::stringifyJson(*error));
        return std::nullopt;
    }
    auto response = root.if_contains("response");
    if (!response || !response->is_object()) {
        return std::nullopt;
    }
    const auto& obj = response->as_object();

    PlaybackSession session;
    auto playback = util::getString(obj, "playback_url");
    auto stat = util::getString(obj, "stat_url");
    auto command = util::getString(obj, "command_url");
    if (!playback || !stat || !command || playback->empty()) {
        return std::nullopt;
    }
    session.playbackUrl = std::move(*playback);
    session.statUrl = std::move(*stat);
    session.commandUrl = std::move(*command);
    session.infohash = util::getString(obj, "infohash").value_or("");
    session.playbackSessionId = util::getString(obj, "playback_session_id").value_or("");
    session.isLive = util::getInt(obj, "is_live").value_or(0) != 0;
    return session;
}

EngineApi::EngineApi(util::HttpClient& client, std::string baseAddress)
    : client_(client)
    , baseAddress_(std::move(baseAddress)) {
    while (!baseAddress_.empty() && baseAddress_.back() == '/') {
        baseAddress_.pop_back();
    }
}

std::string EngineApi::playbackStartUrl(const std::string& contentId, int pid, bool transcodeAudio) const {
    return baseAddress_ + "/ace/manifest.m3u8?format=json&content_id=" + contentId +
           "&transcode_ac3=" + (transcodeAudio ? "true" : "false") + "&pid=" + std::to_string(pid);
}

std::optional<boost::json::value> EngineApi::getJson(const std::string& url, const char* what) {
    try {
        auto response = client_.get(url, kControlTimeout);
        if (!isSuccess(response)) {
            util::log(util::LogLevel::warn,
                      std::string(what) + " returned HTTP " + std::to_string(response.result_int()));
            return std::nullopt;
        }
        return util::parseJson(response.body());
    } catch (const util::HttpError& ex) {
        util::log(util::LogLevel::warn, std::string(what) + " unreachable: " + std::string(ex.what()));
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string(what) + " malformed: " + std::string(ex.what()));
    }
    return std::nullopt;
}

std::optional<PlaybackSession> EngineApi::startPlayback(const std::string& contentId, int pid, bool transcodeAudio) {
    auto json = getJson(playbackStartUrl(contentId, pid, transcodeAudio), "Engine playback start");
    if (!json) {
        util::log(util::LogLevel::warn, "Failed to fetch engine URLs for content_id " + model::shortId(contentId));
        return std::nullopt;
    }
    auto session = parsePlaybackResponse(*json);
    if (!session) {
        util::log(util::LogLevel::warn,
                  "Engine playback start for " + model::shortId(contentId) + " returned no usable session");
    }
    return session;
}

std::optional<boost::json::value> EngineApi::fetchStat(const std::string& statUrl) {
    if (statUrl.empty()) {
        return std::nullopt;
    }
    auto json = getJson(statUrl, "Engine stat");
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    auto response = json->as_object().if_contains("response");
    if (!response || !response->is_object()) {
        util::log(util::LogLevel::info, "Engine stat response has unexpected shape: " + util::stringifyJson(*json));
        return std::nullopt;
    }
    return *response;
}

bool EngineApi::stop(const std::string& commandUrl) {
    if (commandUrl.empty()) {
        return false;
    }
    try {
        auto response = client_.get(commandUrl + "?method=stop", kControlTimeout);
        if (!isSuccess(response)) {
            util::log(util::LogLevel::error, "Engine stop returned HTTP " + std::to_string(response.result_int()));
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Engine stop failed: " + std::string(ex.what()));
    }
    return false;
}

std::optional<std::string> EngineApi::fetchVersion() {
    if (baseAddress_.empty()) {
        return std::nullopt;
    }
    auto json = getJson(baseAddress_ + "/webui/api/service?method=get_version", "Engine version");
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    auto result = json->as_object().if_contains("result");
    if (!result || !result->is_object()) {
        return std::string("unknown");
    }
    return util::getString(result->as_object(), "version").value_or("unknown");
}

bool EngineApi::touchPlayback(const std::string& playbackUrl) {
    if (playbackUrl.empty()) {
        return false;
    }
    try {
        auto response = client_.get(playbackUrl, kControlTimeout);
        util::log(util::LogLevel::trace, "Keep alive, response: " + std::to_string(response.result_int()));
        if (!isSuccess(response)) {
            return false;
        }
        if (auto segment = hls::lastSegmentUri(response.body());
            segment && segment->rfind("http", 0) == 0) {
            auto segmentResponse = client_.get(*segment, kControlTimeout);
            util::log(util::LogLevel::trace,
                      "Keep alive segment, response: " + std::to_string(segmentResponse.result_int()));
        }
        return true;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::trace, "Keep alive failed: " + std::string(ex.what()));
    }
    return false;
}

std::optional<std::string> EngineApi::fetchContentIdForInfohash(const std::string& infohash) {
    if (!model::ContentId::isValid(infohash)) {
        return std::nullopt;
    }
    auto json = getJson(baseAddress_ + "/server/api?api_version=3&method=get_content_id&infohash=" + infohash,
                        "Engine content id lookup");
    if (!json || !json->is_object()) {
        return std::nullopt;
    }
    auto result = json->as_object().if_contains("result");
    if (!result || !result->is_object()) {
        return std::nullopt;
    }
    auto contentId = util::getString(result->as_object(), "content_id");
    if (!contentId || !model::ContentId::isValid(*contentId)) {
        return std::nullopt;
    }
    return contentId;
}

} // namespace acerelay::engine
