#include "acerelay/relay/StreamRelay.hpp"
#include "acerelay/hls/Manifest.hpp"
#include "acerelay/util/JsonResponse.hpp"
#include "acerelay/util/Logging.hpp"
#include "acerelay/util/ServiceError.hpp"

#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <exception>

namespace acerelay::relay {

namespace {

constexpr char kManifestContentType[] = "application/vnd.apple.mpegurl";
constexpr char kSegmentContentType[] = "video/MP2T";

std::string toLower(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

RelayResponse errorResponse(unsigned status, std::string_view message) {
    RelayResponse response;
    response.status = status;
    response.body = util::makeMessageBody(message);
    response.headers.emplace_back("Content-Type", "application/json");
    return response;
}

void copyEndToEndHeaders(const util::HttpClient::HttpResponse& upstream, RelayResponse& response) {
    for (const auto& field : upstream) {
        std::string name(field.name_string().data(), field.name_string().size());
        if (isHopByHopHeader(name)) {
            continue;
        }
        response.headers.emplace_back(std::move(name), std::string(field.value().data(), field.value().size()));
    }
}

} // namespace

std::optional<std::string> RelayResponse::header(std::string_view name) const {
    const auto wanted = toLower(name);
    for (const auto& [key, value] : headers) {
        if (toLower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

bool isHopByHopHeader(std::string_view name) {
    const auto lowered = toLower(name);
    return std::find(kHopByHopHeaders.begin(), kHopByHopHeaders.end(), lowered) != kHopByHopHeaders.end();
}

StreamRelay::StreamRelay(util::HttpClient& client,
                         pool::ResourcePool& pool,
                         quality::QualityTracker& tracker,
                         std::string externalUrl,
                         std::chrono::milliseconds timeout)
    : client_(client)
    , pool_(pool)
    , tracker_(tracker)
    , externalUrl_(std::move(externalUrl))
    , timeout_(timeout) {
    while (!externalUrl_.empty() && externalUrl_.back() == '/') {
        externalUrl_.pop_back();
    }
}

StreamRelay::Fetched StreamRelay::fetch(const std::string& url, std::string_view what) {
    Fetched result;
    try {
        auto response = client_.get(url, timeout_);
        const auto status = response.result_int();
        if (status < 200 || status >= 300) {
            util::log(util::LogLevel::error,
                      "Reverse proxy failure " + std::string(what) + " (engine status: " + std::to_string(status) + ")");
            result.failure = errorResponse(502, "Failed to fetch HLS stream (engine status: " + std::to_string(status) + ")");
            return result;
        }
        result.response = std::move(response);
    } catch (const util::HttpError& ex) {
        if (ex.type() == util::HttpError::Type::timeout) {
            util::log(util::LogLevel::error, "Reverse proxy timeout " + std::string(what) + ": " + ex.what());
            result.failure = errorResponse(408, "HLS stream timeout");
        } else {
            util::log(util::LogLevel::error, "Reverse proxy cannot connect to engine " + std::string(what) + ": " + ex.what());
            result.failure = errorResponse(502, "Cannot connect to engine");
        }
    }
    return result;
}

void StreamRelay::reportOutcome(const std::optional<model::ContentId>& contentId, std::string_view manifest) {
    if (!contentId) {
        return;
    }
    try {
        tracker_.updateQuality(contentId->str(), manifest);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Quality update failed for " + contentId->shortForm() + ": " + ex.what());
    }
}

RelayResponse StreamRelay::rewriteAndReport(const std::optional<model::ContentId>& contentId,
                                            const util::HttpClient::HttpResponse& upstream,
                                            std::string_view what) {
    const auto& body = upstream.body();
    if (!hls::hasPlaylistMarker(body)) {
        util::log(util::LogLevel::error, "Invalid HLS stream received for " + std::string(what));
        const auto excerpt = body.substr(0, kDiagnosticExcerptLength);
        util::log(util::LogLevel::debug, "Content received: " + excerpt);
        reportOutcome(contentId, "");
        return errorResponse(400, "Invalid HLS stream: " + excerpt);
    }

    RelayResponse response;
    response.status = upstream.result_int();
    response.body = hls::rewriteManifest(body, pool_.engineAddress(), externalUrl_);
    copyEndToEndHeaders(upstream, response);
    if (!response.header("Content-Type")) {
        response.headers.emplace_back("Content-Type", kManifestContentType);
    }
    reportOutcome(contentId, response.body);
    return response;
}

RelayResponse StreamRelay::relayManifest(std::string_view contentId) {
    auto id = model::ContentId::parse(contentId);
    if (!id) {
        util::log(util::LogLevel::error, "HLS stream error: invalid content_id " + std::string(contentId));
        return errorResponse(400, "Invalid content_id: " + std::string(contentId));
    }

    std::string manifestUrl;
    try {
        manifestUrl = pool_.resolve(id->str());
    } catch (const util::ServiceError& ex) {
        util::log(util::LogLevel::error, "HLS stream error: " + std::string(ex.what()));
        auto response = errorResponse(ex.type() == util::ServiceError::Type::pool_exhausted ? 503 : ex.status(),
                                      ex.what());
        if (response.status == 503) {
            response.headers.emplace_back("Retry-After", "5");
        }
        return response;
    }

    if (manifestUrl.empty()) {
        util::log(util::LogLevel::error, "HLS stream error: engine has no session for " + id->shortForm());
        auto response = errorResponse(503, "Stream is not ready: " + id->str());
        response.headers.emplace_back("Retry-After", "5");
        return response;
    }

    util::log(util::LogLevel::trace, "HLS stream requested for " + manifestUrl);
    auto fetched = fetch(manifestUrl, "/hls/" + id->shortForm());
    if (!fetched.response) {
        reportOutcome(id, "");
        return std::move(*fetched.failure);
    }
    return rewriteAndReport(id, *fetched.response, "/hls/" + id->shortForm());
}

RelayResponse StreamRelay::relayMultistream(std::string_view path) {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    if (path.empty()) {
        return errorResponse(400, "Missing multistream path");
    }

    auto contentId = pool_.findContentIdByMultistreamPath(path);
    const auto url = pool_.engineAddress() + "/hls/m/" + std::string(path);
    auto fetched = fetch(url, "/hls/m/" + std::string(path));
    if (!fetched.response) {
        reportOutcome(contentId, "");
        return std::move(*fetched.failure);
    }
    return rewriteAndReport(contentId, *fetched.response, "/hls/m/" + std::string(path));
}

RelayResponse StreamRelay::relayContent(std::string_view prefix, std::string_view path) {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    std::string url = pool_.engineAddress();
    url += prefix;
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }
    url += path;

    auto fetched = fetch(url, std::string(prefix) + std::string(path));
    if (!fetched.response) {
        return std::move(*fetched.failure);
    }

    RelayResponse response;
    response.status = fetched.response->result_int();
    response.body = std::move(fetched.response->body());
    copyEndToEndHeaders(*fetched.response, response);
    response.headers.erase(std::remove_if(response.headers.begin(), response.headers.end(),
                                          [](const auto& header) { return toLower(header.first) == "content-type"; }),
                           response.headers.end());
    response.headers.emplace_back("Content-Type", kSegmentContentType);
    return response;
}

} // namespace acerelay::relay
