#pragma once

#include "acerelay/model/ContentId.hpp"
#include "acerelay/pool/ResourcePool.hpp"
#include "acerelay/quality/QualityTracker.hpp"
#include "acerelay/util/HttpClient.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace acerelay::relay {

inline constexpr std::chrono::seconds kRelayTimeout{10};
inline constexpr std::size_t kDiagnosticExcerptLength = 1000;
inline constexpr std::array<std::string_view, 5> kHopByHopHeaders{
    "content-encoding", "content-length", "transfer-encoding", "connection", "keep-alive"};

struct RelayResponse {
    unsigned status{200};
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

bool isHopByHopHeader(std::string_view name);

// Fetches playlists and segments from engine slots on behalf of clients and
// feeds every manifest outcome to the quality tracker.
class StreamRelay {
public:
    StreamRelay(util::HttpClient& client,
                pool::ResourcePool& pool,
                quality::QualityTracker& tracker,
                std::string externalUrl,
                std::chrono::milliseconds timeout = kRelayTimeout);

    RelayResponse relayManifest(std::string_view contentId);
    RelayResponse relayMultistream(std::string_view path);
    RelayResponse relayContent(std::string_view prefix, std::string_view path);

    [[nodiscard]] const std::string& externalUrl() const noexcept { return externalUrl_; }

private:
    struct Fetched {
        std::optional<util::HttpClient::HttpResponse> response;
        std::optional<RelayResponse> failure;
    };

    Fetched fetch(const std::string& url, std::string_view what);
    RelayResponse rewriteAndReport(const std::optional<model::ContentId>& contentId,
                                   const util::HttpClient::HttpResponse& upstream,
                                   std::string_view what);
    void reportOutcome(const std::optional<model::ContentId>& contentId, std::string_view manifest);

    util::HttpClient& client_;
    pool::ResourcePool& pool_;
    quality::QualityTracker& tracker_;
    std::string externalUrl_;
    std::chrono::milliseconds timeout_;
};

} // namespace acerelay::relay
