#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace acerelay::hls {

// Path prefixes under which the engine serves playlist content.
inline constexpr std::array<std::string_view, 3> kContentPaths{"/ace/c/", "/hls/c/", "/hls/m/"};

// Longest EXTINF duration taken at face value.
inline constexpr std::chrono::milliseconds kMaxSegmentDuration{std::chrono::hours{1}};

struct SegmentInfo {
    std::int64_t sequence{};
    std::optional<std::chrono::milliseconds> duration;
    std::string uri;
};

bool hasPlaylistMarker(std::string_view content);
bool isMasterPlaylist(std::string_view content);

// Last media segment line of a playlist, with the trailing sequence number
// parsed from "<digits>.ts" and the EXTINF duration that precedes it, capped
// at kMaxSegmentDuration.
// nullopt when there is no segment line or its name carries no sequence.
std::optional<SegmentInfo> lastSegment(std::string_view content);

// URI of the last non-comment line, whether or not it parses as a sequence.
std::optional<std::string> lastSegmentUri(std::string_view content);

// Line-by-line rewrite: trims each line (dropping carriage returns), removes
// "#EXT-X-MEDIA:URI=" lines and points content-path lines at `externalUrl`
// instead of `engineAddress`. Lines are joined with '\n'.
std::string rewriteManifest(std::string_view content,
                            std::string_view engineAddress,
                            std::string_view externalUrl);

} // namespace acerelay::hls
