#include "acerelay/hls/Manifest.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>
#include <vector>

namespace acerelay::hls {
namespace {

const std::regex& sequencePattern() {
    static const std::regex pattern(R"((\d+)\.ts)");
    return pattern;
}

const std::regex& extinfPattern() {
    static const std::regex pattern(R"(EXTINF:(\d+(\.\d+)?),)");
    return pattern;
}

std::string_view trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string_view> splitLines(std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= content.size()) {
        auto pos = content.find('\n', start);
        if (pos == std::string_view::npos) {
            if (start < content.size()) {
                lines.push_back(content.substr(start));
            }
            break;
        }
        lines.push_back(content.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

bool isUriLine(std::string_view line) {
    return !line.empty() && line.front() != '#';
}

std::optional<std::size_t> lastUriIndex(const std::vector<std::string_view>& lines) {
    for (std::size_t i = lines.size(); i > 0; --i) {
        if (isUriLine(trim(lines[i - 1]))) {
            return i - 1;
        }
    }
    return std::nullopt;
}

} // namespace

bool hasPlaylistMarker(std::string_view content) {
    return content.find("#EXTM3U") != std::string_view::npos;
}

bool isMasterPlaylist(std::string_view content) {
    return content.find("#EXT-X-STREAM-INF") != std::string_view::npos;
}

std::optional<std::string> lastSegmentUri(std::string_view content) {
    auto lines = splitLines(content);
    auto index = lastUriIndex(lines);
    if (!index) {
        return std::nullopt;
    }
    return std::string(trim(lines[*index]));
}

std::optional<SegmentInfo> lastSegment(std::string_view content) {
    auto lines = splitLines(content);
    auto index = lastUriIndex(lines);
    if (!index) {
        return std::nullopt;
    }

    SegmentInfo info;
    info.uri = std::string(trim(lines[*index]));

    std::smatch match;
    if (!std::regex_search(info.uri, match, sequencePattern())) {
        return std::nullopt;
    }
    try {
        info.sequence = std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    for (std::size_t i = *index; i > 0; --i) {
        std::string line(trim(lines[i - 1]));
        if (isUriLine(line)) {
            break;
        }
        std::smatch durationMatch;
        if (std::regex_search(line, durationMatch, extinfPattern())) {
            try {
                const double seconds = std::stod(durationMatch[1].str());
                const auto millis = std::min(seconds * 1000.0, static_cast<double>(kMaxSegmentDuration.count()));
                info.duration = std::chrono::milliseconds(static_cast<std::int64_t>(millis));
            } catch (const std::out_of_range&) {
                info.duration = kMaxSegmentDuration;
            }
            break;
        }
    }
    return info;
}

std::string rewriteManifest(std::string_view content,
                            std::string_view engineAddress,
                            std::string_view externalUrl) {
    std::string output;
    output.reserve(content.size());
    bool first = true;
    for (auto raw : splitLines(content)) {
        std::string line(trim(raw));
        if (line.find("#EXT-X-MEDIA:URI=") != std::string::npos) {
            continue;
        }
        if (!engineAddress.empty() &&
            std::any_of(kContentPaths.begin(), kContentPaths.end(),
                        [&line](std::string_view path) { return line.find(path) != std::string::npos; })) {
            std::size_t pos = 0;
            while ((pos = line.find(engineAddress, pos)) != std::string::npos) {
                line.replace(pos, engineAddress.size(), externalUrl);
                pos += externalUrl.size();
            }
        }
        if (!first) {
            output.push_back('\n');
        }
        output += line;
        first = false;
    }
    return output;
}

} // namespace acerelay::hls
