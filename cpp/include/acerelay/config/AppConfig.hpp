#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace acerelay::config {

inline constexpr unsigned int kMaxStreamsLimit = 1000;

struct AppConfig {
    std::string engineAddress{"http://127.0.0.1:6878"};
    std::string externalUrl{"http://127.0.0.1:5100"};
    unsigned int maxStreams{4};
    bool transcodeAudio{false};
    std::string listenHost{"0.0.0.0"};
    std::uint16_t listenPort{5100};
    std::filesystem::path instanceDir{"instance"};
    std::string logLevel{"info"};
    unsigned int ioThreads{2};
    unsigned int workerThreads{2};

    [[nodiscard]] std::filesystem::path qualityStorePath() const { return instanceDir / "quality_cache.json"; }
    [[nodiscard]] std::filesystem::path infohashMapPath() const { return instanceDir / "content_id_infohash.csv"; }
    [[nodiscard]] std::filesystem::path xcIdMapPath() const { return instanceDir / "content_id_xc_id.csv"; }
};

// Overlays the members present in `json` onto `base`. Throws on members of
// the wrong type.
AppConfig loadConfig(const boost::json::object& json, AppConfig base = {});

// ACERELAY_* environment variables win over file values.
void applyEnvironment(AppConfig& config);

// Clamps stream counts to [1, kMaxStreamsLimit], thread counts to at least two,
// and
// strips trailing slashes from the addresses.
void normalize(AppConfig& config);

// Defaults, then `path` if it exists and parses, then the environment.
AppConfig loadAppConfig(const std::filesystem::path& path);

} // namespace acerelay::config
