#include "acerelay/config/AppConfig.hpp"
#include "acerelay/util/JsonUtil.hpp"
#include "acerelay/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>
#include <utility>

namespace acerelay::config {
namespace {

void stripTrailingSlashes(std::string& value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
}

// Stream counts outside [1, kMaxStreamsLimit] are pulled to the nearest bound.
unsigned int clampStreams(std::int64_t value) {
    return static_cast<unsigned int>(std::clamp<std::int64_t>(value, 1, kMaxStreamsLimit));
}

bool parseFlag(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

} // namespace

AppConfig loadConfig(const boost::json::object& json, AppConfig base) {
    AppConfig cfg = std::move(base);
    if (auto it = json.if_contains("engineAddress")) cfg.engineAddress = std::string(it->as_string());
    if (auto it = json.if_contains("externalUrl")) cfg.externalUrl = std::string(it->as_string());
    if (auto it = json.if_contains("maxStreams")) cfg.maxStreams = clampStreams(it->as_int64());
    if (auto it = json.if_contains("transcodeAudio")) cfg.transcodeAudio = it->as_bool();
    if (auto it = json.if_contains("listenHost")) cfg.listenHost = std::string(it->as_string());
    if (auto it = json.if_contains("listenPort")) cfg.listenPort = static_cast<std::uint16_t>(it->as_int64());
    if (auto it = json.if_contains("instanceDir")) cfg.instanceDir = std::string(it->as_string());
    if (auto it = json.if_contains("logLevel")) cfg.logLevel = std::string(it->as_string());
    if (auto it = json.if_contains("ioThreads")) cfg.ioThreads = static_cast<unsigned int>(it->as_int64());
    if (auto it = json.if_contains("workerThreads")) cfg.workerThreads = static_cast<unsigned int>(it->as_int64());
    return cfg;
}

void applyEnvironment(AppConfig& config) {
    if (const char* value = std::getenv("ACERELAY_ENGINE_ADDRESS")) config.engineAddress = value;
    if (const char* value = std::getenv("ACERELAY_EXTERNAL_URL")) config.externalUrl = value;
    if (const char* value = std::getenv("ACERELAY_MAX_STREAMS")) {
        config.maxStreams = clampStreams(std::strtoll(value, nullptr, 10));
    }
    if (const char* value = std::getenv("ACERELAY_TRANSCODE_AUDIO")) config.transcodeAudio = parseFlag(value);
    if (const char* value = std::getenv("ACERELAY_LISTEN_HOST")) config.listenHost = value;
    if (const char* value = std::getenv("ACERELAY_LISTEN_PORT")) {
        config.listenPort = static_cast<std::uint16_t>(std::strtoul(value, nullptr, 10));
    }
    if (const char* value = std::getenv("ACERELAY_INSTANCE_DIR")) config.instanceDir = value;
    if (const char* value = std::getenv("ACERELAY_LOG_LEVEL")) config.logLevel = value;
}

void normalize(AppConfig& config) {
    stripTrailingSlashes(config.engineAddress);
    stripTrailingSlashes(config.externalUrl);
    config.maxStreams = std::clamp(config.maxStreams, 1u, static_cast<unsigned int>(kMaxStreamsLimit));
    config.ioThreads = std::max(2u, config.ioThreads);
    config.workerThreads = std::max(2u, config.workerThreads);
}

AppConfig loadAppConfig(const std::filesystem::path& path) {
    AppConfig config;
    config.ioThreads = std::max(2u, std::thread::hardware_concurrency());
    config.workerThreads = std::max(2u, std::thread::hardware_concurrency());

    if (auto content = util::readTextFile(path); content && !content->empty()) {
        try {
            auto json = util::parseJson(*content);
            if (json.is_object()) {
                config = loadConfig(json.as_object(), config);
            } else {
                util::log(util::LogLevel::warn, "Config file " + path.string() + " is not a JSON object, using defaults");
            }
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn,
                      "Failed to parse config file " + path.string() + ": " + std::string(ex.what()));
        }
    }

    applyEnvironment(config);
    normalize(config);
    return config;
}

} // namespace acerelay::config
