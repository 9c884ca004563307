#pragma once

#include "acerelay/engine/EngineApi.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/util/Clock.hpp"

#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace acerelay::pool {

inline constexpr std::chrono::milliseconds kLockInTime{std::chrono::minutes{5}};
inline constexpr std::chrono::milliseconds kLockInResetMax{std::chrono::minutes{15}};

// One engine process slot bound to one piece of content.
//
// Timestamps are atomics so the request path can touch an entry while the
// maintenance loop evaluates it; every policy query works on a single
// (now, last_used) snapshot.
class PoolEntry {
public:
    using Duration = std::chrono::milliseconds;

    PoolEntry(int slotNumber,
              model::ContentId contentId,
              engine::EngineApi& engine,
              bool transcodeAudio,
              util::Clock clock);

    PoolEntry(const PoolEntry&) = delete;
    PoolEntry& operator=(const PoolEntry&) = delete;

    [[nodiscard]] int slotNumber() const noexcept { return slotNumber_; }
    [[nodiscard]] const model::ContentId& contentId() const noexcept { return contentId_; }
    [[nodiscard]] util::TimePoint dateStarted() const noexcept;
    [[nodiscard]] util::TimePoint lastUsed() const noexcept;

    void updateLastUsed();

    // Asks the engine for the playback URLs. No-op once resolved; concurrent
    // callers wait for the one in flight. Returns whether the entry is resolved.
    bool populateUrls();

    [[nodiscard]] bool isResolved() const;
    [[nodiscard]] std::string manifestUrl() const;
    [[nodiscard]] std::string statUrl() const;
    [[nodiscard]] std::string commandUrl() const;
    [[nodiscard]] std::string infohash() const;

    [[nodiscard]] bool runningLongEnoughToLockIn() const;
    [[nodiscard]] Duration requiredTimeToUnlock() const;
    [[nodiscard]] Duration timeUntilUnlock() const;
    [[nodiscard]] Duration timeRunning() const;
    [[nodiscard]] bool isLockedIn() const;
    [[nodiscard]] bool checkIfStale() const;

    void keepAlive();
    bool stop();
    std::optional<boost::json::value> fetchStat();

    // Guards against stacking keep-alives when the engine is slower than the
    // maintenance interval.
    bool tryBeginKeepAlive() noexcept;
    void endKeepAlive() noexcept;

private:
    struct Snapshot {
        Duration sinceStarted;
        Duration sinceUsed;
    };

    Snapshot snapshot() const;
    static Duration requiredTimeToUnlock(const Snapshot& snap);
    static bool lockedIn(const Snapshot& snap);

    const int slotNumber_;
    const model::ContentId contentId_;
    engine::EngineApi& engine_;
    const bool transcodeAudio_;
    util::Clock clock_;

    std::atomic<std::int64_t> dateStartedMs_;
    std::atomic<std::int64_t> lastUsedMs_;

    std::mutex populateMutex_;
    mutable std::mutex dataMutex_;
    std::optional<engine::PlaybackSession> session_;

    std::atomic<bool> keepAliveInFlight_{false};
    std::atomic<bool> keepAliveAnnounced_{false};
};

} // namespace acerelay::pool
