#include "acerelay/pool/PoolEntry.hpp"
#include "acerelay/util/Logging.hpp"

#include <algorithm>
#include <utility>

namespace acerelay::pool {

PoolEntry::PoolEntry(int slotNumber,
                     model::ContentId contentId,
                     engine::EngineApi& engine,
                     bool transcodeAudio,
                     util::Clock clock)
    : slotNumber_(slotNumber)
    , contentId_(std::move(contentId))
    , engine_(engine)
    , transcodeAudio_(transcodeAudio)
    , clock_(std::move(clock)) {
    const auto now = util::toEpochMillis(clock_());
    dateStartedMs_ = now;
    lastUsedMs_ = now;
}

util::TimePoint PoolEntry::dateStarted() const noexcept {
    return util::fromEpochMillis(dateStartedMs_.load());
}

util::TimePoint PoolEntry::lastUsed() const noexcept {
    return util::fromEpochMillis(lastUsedMs_.load());
}

void PoolEntry::updateLastUsed() {
    lastUsedMs_ = util::toEpochMillis(clock_());
}

bool PoolEntry::populateUrls() {
    std::scoped_lock populateLock(populateMutex_);
    if (isResolved()) {
        return true;
    }
    auto session = engine_.startPlayback(contentId_.str(), slotNumber_, transcodeAudio_);
    if (!session) {
        return false;
    }
    std::scoped_lock lock(dataMutex_);
    session_ = std::move(session);
    return true;
}

bool PoolEntry::isResolved() const {
    std::scoped_lock lock(dataMutex_);
    return session_.has_value();
}

std::string PoolEntry::manifestUrl() const {
    std::scoped_lock lock(dataMutex_);
    return session_ ? session_->playbackUrl : std::string{};
}

std::string PoolEntry::statUrl() const {
    std::scoped_lock lock(dataMutex_);
    return session_ ? session_->statUrl : std::string{};
}

std::string PoolEntry::commandUrl() const {
    std::scoped_lock lock(dataMutex_);
    return session_ ? session_->commandUrl : std::string{};
}

std::string PoolEntry::infohash() const {
    std::scoped_lock lock(dataMutex_);
    return session_ ? session_->infohash : std::string{};
}

PoolEntry::Snapshot PoolEntry::snapshot() const {
    const auto now = util::toEpochMillis(clock_());
    return Snapshot{Duration{now - dateStartedMs_.load()}, Duration{now - lastUsedMs_.load()}};
}

PoolEntry::Duration PoolEntry::requiredTimeToUnlock(const Snapshot& snap) {
    return std::min(kLockInResetMax, snap.sinceStarted - snap.sinceUsed);
}

bool PoolEntry::lockedIn(const Snapshot& snap) {
    if (snap.sinceStarted <= kLockInTime) {
        return false;
    }
    return snap.sinceUsed <= requiredTimeToUnlock(snap);
}

bool PoolEntry::runningLongEnoughToLockIn() const {
    return snapshot().sinceStarted > kLockInTime;
}

PoolEntry::Duration PoolEntry::requiredTimeToUnlock() const {
    return requiredTimeToUnlock(snapshot());
}

PoolEntry::Duration PoolEntry::timeUntilUnlock() const {
    const auto snap = snapshot();
    return requiredTimeToUnlock(snap) - snap.sinceUsed;
}

PoolEntry::Duration PoolEntry::timeRunning() const {
    return snapshot().sinceStarted;
}

bool PoolEntry::isLockedIn() const {
    return lockedIn(snapshot());
}

bool PoolEntry::checkIfStale() const {
    const auto snap = snapshot();
    const bool matured = snap.sinceStarted > kLockInTime;
    const bool locked = lockedIn(snap);
    const bool pastUnlock = requiredTimeToUnlock(snap) - snap.sinceUsed < std::chrono::seconds{1};
    const bool abandoned = snap.sinceUsed > kLockInResetMax;

    if (matured && !locked && pastUnlock) {
        util::log(util::LogLevel::debug,
                  "Old slot " + std::to_string(slotNumber_) + " with content_id " + contentId_.shortForm() +
                      " is stale");
        return true;
    }
    if (!matured && abandoned) {
        util::log(util::LogLevel::debug,
                  "New-ish and unused slot " + std::to_string(slotNumber_) + " with content_id " +
                      contentId_.shortForm() + " is stale");
        return true;
    }
    return false;
}

void PoolEntry::keepAlive() {
    if (!populateUrls()) {
        util::log(util::LogLevel::warn,
                  "No engine session for content_id " + contentId_.shortForm() + ", cannot keep alive");
        return;
    }

    const auto url = manifestUrl();
    if (checkIfStale() || !model::ContentId::isValid(contentId_.str()) || url.empty()) {
        util::log(util::LogLevel::trace, "Not keeping alive slot " + std::to_string(slotNumber_));
        return;
    }

    if (!keepAliveAnnounced_.exchange(true)) {
        util::log(util::LogLevel::info,
                  "Keeping alive slot " + std::to_string(slotNumber_) + " with content_id " + contentId_.shortForm());
    }
    engine_.touchPlayback(url);
}

bool PoolEntry::stop() {
    const auto url = commandUrl();
    if (url.empty()) {
        util::log(util::LogLevel::warn,
                  "No command URL for content_id " + contentId_.shortForm() + ", cannot stop instance");
        return false;
    }
    if (!engine_.stop(url)) {
        util::log(util::LogLevel::error, "Failed to stop engine instance with content_id " + contentId_.shortForm());
        return false;
    }
    util::log(util::LogLevel::info, "Stopped engine instance with content_id " + contentId_.shortForm());
    return true;
}

std::optional<boost::json::value> PoolEntry::fetchStat() {
    const auto url = statUrl();
    if (url.empty()) {
        util::log(util::LogLevel::warn, "No engine session for content_id " + contentId_.shortForm() + ", cannot fetch stats");
        return std::nullopt;
    }
    return engine_.fetchStat(url);
}

bool PoolEntry::tryBeginKeepAlive() noexcept {
    return !keepAliveInFlight_.exchange(true);
}

void PoolEntry::endKeepAlive() noexcept {
    keepAliveInFlight_ = false;
}

} // namespace acerelay::pool
