#include "acerelay/pool/ResourcePool.hpp"
#include "acerelay/util/JsonResponse.hpp"
#include "acerelay/util/Logging.hpp"
#include "acerelay/util/ServiceError.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <utility>

namespace acerelay::pool {
namespace {

std::int64_t toSeconds(std::chrono::milliseconds value) {
    return std::chrono::duration_cast<std::chrono::seconds>(value).count();
}

// Clears the in-flight flag however the keep-alive ends.
struct KeepAliveGuard {
    PoolEntry& entry;
    ~KeepAliveGuard() { entry.endKeepAlive(); }
};

} // namespace

boost::json::object toJson(const EntryView& view) {
    boost::json::object obj;
    obj["slot_number"] = view.slotNumber;
    obj["content_id"] = view.contentId;
    obj["locked_in"] = view.lockedIn;
    obj["time_until_unlock"] = toSeconds(view.timeUntilUnlock);
    obj["time_running"] = toSeconds(view.timeRunning);
    obj["date_started"] = util::formatIsoTimestamp(view.dateStarted);
    obj["last_used"] = util::formatIsoTimestamp(view.lastUsed);
    obj["manifest_url"] = view.manifestUrl;
    obj["stat"] = view.stat ? *view.stat : boost::json::value(nullptr);
    return obj;
}

boost::json::object toJson(const PoolSnapshot& snapshot) {
    boost::json::object obj;
    obj["ace_address"] = snapshot.engineAddress;
    obj["max_size"] = snapshot.maxSize;
    obj["healthy"] = snapshot.healthy;
    obj["engine_version"] = snapshot.engineVersion;
    obj["transcode_audio"] = snapshot.transcodeAudio;
    obj["external_url"] = snapshot.externalUrl;
    boost::json::array entries;
    for (const auto& view : snapshot.entries) {
        entries.push_back(toJson(view));
    }
    obj["ace_instances"] = std::move(entries);
    return obj;
}

ResourcePool::ResourcePool(engine::EngineApi& engine,
                           boost::asio::thread_pool& workers,
                           PoolSettings settings,
                           util::Clock clock)
    : engine_(engine)
    , workers_(workers)
    , settings_(std::move(settings))
    , clock_(std::move(clock)) {
    if (settings_.maxSize == 0) {
        settings_.maxSize = 1;
    }
}

std::string ResourcePool::resolve(std::string_view contentId) {
    auto id = model::ContentId::parse(contentId);
    if (!id) {
        util::log(util::LogLevel::warn, "Rejected invalid content_id: " + std::string(contentId));
        throw util::ServiceError(util::ServiceError::Type::invalid_content_id,
                                 "Invalid content_id: " + std::string(contentId));
    }
    if (engine_.baseAddress().empty()) {
        util::log(util::LogLevel::error, "Engine address is not configured");
        throw util::ServiceError(util::ServiceError::Type::upstream_unreachable, "Engine address is not configured");
    }

    // Touches happen with the map locked so that reclaim and stale eviction,
    // which decide under the exclusive lock, always see them.
    std::shared_ptr<PoolEntry> entry;
    {
        std::shared_lock lock(mutex_);
        entry = findLocked(*id);
        if (entry) {
            entry->updateLastUsed();
        }
    }

    bool created = false;
    std::vector<std::shared_ptr<PoolEntry>> evicted;
    if (!entry) {
        std::unique_lock lock(mutex_);
        entry = findLocked(*id);
        if (entry) {
            entry->updateLastUsed();
        } else {
            auto slot = claimSlotLocked(evicted);
            if (!slot) {
                throw util::ServiceError(util::ServiceError::Type::pool_exhausted,
                                         "No available engine slot for " + id->shortForm());
            }
            entry = std::make_shared<PoolEntry>(*slot, *id, engine_, settings_.transcodeAudio, clock_);
            entries_.emplace(*slot, entry);
            created = true;
        }
    }

    for (auto& old : evicted) {
        dispatchStop(std::move(old));
    }

    if (created) {
        util::log(util::LogLevel::info,
                  "Bound content_id " + id->shortForm() + " to slot " + std::to_string(entry->slotNumber()));
    }

    const bool wasResolved = entry->isResolved();
    if (entry->populateUrls() && !wasResolved) {
        notifyInfohash(*entry);
    }
    return entry->manifestUrl();
}

std::optional<int> ResourcePool::getAvailableSlotNumber() {
    std::vector<std::shared_ptr<PoolEntry>> evicted;
    std::optional<int> slot;
    {
        std::unique_lock lock(mutex_);
        slot = claimSlotLocked(evicted);
    }
    for (auto& old : evicted) {
        dispatchStop(std::move(old));
    }
    return slot;
}

std::optional<int> ResourcePool::claimSlotLocked(std::vector<std::shared_ptr<PoolEntry>>& evicted) {
    const int maxSlot = static_cast<int>(settings_.maxSize);
    for (int slot = 1; slot <= maxSlot; ++slot) {
        if (entries_.find(slot) == entries_.end()) {
            return slot;
        }
    }

    // Map iteration is in slot order, so strict comparison keeps the lowest
    // slot among equal last_used values.
    std::shared_ptr<PoolEntry> oldest;
    for (const auto& [slot, entry] : entries_) {
        if (entry->isLockedIn()) {
            continue;
        }
        if (!oldest || entry->lastUsed() < oldest->lastUsed()) {
            oldest = entry;
        }
    }

    if (!oldest) {
        util::log(util::LogLevel::error, "Engine pool is full and every slot is locked in");
        return std::nullopt;
    }

    const int slot = oldest->slotNumber();
    util::log(util::LogLevel::info,
              "Reclaiming slot " + std::to_string(slot) + " from content_id " + oldest->contentId().shortForm());
    entries_.erase(slot);
    evicted.push_back(std::move(oldest));
    return slot;
}

bool ResourcePool::remove(std::string_view contentId, std::string_view caller) {
    auto id = model::ContentId::parse(contentId);
    if (!id) {
        throw util::ServiceError(util::ServiceError::Type::invalid_content_id,
                                 "Invalid content_id: " + std::string(contentId));
    }

    std::shared_ptr<PoolEntry> entry;
    {
        std::unique_lock lock(mutex_);
        entry = findLocked(*id);
        if (entry) {
            entries_.erase(entry->slotNumber());
        }
    }
    if (!entry) {
        return false;
    }

    util::log(util::LogLevel::info,
              (caller.empty() ? std::string("Removed") : std::string(caller) + ": removed") + " content_id " +
                  id->shortForm() + " from slot " + std::to_string(entry->slotNumber()));
    entry->stop();
    return true;
}

bool ResourcePool::checkEngineHealth() {
    auto version = engine_.fetchVersion();
    const bool nowHealthy = version.has_value();
    const bool wasHealthy = healthy_.exchange(nowHealthy);
    {
        std::scoped_lock lock(versionMutex_);
        engineVersion_ = version.value_or("unknown");
    }
    if (nowHealthy && !wasHealthy) {
        util::log(util::LogLevel::info, "Engine at " + engine_.baseAddress() + " is healthy, version " + *version);
    } else if (!nowHealthy && wasHealthy) {
        util::log(util::LogLevel::error, "Engine at " + engine_.baseAddress() + " is not responding");
    }
    return nowHealthy;
}

void ResourcePool::runMaintenance() {
    try {
        checkEngineHealth();
    } catch (const std::exception& ex) {
        healthy_ = false;
        util::log(util::LogLevel::error, std::string("Engine health check failed: ") + ex.what());
    }

    std::vector<std::shared_ptr<PoolEntry>> survivors;
    for (auto& entry : entriesCopy()) {
        try {
            switch (evictIfStale(entry)) {
            case Eviction::evicted:
                util::log(util::LogLevel::info,
                          "poolboy: evicting stale content_id " + entry->contentId().shortForm() + " from slot " +
                              std::to_string(entry->slotNumber()));
                dispatchStop(entry);
                break;
            case Eviction::kept:
                survivors.push_back(entry);
                break;
            case Eviction::gone:
                break;
            }
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error,
                      "Staleness check failed for slot " + std::to_string(entry->slotNumber()) + ": " + ex.what());
        }
    }

    for (auto& entry : survivors) {
        dispatchKeepAlive(std::move(entry));
    }
}

std::string ResourcePool::engineVersion() const {
    std::scoped_lock lock(versionMutex_);
    return engineVersion_;
}

std::size_t ResourcePool::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::shared_ptr<PoolEntry> ResourcePool::findLocked(const model::ContentId& contentId) const {
    for (const auto& [slot, entry] : entries_) {
        if (entry->contentId() == contentId) {
            return entry;
        }
    }
    return nullptr;
}

std::shared_ptr<PoolEntry> ResourcePool::findEntryByContentId(std::string_view contentId) const {
    auto id = model::ContentId::parse(contentId);
    if (!id) {
        return nullptr;
    }
    std::shared_lock lock(mutex_);
    return findLocked(*id);
}

std::shared_ptr<PoolEntry> ResourcePool::findEntryBySlot(int slotNumber) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(slotNumber);
    return it == entries_.end() ? nullptr : it->second;
}

std::optional<model::ContentId> ResourcePool::findContentIdByMultistreamPath(std::string_view path) const {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    const auto component = path.substr(0, path.find('/'));
    if (component.empty()) {
        return std::nullopt;
    }
    std::shared_lock lock(mutex_);
    for (const auto& [slot, entry] : entries_) {
        if (entry->manifestUrl().find(component) != std::string::npos) {
            entry->updateLastUsed();
            return entry->contentId();
        }
    }
    return std::nullopt;
}

std::vector<std::shared_ptr<PoolEntry>> ResourcePool::entriesCopy() const {
    std::vector<std::shared_ptr<PoolEntry>> copy;
    std::shared_lock lock(mutex_);
    copy.reserve(entries_.size());
    for (const auto& [slot, entry] : entries_) {
        copy.push_back(entry);
    }
    return copy;
}

ResourcePool::Eviction ResourcePool::evictIfStale(const std::shared_ptr<PoolEntry>& entry) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(entry->slotNumber());
    if (it == entries_.end() || it->second != entry) {
        return Eviction::gone;
    }
    if (!entry->checkIfStale()) {
        return Eviction::kept;
    }
    entries_.erase(it);
    return Eviction::evicted;
}

EntryView ResourcePool::makeView(const std::shared_ptr<PoolEntry>& entry, bool withStat) {
    EntryView view;
    view.slotNumber = entry->slotNumber();
    view.contentId = entry->contentId().str();
    view.lockedIn = entry->isLockedIn();
    view.timeUntilUnlock = view.lockedIn ? entry->timeUntilUnlock() : std::chrono::milliseconds{0};
    view.timeRunning = entry->timeRunning();
    view.dateStarted = entry->dateStarted();
    view.lastUsed = entry->lastUsed();
    view.manifestUrl = entry->manifestUrl();
    if (withStat && healthy()) {
        view.stat = entry->fetchStat();
    }
    return view;
}

PoolSnapshot ResourcePool::snapshot() {
    PoolSnapshot snap;
    snap.engineAddress = engine_.baseAddress();
    snap.maxSize = settings_.maxSize;
    snap.healthy = healthy();
    snap.engineVersion = engineVersion();
    snap.transcodeAudio = settings_.transcodeAudio;
    snap.externalUrl = settings_.externalUrl;
    for (auto& entry : entriesCopy()) {
        snap.entries.push_back(makeView(entry, true));
    }
    return snap;
}

std::optional<EntryView> ResourcePool::viewByContentId(std::string_view contentId) {
    auto entry = findEntryByContentId(contentId);
    if (!entry) {
        return std::nullopt;
    }
    return makeView(entry, false);
}

std::optional<EntryView> ResourcePool::viewBySlot(int slotNumber) {
    auto entry = findEntryBySlot(slotNumber);
    if (!entry) {
        return std::nullopt;
    }
    return makeView(entry, false);
}

std::optional<boost::json::value> ResourcePool::statsByContentId(std::string_view contentId) {
    if (!healthy()) {
        return std::nullopt;
    }
    auto entry = findEntryByContentId(contentId);
    return entry ? entry->fetchStat() : std::nullopt;
}

std::optional<boost::json::value> ResourcePool::statsBySlot(int slotNumber) {
    if (!healthy()) {
        return std::nullopt;
    }
    auto entry = findEntryBySlot(slotNumber);
    return entry ? entry->fetchStat() : std::nullopt;
}

void ResourcePool::setInfohashObserver(InfohashObserver observer) {
    std::scoped_lock lock(observerMutex_);
    infohashObserver_ = std::move(observer);
}

void ResourcePool::notifyInfohash(const PoolEntry& entry) {
    const auto infohash = entry.infohash();
    if (infohash.empty()) {
        return;
    }
    InfohashObserver observer;
    {
        std::scoped_lock lock(observerMutex_);
        observer = infohashObserver_;
    }
    if (!observer) {
        return;
    }
    try {
        observer(entry.contentId(), infohash);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string("Failed to record infohash: ") + ex.what());
    }
}

void ResourcePool::dispatchStop(std::shared_ptr<PoolEntry> entry) {
    boost::asio::post(workers_, [entry = std::move(entry)]() {
        try {
            entry->stop();
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, std::string("Stopping engine instance failed: ") + ex.what());
        }
    });
}

void ResourcePool::dispatchKeepAlive(std::shared_ptr<PoolEntry> entry) {
    if (!entry->tryBeginKeepAlive()) {
        util::log(util::LogLevel::debug,
                  "Keep-alive still running for slot " + std::to_string(entry->slotNumber()));
        return;
    }
    boost::asio::post(workers_, [this, entry = std::move(entry)]() {
        KeepAliveGuard guard{*entry};
        const bool wasResolved = entry->isResolved();
        try {
            entry->keepAlive();
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error,
                      "Keep-alive failed for slot " + std::to_string(entry->slotNumber()) + ": " + ex.what());
        }
        if (!wasResolved && entry->isResolved()) {
            notifyInfohash(*entry);
        }
    });
}

} // namespace acerelay::pool
