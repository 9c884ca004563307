#pragma once

#include "acerelay/engine/EngineApi.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/pool/PoolEntry.hpp"
#include "acerelay/util/Clock.hpp"

#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace acerelay::pool {

inline constexpr std::chrono::seconds kMaintenanceInterval{10};

struct PoolSettings {
    std::size_t maxSize{4};
    bool transcodeAudio{false};
    std::string externalUrl;
};

struct EntryView {
    int slotNumber{};
    std::string contentId;
    bool lockedIn{};
    std::chrono::milliseconds timeUntilUnlock{};
    std::chrono::milliseconds timeRunning{};
    util::TimePoint dateStarted;
    util::TimePoint lastUsed;
    std::string manifestUrl;
    std::optional<boost::json::value> stat;
};

struct PoolSnapshot {
    std::string engineAddress;
    std::size_t maxSize{};
    bool healthy{};
    std::string engineVersion;
    bool transcodeAudio{};
    std::string externalUrl;
    std::vector<EntryView> entries;
};

boost::json::object toJson(const EntryView& view);
boost::json::object toJson(const PoolSnapshot& snapshot);

// Bounded set of engine slots. Lookups take a shared lock, structural changes
// an exclusive one; engine I/O always happens with the map unlocked.
class ResourcePool {
public:
    using InfohashObserver = std::function<void(const model::ContentId&, const std::string&)>;

    ResourcePool(engine::EngineApi& engine,
                 boost::asio::thread_pool& workers,
                 PoolSettings settings,
                 util::Clock clock = util::systemClock());

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    // Returns the manifest URL bound to `contentId`, creating a binding when
    // needed. Empty when the engine has not handed out a session yet.
    // Throws ServiceError (invalid_content_id, pool_exhausted,
    // upstream_unreachable when no engine address is configured).
    std::string resolve(std::string_view contentId);

    // Lowest free slot, otherwise the slot of the least recently used entry
    // that is not locked in (which is stopped and removed).
    std::optional<int> getAvailableSlotNumber();

    bool remove(std::string_view contentId, std::string_view caller = {});

    // One poolboy tick: health check, stale eviction, keep-alives.
    void runMaintenance();
    bool checkEngineHealth();

    [[nodiscard]] bool healthy() const noexcept { return healthy_.load(); }
    [[nodiscard]] std::string engineVersion() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t maxSize() const noexcept { return settings_.maxSize; }
    [[nodiscard]] const std::string& engineAddress() const noexcept { return engine_.baseAddress(); }

    std::shared_ptr<PoolEntry> findEntryByContentId(std::string_view contentId) const;
    std::shared_ptr<PoolEntry> findEntryBySlot(int slotNumber) const;
    std::optional<model::ContentId> findContentIdByMultistreamPath(std::string_view path) const;

    PoolSnapshot snapshot();
    std::optional<EntryView> viewByContentId(std::string_view contentId);
    std::optional<EntryView> viewBySlot(int slotNumber);
    std::optional<boost::json::value> statsByContentId(std::string_view contentId);
    std::optional<boost::json::value> statsBySlot(int slotNumber);

    void setInfohashObserver(InfohashObserver observer);

private:
    enum class Eviction {
        gone,
        kept,
        evicted,
    };

    std::optional<int> claimSlotLocked(std::vector<std::shared_ptr<PoolEntry>>& evicted);
    std::shared_ptr<PoolEntry> findLocked(const model::ContentId& contentId) const;
    std::vector<std::shared_ptr<PoolEntry>> entriesCopy() const;
    // Decides and erases under the exclusive lock, so no touch can land
    // between the staleness check and the eviction.
    Eviction evictIfStale(const std::shared_ptr<PoolEntry>& entry);
    EntryView makeView(const std::shared_ptr<PoolEntry>& entry, bool withStat);
    void notifyInfohash(const PoolEntry& entry);
    void dispatchStop(std::shared_ptr<PoolEntry> entry);
    void dispatchKeepAlive(std::shared_ptr<PoolEntry> entry);

    engine::EngineApi& engine_;
    boost::asio::thread_pool& workers_;
    PoolSettings settings_;
    util::Clock clock_;

    mutable std::shared_mutex mutex_;
    std::map<int, std::shared_ptr<PoolEntry>> entries_;

    std::atomic<bool> healthy_{false};
    mutable std::mutex versionMutex_;
    std::string engineVersion_{"unknown"};

    std::mutex observerMutex_;
    InfohashObserver infohashObserver_;
};

} // namespace acerelay::pool
