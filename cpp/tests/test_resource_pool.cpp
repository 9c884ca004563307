#include <gtest/gtest.h>

#include "acerelay/engine/EngineApi.hpp"
#include "acerelay/pool/ResourcePool.hpp"
#include "acerelay/util/ServiceError.hpp"
#include "support/FakeEngine.hpp"
#include "support/ManualClock.hpp"

#include <boost/asio/thread_pool.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using acerelay::pool::PoolSettings;
using acerelay::pool::ResourcePool;
using acerelay::test::FakeEngine;
using acerelay::test::ManualClock;
using acerelay::util::ServiceError;

namespace {

const std::string kStreamA = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa1";
const std::string kStreamB = "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb2";
const std::string kStreamC = "ccccccccccccccccccccccccccccccccccccccc3";

class ResourcePoolTest : public ::testing::Test {
protected:
    std::unique_ptr<ResourcePool> makePool(std::size_t maxSize) {
        engineApi_ = std::make_unique<acerelay::engine::EngineApi>(client_, fake_.address());
        PoolSettings settings;
        settings.maxSize = maxSize;
        settings.externalUrl = "http://relay.test";
        return std::make_unique<ResourcePool>(*engineApi_, workers_, settings, clock_.clock());
    }

    // Lets fire-and-forget stops and keep-alives finish.
    void drainWorkers() { workers_.join(); }

    void TearDown() override { workers_.join(); }

    FakeEngine fake_;
    ManualClock clock_;
    acerelay::util::HttpClient client_;
    std::unique_ptr<acerelay::engine::EngineApi> engineApi_;
    boost::asio::thread_pool workers_{2};
};

} // namespace

// Resolving binds a slot and returns the engine's playback URL.
TEST_F(ResourcePoolTest, ResolveBindsLowestSlot) {
    auto pool = makePool(2);
    const auto url = pool->resolve(kStreamA);
    EXPECT_EQ(url, fake_.address() + "/ace/m/" + kStreamA + "/1.m3u8");
    EXPECT_EQ(pool->size(), 1u);

    auto entry = pool->findEntryBySlot(1);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->contentId().str(), kStreamA);
    EXPECT_EQ(entry->infohash(), FakeEngine::infohashFor(kStreamA));
}

// A second resolve reuses the binding without starting playback again.
TEST_F(ResourcePoolTest, ResolveReusesBinding) {
    auto pool = makePool(2);
    const auto first = pool->resolve(kStreamA);
    clock_.advance(30s);
    const auto second = pool->resolve(kStreamA);
    EXPECT_EQ(first, second);
    EXPECT_EQ(fake_.count("/ace/manifest.m3u8"), 1u);
    EXPECT_EQ(pool->findEntryByContentId(kStreamA)->lastUsed(), clock_.now());
}

TEST_F(ResourcePoolTest, ResolveRejectsInvalidId) {
    auto pool = makePool(2);
    try {
        pool->resolve("not-a-content-id");
        FAIL() << "expected ServiceError";
    } catch (const ServiceError& ex) {
        EXPECT_EQ(ex.type(), ServiceError::Type::invalid_content_id);
        EXPECT_EQ(ex.status(), 400);
    }
    EXPECT_EQ(pool->size(), 0u);
}

// With one slot, a watched mature stream holds the slot until its unlock
// window has passed.
TEST_F(ResourcePoolTest, LockedSlotExhaustsPoolUntilUnlock) {
    auto pool = makePool(1);
    pool->resolve(kStreamA);
    clock_.advance(6min);
    pool->resolve(kStreamA);

    try {
        pool->resolve(kStreamB);
        FAIL() << "expected pool exhaustion";
    } catch (const ServiceError& ex) {
        EXPECT_EQ(ex.type(), ServiceError::Type::pool_exhausted);
        EXPECT_EQ(ex.status(), 503);
    }
    EXPECT_EQ(pool->findEntryBySlot(1)->contentId().str(), kStreamA);

    clock_.advance(7min);
    const auto url = pool->resolve(kStreamB);
    EXPECT_EQ(url, fake_.address() + "/ace/m/" + kStreamB + "/1.m3u8");
    EXPECT_EQ(pool->findEntryBySlot(1)->contentId().str(), kStreamB);
    EXPECT_FALSE(pool->findEntryByContentId(kStreamA));

    drainWorkers();
    EXPECT_EQ(fake_.count("/ace/cmd/" + kStreamA), 1u);
}

// Young streams can be displaced at once; equal last use picks the lowest slot.
TEST_F(ResourcePoolTest, ReclaimPrefersLowestSlotOnTie) {
    auto pool = makePool(2);
    pool->resolve(kStreamA);
    pool->resolve(kStreamB);

    pool->resolve(kStreamC);
    EXPECT_EQ(pool->findEntryBySlot(1)->contentId().str(), kStreamC);
    EXPECT_EQ(pool->findEntryBySlot(2)->contentId().str(), kStreamB);
    EXPECT_FALSE(pool->findEntryByContentId(kStreamA));
}

// A failed playback start leaves the slot bound but unresolved; the next
// resolve retries.
TEST_F(ResourcePoolTest, UnresolvedBindingRetries) {
    auto pool = makePool(1);
    fake_.setPlaybackAvailable(false);
    EXPECT_TRUE(pool->resolve(kStreamA).empty());
    EXPECT_EQ(pool->size(), 1u);

    fake_.setPlaybackAvailable(true);
    EXPECT_FALSE(pool->resolve(kStreamA).empty());
    EXPECT_EQ(fake_.count("/ace/manifest.m3u8"), 2u);
}

TEST_F(ResourcePoolTest, RemoveStopsInstance) {
    auto pool = makePool(2);
    pool->resolve(kStreamA);
    EXPECT_TRUE(pool->remove(kStreamA, "test"));
    EXPECT_EQ(pool->size(), 0u);
    EXPECT_EQ(fake_.count("/ace/cmd/" + kStreamA + "/1?method=stop"), 1u);
    EXPECT_FALSE(pool->remove(kStreamA));
    EXPECT_THROW(pool->remove("bogus"), ServiceError);
}

// The infohash observer fires once, when the binding first resolves.
TEST_F(ResourcePoolTest, ObserverSeesInfohash) {
    auto pool = makePool(2);
    std::vector<std::string> seen;
    pool->setInfohashObserver([&seen](const acerelay::model::ContentId& id, const std::string& infohash) {
        seen.push_back(id.str() + "=" + infohash);
    });
    pool->resolve(kStreamA);
    pool->resolve(kStreamA);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen.front(), kStreamA + "=" + FakeEngine::infohashFor(kStreamA));
}

// Maintenance evicts stale entries and keeps the others warm.
TEST_F(ResourcePoolTest, MaintenanceEvictsStaleAndKeepsAlive) {
    auto pool = makePool(2);
    pool->resolve(kStreamA);
    clock_.advance(5min + 1s);
    pool->resolve(kStreamB);

    // A matured without being watched again; B is young.
    pool->runMaintenance();
    EXPECT_TRUE(pool->healthy());
    EXPECT_EQ(pool->engineVersion(), "3.2.3");
    EXPECT_FALSE(pool->findEntryByContentId(kStreamA));
    EXPECT_TRUE(pool->findEntryByContentId(kStreamB));

    drainWorkers();
    EXPECT_EQ(fake_.count("/ace/cmd/" + kStreamA), 1u);
    EXPECT_EQ(fake_.count("/ace/m/" + kStreamB), 1u);
}

TEST_F(ResourcePoolTest, MaintenanceReportsUnhealthyEngine) {
    auto pool = makePool(1);
    fake_.setVersionAvailable(false);
    pool->runMaintenance();
    EXPECT_FALSE(pool->healthy());
    EXPECT_EQ(pool->engineVersion(), "unknown");
    EXPECT_FALSE(pool->statsBySlot(1).has_value());
}

// Snapshots serialize every slot with the engine's stats when healthy.
TEST_F(ResourcePoolTest, SnapshotIncludesStats) {
    auto pool = makePool(2);
    pool->resolve(kStreamA);
    EXPECT_TRUE(pool->checkEngineHealth());

    auto json = acerelay::pool::toJson(pool->snapshot());
    EXPECT_EQ(json.at("ace_address").as_string(), fake_.address());
    EXPECT_EQ(json.at("max_size").to_number<std::int64_t>(), 2);
    EXPECT_TRUE(json.at("healthy").as_bool());
    const auto& instances = json.at("ace_instances").as_array();
    ASSERT_EQ(instances.size(), 1u);
    const auto& first = instances.front().as_object();
    EXPECT_EQ(first.at("content_id").as_string(), kStreamA);
    EXPECT_EQ(first.at("slot_number").to_number<std::int64_t>(), 1);
    EXPECT_EQ(first.at("stat").as_object().at("status").as_string(), "dl");

    auto stats = pool->statsByContentId(kStreamA);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->as_object().at("peers").to_number<std::int64_t>(), 3);
}

// Multistream paths are attributed to the entry whose manifest URL contains
// the first path component.
TEST_F(ResourcePoolTest, MultistreamPathFindsOwner) {
    auto pool = makePool(2);
    pool->resolve(kStreamA);
    auto owner = pool->findContentIdByMultistreamPath(kStreamA + "/1/segment.m3u8");
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->str(), kStreamA);
    EXPECT_FALSE(pool->findContentIdByMultistreamPath("unknown/0.m3u8").has_value());
}

// A stream watched again after maturing is locked in, not evicted.
TEST_F(ResourcePoolTest, MaintenanceSparesEntryTouchedAfterMaturing) {
    auto pool = makePool(2);
    pool->resolve(kStreamA);
    clock_.advance(5min + 1s);
    EXPECT_TRUE(pool->findEntryByContentId(kStreamA)->checkIfStale());

    pool->resolve(kStreamA);
    pool->runMaintenance();
    ASSERT_TRUE(pool->findEntryByContentId(kStreamA));
    EXPECT_TRUE(pool->findEntryByContentId(kStreamA)->isLockedIn());

    drainWorkers();
    EXPECT_EQ(fake_.count("/ace/cmd/" + kStreamA), 0u);
}

// Clients and the poolboy hitting the pool at once never overfill it or
// bind a slot outside [1, max_size].
TEST_F(ResourcePoolTest, ConcurrentUseKeepsSlotsBounded) {
    auto pool = makePool(2);
    const std::array<std::string, 6> ids{
        "1111111111111111111111111111111111111111", "2222222222222222222222222222222222222222",
        "3333333333333333333333333333333333333333", "4444444444444444444444444444444444444444",
        "5555555555555555555555555555555555555555", "6666666666666666666666666666666666666666"};

    std::atomic<int> violations{0};
    std::atomic<int> unexpectedErrors{0};
    auto checkInvariants = [&pool, &violations]() {
        if (pool->size() > pool->maxSize()) {
            ++violations;
        }
        if (pool->findEntryBySlot(0) || pool->findEntryBySlot(3)) {
            ++violations;
        }
        for (int slot = 1; slot <= 2; ++slot) {
            auto entry = pool->findEntryBySlot(slot);
            if (entry && entry->slotNumber() != slot) {
                ++violations;
            }
        }
    };

    constexpr int kClients = 4;
    constexpr int kRounds = 30;
    std::vector<std::thread> threads;
    for (int t = 0; t < kClients; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kRounds; ++i) {
                const auto& id = ids[static_cast<std::size_t>(t + i) % ids.size()];
                try {
                    if (i % 7 == 6) {
                        pool->remove(id, "test");
                    } else {
                        pool->resolve(id);
                    }
                } catch (const ServiceError& ex) {
                    if (ex.type() != ServiceError::Type::pool_exhausted) {
                        ++unexpectedErrors;
                    }
                }
                checkInvariants();
            }
        });
    }
    threads.emplace_back([&]() {
        for (int i = 0; i < kRounds; ++i) {
            clock_.advance(1s);
            pool->runMaintenance();
            checkInvariants();
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }
    drainWorkers();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(unexpectedErrors.load(), 0);
    EXPECT_LE(pool->size(), 2u);
    auto first = pool->findEntryBySlot(1);
    auto second = pool->findEntryBySlot(2);
    if (first && second) {
        EXPECT_NE(first->contentId(), second->contentId());
    }
}
