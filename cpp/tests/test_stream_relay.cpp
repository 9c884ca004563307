#include <gtest/gtest.h>

#include "acerelay/engine/EngineApi.hpp"
#include "acerelay/pool/ResourcePool.hpp"
#include "acerelay/quality/QualityTracker.hpp"
#include "acerelay/relay/StreamRelay.hpp"
#include "support/FakeEngine.hpp"
#include "support/ManualClock.hpp"
#include "support/TempDir.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using acerelay::relay::StreamRelay;
using acerelay::test::FakeEngine;
using acerelay::test::ManualClock;
using acerelay::test::TempDir;

namespace {

const std::string kStream = "0123456789abcdef0123456789abcdef01234567";
const std::string kOther = "fedcba9876543210fedcba9876543210fedcba98";
const std::string kExternal = "http://relay.test:5100";

class StreamRelayTest : public ::testing::Test {
protected:
    StreamRelayTest()
        : engineApi_(client_, fake_.address())
        , tracker_(dir_ / "quality.json", clock_.clock()) {}

    void TearDown() override { workers_.join(); }

    void makeRelay(std::size_t maxSize = 2, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
        acerelay::pool::PoolSettings settings;
        settings.maxSize = maxSize;
        settings.externalUrl = kExternal;
        pool_ = std::make_unique<acerelay::pool::ResourcePool>(engineApi_, workers_, settings, clock_.clock());
        relay_ = std::make_unique<StreamRelay>(client_, *pool_, tracker_, kExternal + "/", timeout);
    }

    FakeEngine fake_;
    TempDir dir_;
    ManualClock clock_;
    acerelay::util::HttpClient client_;
    acerelay::engine::EngineApi engineApi_;
    acerelay::quality::QualityTracker tracker_;
    boost::asio::thread_pool workers_{2};
    std::unique_ptr<acerelay::pool::ResourcePool> pool_;
    std::unique_ptr<StreamRelay> relay_;
};

} // namespace

// The manifest comes back rewritten to the relay's address and is scored.
TEST_F(StreamRelayTest, RelaysRewrittenManifest) {
    makeRelay();
    fake_.setManifest(fake_.playlist(42, true));

    auto response = relay_->relayManifest(kStream);
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.body.find(fake_.address()), std::string::npos);
    EXPECT_NE(response.body.find(kExternal + "/ace/c/session/42.ts"), std::string::npos);
    EXPECT_EQ(response.body.find("#EXT-X-MEDIA:URI="), std::string::npos);
    EXPECT_EQ(response.header("content-type"), std::string("application/vnd.apple.mpegurl"));

    const auto quality = tracker_.get(kStream);
    EXPECT_TRUE(quality.hasEverWorked);
    EXPECT_EQ(quality.score, 25);
}

// Framing headers from the engine are not forwarded.
TEST_F(StreamRelayTest, StripsHopByHopHeaders) {
    makeRelay();
    auto response = relay_->relayManifest(kStream);
    ASSERT_EQ(response.status, 200u);
    EXPECT_FALSE(response.header("Content-Length").has_value());
    EXPECT_FALSE(response.header("Transfer-Encoding").has_value());
    EXPECT_FALSE(response.header("Connection").has_value());
    EXPECT_TRUE(response.header("Server").has_value());

    EXPECT_TRUE(acerelay::relay::isHopByHopHeader("Keep-Alive"));
    EXPECT_FALSE(acerelay::relay::isHopByHopHeader("Cache-Control"));
}

TEST_F(StreamRelayTest, InvalidIdIsBadRequest) {
    makeRelay();
    auto response = relay_->relayManifest("nope");
    EXPECT_EQ(response.status, 400u);
    EXPECT_NE(response.body.find("Invalid content_id"), std::string::npos);
    EXPECT_EQ(fake_.count("/ace/manifest.m3u8"), 0u);
}

// An engine answer that is not a playlist is reported with an excerpt and
// counts as a failed fetch.
TEST_F(StreamRelayTest, NonPlaylistIsBadRequestAndCountsFailure) {
    makeRelay();
    fake_.setManifest("<html>engine is warming up</html>");

    auto response = relay_->relayManifest(kStream);
    EXPECT_EQ(response.status, 400u);
    EXPECT_NE(response.body.find("engine is warming up"), std::string::npos);
    EXPECT_EQ(response.header("Content-Type"), std::string("application/json"));
    EXPECT_EQ(tracker_.get(kStream).m3uFailures, 1);
}

TEST_F(StreamRelayTest, UpstreamErrorIsBadGateway) {
    makeRelay();
    fake_.setManifest("gone", 500);

    auto response = relay_->relayManifest(kStream);
    EXPECT_EQ(response.status, 502u);
    EXPECT_NE(response.body.find("engine status: 500"), std::string::npos);
    EXPECT_EQ(tracker_.get(kStream).m3uFailures, 1);
}

TEST_F(StreamRelayTest, SlowEngineTimesOut) {
    makeRelay(2, std::chrono::milliseconds{200});
    fake_.setManifestDelay(std::chrono::milliseconds{800});

    auto response = relay_->relayManifest(kStream);
    EXPECT_EQ(response.status, 408u);
    EXPECT_EQ(tracker_.get(kStream).m3uFailures, 1);
}

// A full pool is a retryable condition and says nothing about the stream.
TEST_F(StreamRelayTest, ExhaustedPoolIsRetryable) {
    makeRelay(1);
    ASSERT_EQ(relay_->relayManifest(kStream).status, 200u);
    clock_.advance(6min);
    ASSERT_EQ(relay_->relayManifest(kStream).status, 200u);

    auto response = relay_->relayManifest(kOther);
    EXPECT_EQ(response.status, 503u);
    EXPECT_EQ(response.header("Retry-After"), std::string("5"));
    EXPECT_TRUE(tracker_.all().count(kOther) == 0);
}

TEST_F(StreamRelayTest, UnstartedPlaybackIsRetryable) {
    makeRelay();
    fake_.setPlaybackAvailable(false);
    auto response = relay_->relayManifest(kStream);
    EXPECT_EQ(response.status, 503u);
    EXPECT_EQ(response.header("Retry-After"), std::string("5"));
}

// Segment bodies pass through untouched with the transport stream type.
TEST_F(StreamRelayTest, RelaysSegments) {
    makeRelay();
    auto response = relay_->relayContent("/ace/c/", "session/42.ts");
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.body, "TSDATA");
    EXPECT_EQ(response.header("Content-Type"), std::string("video/MP2T"));
    EXPECT_EQ(fake_.count("/ace/c/session/42.ts"), 1u);
}

// Multistream playlists are scored against the entry that owns the path.
TEST_F(StreamRelayTest, MultistreamIsAttributed) {
    makeRelay();
    ASSERT_EQ(relay_->relayManifest(kStream).status, 200u);
    clock_.advance(1s);
    fake_.setManifest(fake_.playlist(44));

    auto response = relay_->relayMultistream(kStream + "/1/0.m3u8");
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(fake_.count("/hls/m/" + kStream + "/1/0.m3u8"), 1u);
    EXPECT_EQ(tracker_.get(kStream).score, 27);
}

TEST_F(StreamRelayTest, UnreachableEngineIsBadGateway) {
    acerelay::engine::EngineApi deadEngine(client_, "http://127.0.0.1:1");
    acerelay::pool::ResourcePool pool(deadEngine, workers_, acerelay::pool::PoolSettings{}, clock_.clock());
    StreamRelay relay(client_, pool, tracker_, kExternal);
    auto response = relay.relayContent("/ace/c/", "session/1.ts");
    EXPECT_EQ(response.status, 502u);
}
