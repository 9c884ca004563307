#pragma once

#include "acerelay/util/Clock.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace acerelay::quality {

inline constexpr int kMinQuality = 0;
inline constexpr int kMaxQuality = 99;
inline constexpr int kQualityOnFirstSuccess = 20;
inline constexpr int kMaxProgressRating = 5;
inline constexpr int kLateSegmentPenalty = -4;
inline constexpr int kNewStreamLatePenalty = -1;
inline constexpr std::int64_t kNewStreamThreshold = 20;
inline constexpr std::chrono::milliseconds kDefaultSegmentInterval{std::chrono::seconds{30}};

// Reliability state of one content id. Only quality, hasEverWorked and
// m3uFailures are persisted; segment tracking restarts with the process.
struct QualityRecord {
    int quality{kMinQuality};
    bool hasEverWorked{false};
    int m3uFailures{0};

    std::int64_t lastSegmentNumber{0};
    util::TimePoint lastSegmentFetched{};
    std::chrono::milliseconds nextSegmentExpected{kDefaultSegmentInterval};
    std::string lastMessage;

    explicit QualityRecord(util::TimePoint created = {})
        : lastSegmentFetched(created) {}

    // Applies one playlist observation at `now`. Returns the rating that was
    // applied, or nullopt when the playlist carried no segment sequence and
    // the score was left alone.
    std::optional<int> update(std::string_view manifest, util::TimePoint now);
};

boost::json::object toJson(const QualityRecord& record);

// Persisted fields only. nullopt when `value` is not an object with an
// integer "quality".
std::optional<QualityRecord> recordFromJson(const boost::json::value& value, util::TimePoint loadedAt);

} // namespace acerelay::quality
