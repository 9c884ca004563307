#include "acerelay/quality/QualityRecord.hpp"
#include "acerelay/hls/Manifest.hpp"
#include "acerelay/util/JsonUtil.hpp"
#include "acerelay/util/Logging.hpp"

#include <algorithm>

namespace acerelay::quality {

std::optional<int> QualityRecord::update(std::string_view manifest, util::TimePoint now) {
    int rating = 0;
    lastMessage.clear();

    if (manifest.empty()) {
        rating = -m3uFailures;
        ++m3uFailures;
        lastMessage = "Score " + std::to_string(rating) + " (no playlist, " + std::to_string(m3uFailures) +
                      (m3uFailures == 1 ? " failure)" : " failures)");
    } else {
        m3uFailures = 0;
        auto segment = hls::lastSegment(manifest);
        if (!segment) {
            util::log(util::LogLevel::warn, "Could not extract segment number from playlist");
            return std::nullopt;
        }

        const auto sinceLastSegment = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastSegmentFetched);
        if (segment->sequence != lastSegmentNumber) {
            const auto newSegments = segment->sequence - lastSegmentNumber;
            rating = static_cast<int>(std::clamp<std::int64_t>(newSegments, 1, kMaxProgressRating));
            lastSegmentFetched = now;
            lastMessage = "Score +" + std::to_string(rating) + " (" + std::to_string(newSegments) +
                          (newSegments == 1 ? " new segment)" : " new segments)");
        } else if (sinceLastSegment > nextSegmentExpected) {
            rating = segment->sequence < kNewStreamThreshold ? kNewStreamLatePenalty : kLateSegmentPenalty;
            const auto overdue = std::chrono::duration_cast<std::chrono::seconds>(sinceLastSegment - nextSegmentExpected);
            lastMessage = "Score " + std::to_string(rating) + " (expected segment " + std::to_string(overdue.count()) +
                          "s ago)";
        } else {
            lastMessage = "Score +0 (no new segment due)";
        }

        lastSegmentNumber = segment->sequence;
        if (segment->duration) {
            nextSegmentExpected = *segment->duration;
        }
    }

    if (rating > 0) {
        quality = std::max(kQualityOnFirstSuccess, quality);
        hasEverWorked = true;
    }
    quality = std::clamp(quality + rating, kMinQuality, kMaxQuality);
    return rating;
}

boost::json::object toJson(const QualityRecord& record) {
    boost::json::object obj;
    obj["quality"] = record.quality;
    obj["has_ever_worked"] = record.hasEverWorked;
    obj["m3u_failures"] = record.m3uFailures;
    return obj;
}

std::optional<QualityRecord> recordFromJson(const boost::json::value& value, util::TimePoint loadedAt) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    const auto& obj = value.as_object();
    auto quality = util::getInt(obj, "quality");
    if (!quality) {
        return std::nullopt;
    }
    QualityRecord record(loadedAt);
    record.quality = static_cast<int>(std::clamp<std::int64_t>(*quality, kMinQuality, kMaxQuality));
    record.hasEverWorked = util::getBool(obj, "has_ever_worked").value_or(false);
    record.m3uFailures = static_cast<int>(std::max<std::int64_t>(util::getInt(obj, "m3u_failures").value_or(0), 0));
    return record;
}

} // namespace acerelay::quality
