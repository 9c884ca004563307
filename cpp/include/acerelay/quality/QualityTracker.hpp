#pragma once

#include "acerelay/quality/QualityRecord.hpp"
#include "acerelay/util/Clock.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace acerelay::quality {

struct QualityView {
    int score{kMinQuality};
    bool hasEverWorked{false};
    int m3uFailures{0};
    std::string lastMessage;
};

// Per-content reliability scores backed by a JSON file. Every score change
// rewrites the whole file before returning.
class QualityTracker {
public:
    explicit QualityTracker(std::filesystem::path storePath, util::Clock clock = util::systemClock());

    QualityTracker(const QualityTracker&) = delete;
    QualityTracker& operator=(const QualityTracker&) = delete;

    // Replaces the in-memory map with the file's contents, dropping invalid
    // ids and malformed records.
    void load();
    void save();

    // Creates a record at the minimum score when the id is unseen.
    // Throws ServiceError(invalid_content_id).
    QualityView get(std::string_view contentId);

    // Scores one relay attempt; `manifest` is empty when the attempt failed.
    // Returns the applied rating, nullopt when the update was skipped.
    // Throws ServiceError(invalid_content_id).
    std::optional<int> updateQuality(std::string_view contentId, std::string_view manifest);

    std::map<std::string, QualityView> all() const;

    // Ids that never worked or have fallen to the minimum score.
    std::vector<std::string> candidatesForCheck() const;

    [[nodiscard]] const std::filesystem::path& storePath() const noexcept { return storePath_; }

private:
    static QualityView viewOf(const QualityRecord& record);

    std::filesystem::path storePath_;
    util::Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, QualityRecord> records_;

    std::mutex fileMutex_;
};

} // namespace acerelay::quality
