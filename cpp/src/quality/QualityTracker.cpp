#include "acerelay/quality/QualityTracker.hpp"
#include "acerelay/hls/Manifest.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/util/JsonUtil.hpp"
#include "acerelay/util/Logging.hpp"
#include "acerelay/util/ServiceError.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace acerelay::quality {
namespace {

model::ContentId requireContentId(std::string_view text) {
    auto id = model::ContentId::parse(text);
    if (!id) {
        throw util::ServiceError(util::ServiceError::Type::invalid_content_id,
                                 "Invalid content_id: " + std::string(text));
    }
    return *id;
}

} // namespace

QualityTracker::QualityTracker(std::filesystem::path storePath, util::Clock clock)
    : storePath_(std::move(storePath))
    , clock_(std::move(clock)) {
    load();
}

void QualityTracker::load() {
    std::map<std::string, QualityRecord> loaded;
    auto text = util::readTextFile(storePath_);
    if (text && !text->empty()) {
        try {
            auto json = util::parseJson(*text);
            if (!json.is_object()) {
                throw std::runtime_error("top level is not an object");
            }
            const auto now = clock_();
            for (const auto& [key, value] : json.as_object()) {
                auto id = model::ContentId::parse(key);
                if (!id) {
                    util::log(util::LogLevel::warn, "Invalid content_id found in quality cache: " + std::string(key));
                    continue;
                }
                auto record = recordFromJson(value, now);
                if (!record) {
                    util::log(util::LogLevel::error,
                              "Invalid quality data for content_id " + id->shortForm() + ": " +
                                  util::stringifyJson(value));
                    continue;
                }
                loaded.insert_or_assign(id->str(), std::move(*record));
            }
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error,
                      "Error loading quality cache " + storePath_.string() + ": " + std::string(ex.what()));
        }
    }

    std::scoped_lock lock(mutex_);
    records_ = std::move(loaded);
    util::log(util::LogLevel::debug, "Loaded " + std::to_string(records_.size()) + " quality records");
}

void QualityTracker::save() {
    std::scoped_lock fileLock(fileMutex_);
    boost::json::object root;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [id, record] : records_) {
            root[id] = toJson(record);
        }
    }
    try {
        util::writeJsonFile(storePath_, root);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error,
                  "Error saving quality cache " + storePath_.string() + ": " + std::string(ex.what()));
    }
}

QualityView QualityTracker::get(std::string_view contentId) {
    const auto id = requireContentId(contentId);
    std::scoped_lock lock(mutex_);
    auto [it, inserted] = records_.try_emplace(id.str(), QualityRecord(clock_()));
    return viewOf(it->second);
}

std::optional<int> QualityTracker::updateQuality(std::string_view contentId, std::string_view manifest) {
    const auto id = requireContentId(contentId);
    if (!manifest.empty() && hls::isMasterPlaylist(manifest)) {
        util::log(util::LogLevel::trace, "Skipping quality update for master playlist of " + id.shortForm());
        return std::nullopt;
    }

    std::optional<int> rating;
    std::string message;
    int score = kMinQuality;
    {
        std::scoped_lock lock(mutex_);
        const auto now = clock_();
        auto [it, inserted] = records_.try_emplace(id.str(), QualityRecord(now));
        rating = it->second.update(manifest, now);
        message = it->second.lastMessage;
        score = it->second.quality;
    }

    if (!rating) {
        return std::nullopt;
    }
    util::log(util::LogLevel::trace,
              "Quality of " + id.shortForm() + " now " + std::to_string(score) + ": " + message);
    save();
    return rating;
}

std::map<std::string, QualityView> QualityTracker::all() const {
    std::map<std::string, QualityView> result;
    std::scoped_lock lock(mutex_);
    for (const auto& [id, record] : records_) {
        result.emplace(id, viewOf(record));
    }
    return result;
}

std::vector<std::string> QualityTracker::candidatesForCheck() const {
    std::vector<std::string> result;
    std::scoped_lock lock(mutex_);
    for (const auto& [id, record] : records_) {
        if (!record.hasEverWorked || record.quality == kMinQuality) {
            result.push_back(id);
        }
    }
    return result;
}

QualityView QualityTracker::viewOf(const QualityRecord& record) {
    return QualityView{record.quality, record.hasEverWorked, record.m3uFailures, record.lastMessage};
}

} // namespace acerelay::quality
