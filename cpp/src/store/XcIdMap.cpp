#include "acerelay/store/XcIdMap.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace acerelay::store {
namespace {

bool validContentId(std::string_view value) {
    auto id = model::ContentId::parse(value);
    return id && id->str() == value;
}

std::optional<std::int64_t> parseXcId(std::string_view value) {
    if (value.empty() || value.size() > 18 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    const auto number = std::stoll(std::string(value));
    if (number <= 0) {
        return std::nullopt;
    }
    return number;
}

bool validXcId(std::string_view value) {
    return parseXcId(value).has_value();
}

} // namespace

XcIdMap::XcIdMap(std::filesystem::path path)
    : store_(std::move(path), validContentId, validXcId) {}

std::optional<std::int64_t> XcIdMap::xcIdFor(std::string_view contentId) {
    auto id = model::ContentId::parse(contentId);
    if (!id) {
        return std::nullopt;
    }

    std::scoped_lock lock(allocateMutex_);
    if (auto existing = store_.rightFor(id->str())) {
        return parseXcId(*existing);
    }

    std::int64_t highest = 0;
    for (const auto& [content, xc] : store_.rows()) {
        highest = std::max(highest, parseXcId(xc).value_or(0));
    }
    const auto next = highest + 1;
    if (!store_.add(id->str(), std::to_string(next))) {
        util::log(util::LogLevel::error, "Failed to allocate XC id for content_id " + id->shortForm());
        return std::nullopt;
    }
    util::log(util::LogLevel::debug, "Allocated XC id " + std::to_string(next) + " for content_id " + id->shortForm());
    return next;
}

std::optional<std::string> XcIdMap::contentIdFor(std::int64_t xcId) const {
    if (xcId <= 0) {
        return std::nullopt;
    }
    return store_.leftFor(std::to_string(xcId));
}

} // namespace acerelay::store
