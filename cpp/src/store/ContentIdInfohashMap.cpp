#include "acerelay/store/ContentIdInfohashMap.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/util/Logging.hpp"

#include <utility>

namespace acerelay::store {
namespace {

bool validId(std::string_view value) {
    auto id = model::ContentId::parse(value);
    return id && id->str() == value;
}

} // namespace

ContentIdInfohashMap::ContentIdInfohashMap(std::filesystem::path path)
    : store_(std::move(path), validId, validId) {}

bool ContentIdInfohashMap::add(std::string_view contentId, std::string_view infohash) {
    auto content = model::ContentId::parse(contentId);
    auto hash = model::ContentId::parse(infohash);
    if (!content || !hash) {
        return false;
    }
    if (!store_.add(content->str(), hash->str())) {
        return false;
    }
    util::log(util::LogLevel::debug, "Mapped content_id " + content->shortForm() + " to infohash " + hash->shortForm());
    return true;
}

std::optional<std::string> ContentIdInfohashMap::infohashFor(std::string_view contentId) const {
    auto content = model::ContentId::parse(contentId);
    return content ? store_.rightFor(content->str()) : std::nullopt;
}

std::optional<std::string> ContentIdInfohashMap::contentIdFor(std::string_view infohash) const {
    auto hash = model::ContentId::parse(infohash);
    return hash ? store_.leftFor(hash->str()) : std::nullopt;
}

} // namespace acerelay::store
