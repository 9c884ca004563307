#pragma once

#include "acerelay/store/IdMappingStore.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace acerelay::store {

// content_id <-> infohash pairs learnt from engine playback sessions.
class ContentIdInfohashMap {
public:
    explicit ContentIdInfohashMap(std::filesystem::path path);

    // Normalizes both ids to lowercase. False when either side is invalid or
    // already has a partner.
    bool add(std::string_view contentId, std::string_view infohash);

    std::optional<std::string> infohashFor(std::string_view contentId) const;
    std::optional<std::string> contentIdFor(std::string_view infohash) const;

    [[nodiscard]] std::size_t size() const { return store_.size(); }

private:
    IdMappingStore store_;
};

} // namespace acerelay::store
