#pragma once

#include "acerelay/store/IdMappingStore.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace acerelay::store {

// Stable positive stream numbers for content ids, as IPTV clients expect.
class XcIdMap {
public:
    explicit XcIdMap(std::filesystem::path path);

    // Existing number for the id, otherwise one past the highest number in
    // use (1 for an empty map). nullopt for an invalid id.
    std::optional<std::int64_t> xcIdFor(std::string_view contentId);
    std::optional<std::string> contentIdFor(std::int64_t xcId) const;

    [[nodiscard]] std::size_t size() const { return store_.size(); }

private:
    IdMappingStore store_;
    std::mutex allocateMutex_;
};

} // namespace acerelay::store
