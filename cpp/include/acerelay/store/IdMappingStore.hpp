#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace acerelay::store {

// One-to-one mapping between two kinds of identifier, persisted as a
// two-column CSV without a header. Rows are kept in insertion order and the
// whole file is rewritten on every change.
class IdMappingStore {
public:
    using Validator = std::function<bool(std::string_view)>;
    using Row = std::pair<std::string, std::string>;

    IdMappingStore(std::filesystem::path path, Validator validLeft, Validator validRight);

    IdMappingStore(const IdMappingStore&) = delete;
    IdMappingStore& operator=(const IdMappingStore&) = delete;

    void load();

    // False when either value is invalid or already mapped.
    bool add(const std::string& left, const std::string& right);

    std::optional<std::string> rightFor(std::string_view left) const;
    std::optional<std::string> leftFor(std::string_view right) const;

    std::vector<Row> rows() const;
    std::size_t size() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void saveLocked() const;

    std::filesystem::path path_;
    Validator validLeft_;
    Validator validRight_;

    mutable std::mutex mutex_;
    std::vector<Row> rows_;
    std::map<std::string, std::string, std::less<>> byLeft_;
    std::map<std::string, std::string, std::less<>> byRight_;
};

} // namespace acerelay::store
