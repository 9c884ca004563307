#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace acerelay::model {

inline constexpr std::size_t kContentIdLength = 40;

// 40 character lowercase hex identifier for a piece of engine content, either
// a content id or an infohash. Only constructible through parse().
class ContentId {
public:
    static std::optional<ContentId> parse(std::string_view text);
    static bool isValid(std::string_view text);

    [[nodiscard]] const std::string& str() const noexcept { return value_; }
    [[nodiscard]] std::string shortForm() const;

    friend bool operator==(const ContentId& lhs, const ContentId& rhs) { return lhs.value_ == rhs.value_; }
    friend bool operator!=(const ContentId& lhs, const ContentId& rhs) { return lhs.value_ != rhs.value_; }
    friend bool operator<(const ContentId& lhs, const ContentId& rhs) { return lhs.value_ < rhs.value_; }

private:
    explicit ContentId(std::string value)
        : value_(std::move(value)) {}

    std::string value_;
};

// First eight characters plus "..." for log lines.
std::string shortId(std::string_view contentId);

} // namespace acerelay::model

template <>
struct std::hash<acerelay::model::ContentId> {
    std::size_t operator()(const acerelay::model::ContentId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};
