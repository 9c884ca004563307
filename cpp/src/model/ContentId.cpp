#include "acerelay/model/ContentId.hpp"

#include <algorithm>
#include <cctype>

namespace acerelay::model {

bool ContentId::isValid(std::string_view text) {
    if (text.size() != kContentIdLength) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::optional<ContentId> ContentId::parse(std::string_view text) {
    if (!isValid(text)) {
        return std::nullopt;
    }
    std::string normalized(text);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ContentId(std::move(normalized));
}

std::string ContentId::shortForm() const {
    return shortId(value_);
}

std::string shortId(std::string_view contentId) {
    return std::string(contentId.substr(0, 8)) + "...";
}

} // namespace acerelay::model
