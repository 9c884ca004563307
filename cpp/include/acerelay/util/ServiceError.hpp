#pragma once

#include <stdexcept>
#include <string>

namespace acerelay::util {

class ServiceError : public std::runtime_error {
public:
    enum class Type {
        invalid_content_id,
        pool_exhausted,
        upstream_unreachable,
    };

    ServiceError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    [[nodiscard]] int status() const noexcept {
        switch (type_) {
        case Type::invalid_content_id: return 400;
        case Type::pool_exhausted: return 503;
        case Type::upstream_unreachable: return 502;
        }
        return 500;
    }

private:
    Type type_;
};

} // namespace acerelay::util
