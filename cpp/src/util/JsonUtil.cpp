#include "acerelay/util/JsonUtil.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace acerelay::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<std::string> getString(const boost::json::object& obj, std::string_view key) {
    if (auto it = obj.if_contains(key); it && it->is_string()) {
        return std::string(it->as_string());
    }
    return std::nullopt;
}

std::optional<std::int64_t> getInt(const boost::json::object& obj, std::string_view key) {
    auto it = obj.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_int64()) {
        return it->as_int64();
    }
    if (it->is_uint64()) {
        const auto value = it->as_uint64();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_double()) {
        const double value = it->as_double();
        // 2^63 is the first double outside the int64 range.
        if (!std::isfinite(value) || std::fabs(value) >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    return std::nullopt;
}

std::optional<bool> getBool(const boost::json::object& obj, std::string_view key) {
    auto it = obj.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_bool()) {
        return it->as_bool();
    }
    if (it->is_int64()) {
        return it->as_int64() != 0;
    }
    return std::nullopt;
}

void writeTextFile(const std::filesystem::path& path, std::string_view content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc | std::ios::binary);
        if (!ofs.is_open()) {
            throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        }
        ofs << content;
        if (!ofs.good()) {
            throw std::runtime_error("failed writing " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path);
}

void writeJsonFile(const std::filesystem::path& path, const boost::json::value& value) {
    writeTextFile(path, boost::json::serialize(value));
}

std::optional<std::string> readTextFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

} // namespace acerelay::util
