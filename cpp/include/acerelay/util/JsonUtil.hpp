#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace acerelay::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Accessors that tolerate missing members and wrong types.
std::optional<std::string> getString(const boost::json::object& obj, std::string_view key);
std::optional<std::int64_t> getInt(const boost::json::object& obj, std::string_view key);
std::optional<bool> getBool(const boost::json::object& obj, std::string_view key);

// Both writers go through a sibling temp file renamed over `path`.
void writeTextFile(const std::filesystem::path& path, std::string_view content);
void writeJsonFile(const std::filesystem::path& path, const boost::json::value& value);
std::optional<std::string> readTextFile(const std::filesystem::path& path);

} // namespace acerelay::util
