#include "acerelay/store/IdMappingStore.hpp"
#include "acerelay/util/JsonUtil.hpp"
#include "acerelay/util/Logging.hpp"

#include <exception>
#include <sstream>

namespace acerelay::store {
namespace {

std::string_view trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string_view> splitColumns(std::string_view line) {
    std::vector<std::string_view> columns;
    std::size_t start = 0;
    while (true) {
        const auto pos = line.find(',', start);
        if (pos == std::string_view::npos) {
            columns.push_back(trim(line.substr(start)));
            break;
        }
        columns.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return columns;
}

} // namespace

IdMappingStore::IdMappingStore(std::filesystem::path path, Validator validLeft, Validator validRight)
    : path_(std::move(path))
    , validLeft_(std::move(validLeft))
    , validRight_(std::move(validRight)) {
    load();
}

void IdMappingStore::load() {
    std::vector<Row> rows;
    std::map<std::string, std::string, std::less<>> byLeft;
    std::map<std::string, std::string, std::less<>> byRight;

    if (auto text = util::readTextFile(path_)) {
        std::istringstream input(*text);
        std::string line;
        std::size_t lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            if (trim(line).empty()) {
                continue;
            }
            auto columns = splitColumns(line);
            if (columns.size() != 2) {
                util::log(util::LogLevel::warn,
                          path_.filename().string() + ":" + std::to_string(lineNumber) + " does not have two columns");
                continue;
            }
            std::string left(columns[0]);
            std::string right(columns[1]);
            if (!validLeft_(left) || !validRight_(right)) {
                util::log(util::LogLevel::warn,
                          path_.filename().string() + ":" + std::to_string(lineNumber) + " has an invalid value");
                continue;
            }
            if (byLeft.count(left) != 0 || byRight.count(right) != 0) {
                util::log(util::LogLevel::warn,
                          path_.filename().string() + ":" + std::to_string(lineNumber) + " duplicates an earlier row");
                continue;
            }
            byLeft.emplace(left, right);
            byRight.emplace(right, left);
            rows.emplace_back(std::move(left), std::move(right));
        }
    }

    std::scoped_lock lock(mutex_);
    rows_ = std::move(rows);
    byLeft_ = std::move(byLeft);
    byRight_ = std::move(byRight);
}

bool IdMappingStore::add(const std::string& left, const std::string& right) {
    if (!validLeft_(left) || !validRight_(right)) {
        return false;
    }
    std::scoped_lock lock(mutex_);
    if (byLeft_.count(left) != 0 || byRight_.count(right) != 0) {
        return false;
    }
    byLeft_.emplace(left, right);
    byRight_.emplace(right, left);
    rows_.emplace_back(left, right);
    saveLocked();
    return true;
}

std::optional<std::string> IdMappingStore::rightFor(std::string_view left) const {
    std::scoped_lock lock(mutex_);
    if (auto it = byLeft_.find(left); it != byLeft_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<std::string> IdMappingStore::leftFor(std::string_view right) const {
    std::scoped_lock lock(mutex_);
    if (auto it = byRight_.find(right); it != byRight_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<IdMappingStore::Row> IdMappingStore::rows() const {
    std::scoped_lock lock(mutex_);
    return rows_;
}

std::size_t IdMappingStore::size() const {
    std::scoped_lock lock(mutex_);
    return rows_.size();
}

void IdMappingStore::saveLocked() const {
    std::string content;
    for (const auto& [left, right] : rows_) {
        content += left;
        content += ',';
        content += right;
        content += '\n';
    }
    try {
        util::writeTextFile(path_, content);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Error saving " + path_.string() + ": " + ex.what());
    }
}

} // namespace acerelay::store
