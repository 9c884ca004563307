#pragma once

#include <string>
#include <string_view>

namespace acerelay::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();
LogLevel parseLogLevel(std::string_view text);
void log(LogLevel level, const std::string& message);

} // namespace acerelay::util
