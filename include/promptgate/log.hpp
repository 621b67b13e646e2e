#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace promptgate {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;
bool log_enabled(LogLevel level) noexcept;

std::optional<LogLevel> parse_log_level(std::string_view name);
const char* log_level_name(LogLevel level) noexcept;

std::string timestamp_now();

// Writes one line to stderr; stdout carries the JSON-RPC stream.
void log_line(LogLevel level, std::string_view component, std::string_view message);

} // namespace promptgate
