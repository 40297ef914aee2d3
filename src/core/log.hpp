#pragma once

#include <string>
#include <filesystem>
#include <optional>

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// Parse "debug", "info", "warning"/"warn", "error" (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Configure the sinks. The log file is truncated. An empty path disables the
// file sink; console=false silences stdout/stderr (used by tests).
// Until this is called, messages at Info and above go to the console only.
void log_init(const std::filesystem::path& file, LogLevel level, bool console = true);

// Close the file sink.
void log_shutdown();

// Thread-safe. File lines: "YYYY-MM-DD HH:MM:SS LEVEL: message".
void log_message(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log_message(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) { log_message(LogLevel::Info, msg); }
inline void log_warning(const std::string& msg) { log_message(LogLevel::Warning, msg); }
inline void log_error(const std::string& msg) { log_message(LogLevel::Error, msg); }
