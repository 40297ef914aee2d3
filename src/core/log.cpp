#include "log.hpp"
#include "utils.hpp"
#include <cli/theme.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

struct LogSink {
    std::mutex mutex;
    std::ofstream file;
    LogLevel level = LogLevel::Info;
    bool console = true;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return ts;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warning" || n == "warn") return LogLevel::Warning;
    if (n == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

void log_init(const std::filesystem::path& file, LogLevel level, bool console) {
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) s.file.close();
    if (!file.empty()) {
        s.file.open(file, std::ios::trunc);
        if (!s.file) {
            std::cerr << theme::fail("Cannot open log file: " + file.string());
        }
    }
    s.level = level;
    s.console = console;
}

void log_shutdown() {
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) s.file.close();
}

void log_message(LogLevel level, const std::string& msg) {
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level < s.level) return;

    if (s.file.is_open()) {
        s.file << timestamp() << " " << log_level_name(level) << ": " << msg << "\n";
        s.file.flush();
    }

    if (!s.console) return;
    switch (level) {
        case LogLevel::Error:
            std::cerr << theme::red(msg) << "\n";
            break;
        case LogLevel::Warning:
            std::cerr << theme::yellow(msg) << "\n";
            break;
        case LogLevel::Debug:
            std::cout << theme::dim(msg) << "\n";
            break;
        default:
            std::cout << msg << "\n";
            break;
    }
}
