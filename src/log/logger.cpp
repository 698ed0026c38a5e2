#include "supex/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>
#include <utility>

namespace supex {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kDim   = "\033[2m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Off:   return kReset;
    }
    return kReset;
}

[[nodiscard]] std::string clock_time(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of('/');
    return slash == std::string_view::npos ? sv : sv.substr(slash + 1);
}

std::mutex& stderr_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    std::string lowered(text.size(), '\0');
    std::transform(text.begin(), text.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error" || lowered == "err") return LogLevel::Error;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

std::string ConsoleLogger::format(const LogRecord& record) const {
    const std::string_view level_name = to_string(record.level);
    const std::string_view file = basename_of(record.location.file_name());
    const auto line = record.location.line();

    if (colors_enabled_ == false) {
        return std::format("{} {:<5} {}:{} {}\n",
            clock_time(record.timestamp), level_name, file, line, record.message);
    }
    return std::format("{}{}{} {}{:<5}{} {}{}:{}{} {}\n",
        kDim, clock_time(record.timestamp), kReset,
        level_color(record.level), level_name, kReset,
        kDim, file, line, kReset,
        record.message);
}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    const std::string rendered = format(record);

    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << rendered;
}

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct LoggerSlot {
    std::mutex mutex;
    std::shared_ptr<ILogger> current = std::make_shared<NullLogger>();
};

LoggerSlot& logger_slot() {
    static LoggerSlot slot;
    return slot;
}

}  // namespace

std::shared_ptr<ILogger> get_logger() noexcept {
    auto& slot = logger_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.current;
}

void set_logger(std::shared_ptr<ILogger> logger) noexcept {
    auto& slot = logger_slot();
    std::shared_ptr<ILogger> previous;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        previous = std::exchange(slot.current, logger ? std::move(logger) : std::make_shared<NullLogger>());
    }
    // `previous` is released outside the lock in case its destructor logs
}

}  // namespace supex
