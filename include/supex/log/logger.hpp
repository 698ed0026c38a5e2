#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace supex {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Raw frames, socket details
    Debug = 1,  // Connect/disconnect, handshake results
    Info  = 2,  // Lifecycle events a user may care about
    Warn  = 3,  // Recoverable failures (retries, unhealthy connections)
    Error = 4,  // A command failed for good
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Case-insensitive; accepts "warning" and "err" as aliases. nullopt if unknown.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    /// Checked before a message is built, so disabled levels cost nothing
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Error, msg, loc);
    }

    template<typename... Args>
    void logf(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

private:
    void emit(LogLevel level, std::string_view msg, const std::source_location& loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - the default; library code is silent unless a host installs one
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - one line per record on stderr
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info, bool colors = true)
        : min_level_(min_level)
        , colors_enabled_(colors)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        const auto min = min_level_.load(std::memory_order_relaxed);
        return min != LogLevel::Off &&
               static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min);
    }

    void set_level(LogLevel level) noexcept {
        min_level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Renders a record without writing it; exposed for tests
    [[nodiscard]] std::string format(const LogRecord& record) const;

private:
    std::atomic<LogLevel> min_level_;
    bool colors_enabled_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

/// Current logger (a NullLogger until set_logger is called). The returned
/// handle stays valid even if another thread replaces the logger.
[[nodiscard]] std::shared_ptr<ILogger> get_logger() noexcept;

/// Replace the process-wide logger; nullptr restores the NullLogger.
void set_logger(std::shared_ptr<ILogger> logger) noexcept;

#define SUPEX_LOG_AT(level, method, msg) \
    do { \
        if (auto supex_logger_ = ::supex::get_logger(); \
            supex_logger_->should_log(::supex::LogLevel::level)) { \
            supex_logger_->method(msg); \
        } \
    } while (false)

#define SUPEX_LOG_TRACE(msg) SUPEX_LOG_AT(Trace, trace, msg)
#define SUPEX_LOG_DEBUG(msg) SUPEX_LOG_AT(Debug, debug, msg)
#define SUPEX_LOG_INFO(msg)  SUPEX_LOG_AT(Info, info, msg)
#define SUPEX_LOG_WARN(msg)  SUPEX_LOG_AT(Warn, warn, msg)
#define SUPEX_LOG_ERROR(msg) SUPEX_LOG_AT(Error, error, msg)

}  // namespace supex
