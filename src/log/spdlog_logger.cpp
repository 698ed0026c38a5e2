#include "supex/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <stdexcept>

namespace supex {

namespace {

// Loggers are never registered globally; unique names only keep output readable
std::string next_logger_name(const char* base) {
    static std::atomic<std::uint64_t> counter{0};
    return std::string(base) + "-" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

spdlog::sink_ptr stderr_sink() {
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
}

spdlog::sink_ptr file_sink(const std::string& filename) {
    // truncate = false: the CLI appends across invocations
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level Conversion
// ─────────────────────────────────────────────────────────────────────────────

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace: return LogLevel::Trace;
        case spdlog::level::debug: return LogLevel::Debug;
        case spdlog::level::info:  return LogLevel::Info;
        case spdlog::level::warn:  return LogLevel::Warn;
        case spdlog::level::err:
        case spdlog::level::critical:
            return LogLevel::Error;
        case spdlog::level::off:   return LogLevel::Off;
        default:                   return LogLevel::Info;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_.store(from_spdlog_level(logger_->level()), std::memory_order_relaxed);
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(next_logger_name("supex"), sinks.begin(), sinks.end()))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kDefaultPattern);
}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "{}",
        record.message
    );
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    const auto min = min_level_.load(std::memory_order_relaxed);
    return min != LogLevel::Off &&
           static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{stderr_sink()}, min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{file_sink(filename)}, min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(const std::string& filename, LogLevel min_level) {
    auto logger = std::make_unique<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{stderr_sink(), file_sink(filename)}, min_level);
    return logger;
}

}  // namespace supex
