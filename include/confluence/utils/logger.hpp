#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Logger
// ============================================================================
// Thin facade over spdlog so library code never touches sinks directly
// The first use without initialize() gets a colored stderr logger
// ============================================================================

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace confluence::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace" .. "off"; unknown names map to Info
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file;           // Empty: console only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    bool async = false;             // Background flushing thread
    size_t queue_size = 8192;       // Async queue size
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize (or re-initialize) the global logger
    static void initialize(const LogConfig& config = LogConfig{});

    /// Shutdown the logger (flush and close)
    static void shutdown();

    /// Get the global logger instance
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] bool should_log(LogLevel level) const;

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    template <typename... Args>
    void log(LogLevel level, std::string_view fmt, Args&&... args) {
        // Skip formatting entirely for filtered levels
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt);
        } else {
            write(level, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
        }
    }

    void write(LogLevel level, std::string_view message);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::confluence::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::confluence::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::confluence::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::confluence::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::confluence::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::confluence::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define CONFLUENCE_CONCAT_INNER(a, b) a##b
#define CONFLUENCE_CONCAT(a, b) CONFLUENCE_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) \
    ::confluence::utils::ScopedTimer CONFLUENCE_CONCAT(_timer_, __LINE__)(name)

}  // namespace confluence::utils
