// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Logger Implementation
// ============================================================================

#include "confluence/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <vector>

namespace confluence::utils {

namespace {

constexpr const char* LOGGER_NAME = "confluence";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.log_file.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, false));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

// ============================================================================
// Impl
// ============================================================================

struct Logger::Impl {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard lock(mutex);
        return logger;
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {
    impl_->logger = make_logger(LogConfig{});
}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    auto& self = instance();
    auto logger = make_logger(config);
    std::lock_guard lock(self.impl_->mutex);
    if (self.impl_->logger) {
        self.impl_->logger->flush();
    }
    self.impl_->logger = std::move(logger);
}

void Logger::shutdown() {
    instance().flush();
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    impl_->get()->set_level(to_spdlog(level));
}

bool Logger::should_log(LogLevel level) const {
    return impl_->get()->should_log(to_spdlog(level));
}

void Logger::write(LogLevel level, std::string_view message) {
    impl_->get()->log(to_spdlog(level),
                     spdlog::string_view_t{message.data(), message.size()});
}

void Logger::flush() {
    impl_->get()->flush();
}

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Scoped Timer
// ============================================================================

void ScopedTimer::log_duration(int64_t microseconds) const {
    auto& logger = Logger::instance();
    switch (level_) {
        case LogLevel::Trace:
            logger.trace("{} took {} us", name_, microseconds);
            break;
        case LogLevel::Debug:
            logger.debug("{} took {} us", name_, microseconds);
            break;
        case LogLevel::Info:
            logger.info("{} took {} us", name_, microseconds);
            break;
        default:
            logger.warn("{} took {} us", name_, microseconds);
            break;
    }
}

}  // namespace confluence::utils
