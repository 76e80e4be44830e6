// ============================================================================
// AURUM - Logger Implementation
// ============================================================================

#include "aurum/utils/logger.hpp"
#include "aurum/core/error.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace aurum::utils {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
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

constexpr const char* LOGGER_NAME = "aurum";

}  // namespace

LogLevel parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    throw ConfigError("unknown log level '" + std::string(name) + "'");
}

void Logger::initialize(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files));
    }

    spdlog::drop(LOGGER_NAME);

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::milliseconds(config.flush_interval_ms));
}

void Logger::shutdown() {
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

std::shared_ptr<spdlog::logger> Logger::backend() {
    return spdlog::default_logger();
}

void Logger::set_level(LogLevel level) {
    backend()->set_level(to_spdlog(level));
}

void Logger::flush() {
    backend()->flush();
}

bool Logger::should_log(LogLevel level) const {
    return backend()->should_log(to_spdlog(level));
}

void ScopedTimer::log_duration(int64_t microseconds) const {
    auto& logger = Logger::instance();
    if (!logger.should_log(level_)) return;

    switch (level_) {
        case LogLevel::Trace: logger.trace("{} took {}us", name_, microseconds); break;
        case LogLevel::Debug: logger.debug("{} took {}us", name_, microseconds); break;
        case LogLevel::Info:  logger.info("{} took {}us", name_, microseconds); break;
        default:              logger.warn("{} took {}us", name_, microseconds); break;
    }
}

}  // namespace aurum::utils
