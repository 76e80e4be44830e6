#pragma once
// ============================================================================
// AURUM - Logger
// ============================================================================
// Async logging wrapper with minimal latency on the decision path
// Uses spdlog; a console-only synchronous logger is created lazily so that
// library code and tests can log before initialize() is called
// ============================================================================

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace aurum::utils {

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

/// Throws ConfigError for names spdlog does not know
[[nodiscard]] LogLevel parse_log_level(std::string_view name);

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "aurum.log";   // Empty disables the file sink
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
    bool console = true;

    // Performance settings
    bool async = true;
    size_t queue_size = 8192;
    size_t flush_interval_ms = 100;

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize the global logger
    static void initialize(const LogConfig& config = LogConfig{});

    /// Shutdown the logger (flush and close)
    static void shutdown();

    /// Get the global logger instance
    static Logger& instance();

    void set_level(LogLevel level);

    template <typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        backend()->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        backend()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        backend()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        backend()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        backend()->error(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        backend()->critical(fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

    [[nodiscard]] bool should_log(LogLevel level) const;

private:
    Logger() = default;

    /// The spdlog default logger; replaced by initialize()
    [[nodiscard]] static std::shared_ptr<spdlog::logger> backend();
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::aurum::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::aurum::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::aurum::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::aurum::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::aurum::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::aurum::utils::Logger::instance().critical(__VA_ARGS__)

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

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define AURUM_CONCAT_INNER(a, b) a##b
#define AURUM_CONCAT(a, b) AURUM_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) ::aurum::utils::ScopedTimer AURUM_CONCAT(_timer_, __LINE__)(name)

}  // namespace aurum::utils
