#pragma once
// ============================================================================
// AURUM - Configuration
// ============================================================================
// YAML configuration (yaml-cpp). Loaded once at startup; ConfigStore::reload()
// is the only way to change it while running
// ============================================================================

#include "aurum/ensemble/aggregator.hpp"
#include "aurum/regime/regime_detector.hpp"
#include "aurum/risk/risk_gate.hpp"
#include "aurum/utils/logger.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace aurum::config {

// ============================================================================
// Sections
// ============================================================================

struct RegistryConfig {
    std::string path = "config/models.json";
};

struct FeatureConfig {
    std::string schema = "core.v1";
};

struct EngineConfig {
    size_t worker_threads = 4;
    size_t predictor_threads = 4;
    std::chrono::milliseconds cycle_deadline{250};
    size_t history_capacity = 256;
    std::string checkpoint_path = "state/checkpoint.yaml";  // Empty disables
    size_t checkpoint_interval = 100;                       // Committed cycles
};

struct BacktestConfig {
    bool include_advisory = false;
};

struct AppConfig {
    utils::LogConfig logging;
    RegistryConfig registry;
    FeatureConfig features;
    regime::RegimeConfig regime;
    ensemble::EnsembleConfig ensemble;
    risk::RiskLimits risk;
    EngineConfig engine;
    BacktestConfig backtest;
};

// ============================================================================
// Loading
// ============================================================================

/// Parse and validate; missing keys keep their defaults. Throws ConfigError
[[nodiscard]] AppConfig load_config(const std::filesystem::path& path);

[[nodiscard]] AppConfig parse_config(const std::string& yaml_text);

[[nodiscard]] AppConfig from_yaml(const YAML::Node& root);

/// Cross-section checks; throws ConfigError
void validate(const AppConfig& config);

/// Registry path as written, or resolved next to the config file when relative
/// and not found from the working directory
[[nodiscard]] std::filesystem::path resolve_path(const std::filesystem::path& config_path,
                                                 const std::string& value);

// ============================================================================
// Config Store
// ============================================================================

class ConfigStore {
public:
    using Listener = std::function<void(const AppConfig&)>;

    explicit ConfigStore(std::filesystem::path path);

    /// Current configuration snapshot
    [[nodiscard]] std::shared_ptr<const AppConfig> current() const;

    /// Re-read the file and hand it to the listeners. When parsing or any
    /// listener fails, the previous configuration stays current and the
    /// error propagates
    std::shared_ptr<const AppConfig> reload();

    /// Called with every candidate configuration, before it becomes current
    void on_reload(Listener listener);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::shared_ptr<const AppConfig> current_;
    std::vector<Listener> listeners_;
};

}  // namespace aurum::config
