// ============================================================================
// AURUM - Configuration Implementation
// ============================================================================

#include "aurum/config/config.hpp"
#include "aurum/core/error.hpp"
#include "aurum/features/feature_builder.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

namespace aurum::config {

namespace {

/// Overwrite `out` when `key` is present; a value of the wrong type throws
template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    if (const auto value = node[key]) {
        out = value.as<T>();
    }
}

void read_logging(const YAML::Node& node, utils::LogConfig& log) {
    if (!node) return;
    std::string level = "info";
    read(node, "level", level);
    log.level = utils::parse_log_level(level);
    read(node, "file", log.log_file);
    read(node, "async", log.async);
    read(node, "console", log.console);
    read(node, "max_file_size_mb", log.max_file_size_mb);
    read(node, "max_files", log.max_files);
}

void read_regime(const YAML::Node& node, regime::RegimeConfig& regime) {
    if (!node) return;
    read(node, "window", regime.window);
    read(node, "hysteresis", regime.hysteresis);
    read(node, "high_volatility", regime.high_volatility);
    read(node, "trend_threshold", regime.trend_threshold);
    read(node, "max_spread", regime.max_spread);
    read(node, "min_volume", regime.min_volume);
}

void read_ensemble(const YAML::Node& node, ensemble::EnsembleConfig& ensemble) {
    if (!node) return;
    read(node, "decay_half_life", ensemble.decay_half_life);
    read(node, "initial_reliability", ensemble.initial_reliability);
    read(node, "out_of_regime_penalty", ensemble.out_of_regime_penalty);
    read(node, "flat_return", ensemble.flat_return);
}

void read_risk(const YAML::Node& node, risk::RiskLimits& risk) {
    if (!node) return;
    read(node, "max_exposure", risk.max_exposure);
    read(node, "max_position_size", risk.max_position_size);
    read(node, "max_drawdown", risk.max_drawdown);
    read(node, "instrument_limit", risk.instrument_limit);
    if (node["instrument_limits"]) {
        for (const auto& entry : node["instrument_limits"]) {
            risk.instrument_limits[entry.first.as<std::string>()] = entry.second.as<double>();
        }
    }
}

void read_engine(const YAML::Node& node, EngineConfig& engine) {
    if (!node) return;
    read(node, "worker_threads", engine.worker_threads);
    read(node, "predictor_threads", engine.predictor_threads);
    int64_t deadline_ms = engine.cycle_deadline.count();
    read(node, "cycle_deadline_ms", deadline_ms);
    engine.cycle_deadline = std::chrono::milliseconds(deadline_ms);
    read(node, "history_capacity", engine.history_capacity);
    read(node, "checkpoint_path", engine.checkpoint_path);
    read(node, "checkpoint_interval", engine.checkpoint_interval);
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

AppConfig from_yaml(const YAML::Node& root) {
    AppConfig config;
    try {
        read_logging(root["logging"], config.logging);

        if (root["registry"]) {
            read(root["registry"], "path", config.registry.path);
        }
        if (root["features"]) {
            read(root["features"], "schema", config.features.schema);
        }

        read_regime(root["regime"], config.regime);
        read_ensemble(root["ensemble"], config.ensemble);
        read_risk(root["risk"], config.risk);
        read_engine(root["engine"], config.engine);

        if (root["backtest"]) {
            const auto bt = root["backtest"];
            read(bt, "include_advisory", config.backtest.include_advisory);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    validate(config);
    return config;
}

AppConfig parse_config(const std::string& yaml_text) {
    try {
        return from_yaml(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed configuration: ") + e.what());
    }
}

AppConfig load_config(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot load configuration " + path.string() + ": " + e.what());
    }
    return from_yaml(root);
}

void validate(const AppConfig& config) {
    const auto& schema = features::schema_by_id(config.features.schema);

    regime::validate(config.regime);
    ensemble::validate(config.ensemble);
    risk::validate(config.risk);

    const auto& engine = config.engine;
    if (engine.worker_threads < 1 || engine.predictor_threads < 1) {
        throw ConfigError("engine thread counts must be at least 1");
    }
    if (engine.cycle_deadline.count() <= 0) {
        throw ConfigError("engine.cycle_deadline_ms must be positive");
    }
    const size_t needed = std::max(schema.min_lookback, config.regime.window);
    if (engine.history_capacity < needed) {
        throw ConfigError("engine.history_capacity must be at least " + std::to_string(needed));
    }
}

std::filesystem::path resolve_path(const std::filesystem::path& config_path, const std::string& value) {
    std::filesystem::path p(value);
    if (p.is_absolute() || std::filesystem::exists(p)) {
        return p;
    }
    auto sibling = config_path.parent_path() / p.filename();
    return std::filesystem::exists(sibling) ? sibling : p;
}

// ============================================================================
// Config Store
// ============================================================================

ConfigStore::ConfigStore(std::filesystem::path path)
    : path_(std::move(path)),
      current_(std::make_shared<const AppConfig>(load_config(path_))) {}

std::shared_ptr<const AppConfig> ConfigStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::shared_ptr<const AppConfig> ConfigStore::reload() {
    auto fresh = std::make_shared<const AppConfig>(load_config(path_));

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }

    // The candidate becomes current only once every listener has applied it
    for (const auto& listener : listeners) {
        listener(*fresh);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = fresh;
    }
    LOG_INFO("Configuration reloaded from {}", path_.string());
    return fresh;
}

void ConfigStore::on_reload(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

}  // namespace aurum::config
