// ============================================================================
// AURUM - Configuration Unit Tests
// ============================================================================

#include "aurum/config/config.hpp"
#include "aurum/core/error.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace aurum;
using namespace aurum::config;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    const auto config = parse_config("{}");
    EXPECT_EQ(config.features.schema, "core.v1");
    EXPECT_EQ(config.regime.hysteresis, 3u);
    EXPECT_DOUBLE_EQ(config.ensemble.decay_half_life, 20.0);
    EXPECT_DOUBLE_EQ(config.risk.max_drawdown, 0.15);
    EXPECT_EQ(config.engine.cycle_deadline.count(), 250);
    EXPECT_FALSE(config.backtest.include_advisory);
}

TEST(ConfigTest, ReadsEverySection) {
    const auto config = parse_config(R"(
logging:
  level: debug
  file: ""
regime:
  window: 20
  hysteresis: 5
ensemble:
  decay_half_life: 10
risk:
  max_exposure: 0.8
  instrument_limits:
    XAUUSD: 0.25
engine:
  worker_threads: 2
  cycle_deadline_ms: 100
backtest:
  include_advisory: true
)");

    EXPECT_EQ(config.logging.level, utils::LogLevel::Debug);
    EXPECT_TRUE(config.logging.log_file.empty());
    EXPECT_EQ(config.regime.window, 20u);
    EXPECT_EQ(config.regime.hysteresis, 5u);
    EXPECT_DOUBLE_EQ(config.ensemble.decay_half_life, 10.0);
    EXPECT_DOUBLE_EQ(config.risk.max_exposure, 0.8);
    EXPECT_DOUBLE_EQ(config.risk.limit_for(Symbol("XAUUSD")), 0.25);
    EXPECT_DOUBLE_EQ(config.risk.limit_for(Symbol("EURUSD")), config.risk.instrument_limit);
    EXPECT_EQ(config.engine.worker_threads, 2u);
    EXPECT_EQ(config.engine.cycle_deadline.count(), 100);
    EXPECT_TRUE(config.backtest.include_advisory);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW((void)parse_config("regime: {hysteresis: 0}"), ConfigError);
    EXPECT_THROW((void)parse_config("risk: {max_drawdown: 1.5}"), ConfigError);
    EXPECT_THROW((void)parse_config("risk: {max_exposure: 1.5}"), ConfigError);
    EXPECT_THROW((void)parse_config("risk: {max_exposure: 0}"), ConfigError);
    EXPECT_THROW((void)parse_config("logging: {level: verbose}"), ConfigError);
    EXPECT_THROW((void)parse_config("ensemble: {initial_reliability: -0.1}"), ConfigError);
    EXPECT_THROW((void)parse_config("engine: {worker_threads: 0}"), ConfigError);
    EXPECT_THROW((void)parse_config("engine: {history_capacity: 10}"), ConfigError);
    EXPECT_THROW((void)parse_config("features: {schema: core.v9}"), ConfigError);
    EXPECT_THROW((void)parse_config("regime: {window: many}"), ConfigError);
    EXPECT_THROW((void)parse_config("regime: [unclosed"), ConfigError);
}

TEST(ConfigTest, ShippedConfigIsValid) {
    const auto path = std::filesystem::path(AURUM_SOURCE_DIR) / "config" / "config.yaml";
    const auto config = load_config(path);
    EXPECT_DOUBLE_EQ(config.risk.limit_for(Symbol("XAUUSD")), 0.3);

    const auto registry = resolve_path(path, config.registry.path);
    EXPECT_TRUE(std::filesystem::exists(registry)) << registry;
}

TEST(ConfigTest, MissingFileIsAConfigError) {
    EXPECT_THROW((void)load_config("/nonexistent/aurum.yaml"), ConfigError);
}

TEST(ConfigStoreTest, ReloadNotifiesAndKeepsPreviousOnFailure) {
    const auto path = std::filesystem::temp_directory_path() / "aurum_config_store_test.yaml";
    {
        std::ofstream out(path);
        out << "regime: {hysteresis: 3}\n";
    }

    ConfigStore store(path);
    EXPECT_EQ(store.current()->regime.hysteresis, 3u);

    size_t seen = 0;
    store.on_reload([&seen](const AppConfig& next) { seen = next.regime.hysteresis; });

    {
        std::ofstream out(path, std::ios::trunc);
        out << "regime: {hysteresis: 4}\n";
    }
    store.reload();
    EXPECT_EQ(seen, 4u);
    EXPECT_EQ(store.current()->regime.hysteresis, 4u);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "regime: {hysteresis: 0}\n";
    }
    EXPECT_THROW(store.reload(), ConfigError);
    EXPECT_EQ(store.current()->regime.hysteresis, 4u);
    EXPECT_EQ(seen, 4u);

    std::filesystem::remove(path);
}

TEST(ConfigStoreTest, FailingListenerKeepsPreviousConfig) {
    const auto path = std::filesystem::temp_directory_path() / "aurum_config_store_listener.yaml";
    {
        std::ofstream out(path);
        out << "regime: {hysteresis: 3}\n";
    }

    ConfigStore store(path);
    size_t applied = 0;
    store.on_reload([&applied](const AppConfig& next) {
        if (next.regime.hysteresis > 4) {
            throw ConfigError("predictor set rejected");
        }
        applied = next.regime.hysteresis;
    });

    {
        std::ofstream out(path, std::ios::trunc);
        out << "regime: {hysteresis: 6}\n";
    }
    EXPECT_THROW(store.reload(), ConfigError);
    EXPECT_EQ(store.current()->regime.hysteresis, 3u);
    EXPECT_EQ(applied, 0u);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "regime: {hysteresis: 4}\n";
    }
    const auto next = store.reload();
    EXPECT_EQ(next->regime.hysteresis, 4u);
    EXPECT_EQ(store.current()->regime.hysteresis, 4u);
    EXPECT_EQ(applied, 4u);

    std::filesystem::remove(path);
}
