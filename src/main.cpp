// ============================================================================
// AURUM - Ensemble Decision Core
// ============================================================================
// Command-line front end
//
//   aurum backtest --config <yaml> --data <csv> [--out <json>] [--verify]
//   aurum serve    --config <yaml>
//   aurum validate --config <yaml>
//
// Serve mode:
//   [stdin JSON lines] --> DecisionApi --> LiveEngine (strand per instrument)
//                                              │
//                                        SignalArbiter
//                                              │
//   [stdout JSON lines] <-- TradeSignal <------┘
// SIGHUP reloads the configuration, SIGINT/SIGTERM stop after the current line
// ============================================================================

#include "aurum/api/decision_api.hpp"
#include "aurum/backtest/replayer.hpp"
#include "aurum/backtest/report.hpp"
#include "aurum/config/config.hpp"
#include "aurum/core/error.hpp"
#include "aurum/engine/checkpoint.hpp"
#include "aurum/engine/live_engine.hpp"
#include "aurum/engine/signal_arbiter.hpp"
#include "aurum/market/history_loader.hpp"
#include "aurum/model/model_registry.hpp"
#include "aurum/model/prediction_executor.hpp"
#include "aurum/utils/logger.hpp"

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {
    std::atomic<bool> g_running{true};
    std::atomic<bool> g_reload{false};

    void signal_handler(int signal) {
        if (signal == SIGHUP) {
            g_reload = true;
            return;
        }
        g_running = false;
    }

    struct Options {
        std::string command;
        std::string config_path = "config/config.yaml";
        std::string data_path;
        std::string out_path;
        bool verify = false;
    };

    void print_usage() {
        std::cerr << "Usage:\n"
                  << "  aurum backtest --config <yaml> --data <csv> [--out <json>] [--verify]\n"
                  << "  aurum serve    --config <yaml>\n"
                  << "  aurum validate --config <yaml>\n";
    }

    std::optional<Options> parse_args(int argc, char* argv[]) {
        if (argc < 2) return std::nullopt;

        Options options;
        options.command = argv[1];
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                options.config_path = argv[++i];
            } else if (arg == "--data" && i + 1 < argc) {
                options.data_path = argv[++i];
            } else if (arg == "--out" && i + 1 < argc) {
                options.out_path = argv[++i];
            } else if (arg == "--verify") {
                options.verify = true;
            } else {
                std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
                return std::nullopt;
            }
        }
        return options;
    }
}

using namespace aurum;

// ============================================================================
// Shared Setup
// ============================================================================

model::PredictorSet load_predictors(const std::string& config_path, const config::AppConfig& config) {
    const auto& schema = features::schema_by_id(config.features.schema);
    const auto path = config::resolve_path(config_path, config.registry.path);
    return model::ModelRegistry::load(path, schema);
}

std::shared_ptr<const engine::SignalArbiter> make_live_arbiter(const std::string& config_path,
                                                               const config::AppConfig& config) {
    return std::make_shared<const engine::SignalArbiter>(
        features::FeatureBuilder(config.features.schema),
        load_predictors(config_path, config),
        ensemble::EnsembleAggregator(config.ensemble),
        std::make_shared<model::PooledExecutor>(config.engine.predictor_threads));
}

// ============================================================================
// Commands
// ============================================================================

int run_backtest(const Options& options) {
    if (options.data_path.empty()) {
        std::cerr << "[ERROR] backtest needs --data <csv>\n";
        return 1;
    }

    const auto config = config::load_config(options.config_path);
    utils::Logger::initialize(config.logging);

    backtest::BacktestReplayer replayer(config, load_predictors(options.config_path, config));
    const auto history = market::load_history(options.data_path, market::ValidationMode::Lenient);

    const auto result = options.verify ? replayer.verify_determinism(history.series)
                                       : replayer.run(history.series);
    const auto fingerprint = options.out_path.empty()
                                 ? backtest::fingerprint(result)
                                 : backtest::write_report(result, options.out_path);

    const auto& s = result.stats;
    std::cout << "========================================\n";
    std::cout << "  AURUM - Backtest\n";
    std::cout << "  Instruments:    " << result.sessions.size() << "\n";
    std::cout << "  Rows:           " << history.rows
              << " (" << history.validation.rejected << " rejected)\n";
    std::cout << "  Decisions:      " << s.decision_count << "\n";
    std::cout << "  Skipped ticks:  " << s.skipped_ticks << "\n";
    std::cout << "  Trades:         " << s.trade_count << "\n";
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "  Total return:   " << s.total_return << "\n";
    std::cout << "  Sharpe:         " << s.sharpe << "\n";
    std::cout << "  Max drawdown:   " << s.max_drawdown << "\n";
    std::cout << "  Win rate:       " << s.win_rate << "\n";
    std::cout << "  Profit factor:  " << s.profit_factor << "\n";
    std::cout << "  Fingerprint:    " << fingerprint << "\n";
    if (options.verify) {
        std::cout << "  Determinism:    verified\n";
    }
    std::cout << "========================================\n";
    return 0;
}

int run_serve(const Options& options) {
    config::ConfigStore store(options.config_path);
    auto config = store.current();
    utils::Logger::initialize(config->logging);

    engine::LiveEngine engine(*config, make_live_arbiter(options.config_path, *config));
    if (auto checkpoint = engine::load_checkpoint(config->engine.checkpoint_path,
                                                  config->ensemble.initial_reliability)) {
        engine.restore(*checkpoint);
    }

    store.on_reload([&engine, &options](const config::AppConfig& next) {
        engine.reconfigure(next, make_live_arbiter(options.config_path, next));
    });

    LOG_INFO("Serving decisions on stdin/stdout (config {})", options.config_path);
    api::DecisionApi api(engine);

    std::string line;
    while (g_running && std::getline(std::cin, line)) {
        if (g_reload.exchange(false)) {
            try {
                store.reload();
            } catch (const std::exception& e) {
                LOG_ERROR("Config reload failed, keeping previous: {}", e.what());
            }
        }
        if (line.empty()) continue;
        std::cout << api.handle(line) << '\n' << std::flush;
    }

    engine.stop();
    return 0;
}

int run_validate(const Options& options) {
    const auto config = config::load_config(options.config_path);
    const auto predictors = load_predictors(options.config_path, config);

    std::cout << "[OK] " << options.config_path << ": schema " << config.features.schema
              << ", " << predictors.size() << " predictors\n";
    for (const auto& p : predictors) {
        std::cout << "  " << p->id() << " (" << p->spec().kind << ", weight "
                  << p->base_weight() << ", timeout "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(p->timeout()).count()
                  << "ms" << (p->deterministic() ? "" : ", advisory") << ")\n";
    }
    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    const auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return 1;
    }

    int rc = 1;
    try {
        if (options->command == "backtest") {
            rc = run_backtest(*options);
        } else if (options->command == "serve") {
            rc = run_serve(*options);
        } else if (options->command == "validate") {
            rc = run_validate(*options);
        } else {
            print_usage();
            return 1;
        }
    } catch (const SchemaMismatch& e) {
        std::cerr << "[ERROR] Schema mismatch: " << e.what() << "\n";
        rc = 2;
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] Configuration: " << e.what() << "\n";
        rc = 2;
    } catch (const ReplayDivergence& e) {
        std::cerr << "[CRITICAL] Replay diverged: " << e.what() << "\n";
        rc = 3;
    } catch (const std::exception& e) {
        std::cerr << "[CRITICAL] Unhandled Exception: " << e.what() << "\n";
        rc = 1;
    }

    utils::Logger::shutdown();
    return rc;
}
