// ============================================================================
// AURUM - State Checkpoint Implementation
// ============================================================================

#include "aurum/engine/checkpoint.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iterator>

namespace aurum::engine {

namespace {

constexpr RegimeLabel ALL_REGIMES[] = {
    RegimeLabel::Undetermined,
    RegimeLabel::Trending,
    RegimeLabel::Ranging,
    RegimeLabel::HighVolatility,
    RegimeLabel::Illiquid,
};

RegimeLabel regime_or_throw(const std::string& name) {
    auto label = parse_regime(name);
    if (!label) {
        throw ConfigError("checkpoint lists unknown regime '" + name + "'");
    }
    return *label;
}

}  // namespace

std::string to_yaml(const Checkpoint& checkpoint) {
    YAML::Emitter out;
    out.SetDoublePrecision(17);

    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << Checkpoint::VERSION;
    out << YAML::Key << "written_at" << YAML::Value << to_epoch_ns(checkpoint.written_at);
    out << YAML::Key << "instruments" << YAML::Value << YAML::BeginSeq;

    for (const auto& inst : checkpoint.instruments) {
        out << YAML::BeginMap;
        out << YAML::Key << "instrument" << YAML::Value << inst.instrument;
        out << YAML::Key << "regime" << YAML::Value << std::string(to_string(inst.regime));
        out << YAML::Key << "equity" << YAML::Value << inst.equity;
        out << YAML::Key << "peak_equity" << YAML::Value << inst.peak_equity;
        out << YAML::Key << "trades" << YAML::Value << inst.trades;

        out << YAML::Key << "positions" << YAML::Value << YAML::BeginMap;
        for (const auto& [symbol, position] : inst.positions) {
            out << YAML::Key << symbol << YAML::Value << position;
        }
        out << YAML::EndMap;

        out << YAML::Key << "reliability" << YAML::Value << YAML::BeginMap;
        for (const auto& [predictor, scores] : inst.reliabilities.entries()) {
            out << YAML::Key << predictor << YAML::Value << YAML::BeginMap;
            for (auto regime : ALL_REGIMES) {
                out << YAML::Key << std::string(to_string(regime))
                    << YAML::Value << scores[regime_index(regime)];
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;

        out << YAML::EndMap;
    }

    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

Checkpoint checkpoint_from_yaml(const std::string& text, double initial_reliability) {
    Checkpoint checkpoint;
    try {
        YAML::Node root = YAML::Load(text);

        const int version = root["version"].as<int>(0);
        if (version != Checkpoint::VERSION) {
            throw ConfigError("unsupported checkpoint version " + std::to_string(version));
        }
        checkpoint.written_at = from_epoch_ns(root["written_at"].as<int64_t>(0));

        for (const auto& node : root["instruments"]) {
            InstrumentCheckpoint inst;
            inst.reliabilities = ensemble::ReliabilityTable(initial_reliability);
            inst.instrument = node["instrument"].as<std::string>();
            inst.regime = regime_or_throw(node["regime"].as<std::string>("undetermined"));
            inst.equity = node["equity"].as<double>(1.0);
            inst.peak_equity = node["peak_equity"].as<double>(inst.equity);
            inst.trades = node["trades"].as<uint64_t>(0);

            for (const auto& p : node["positions"]) {
                inst.positions[p.first.as<std::string>()] = p.second.as<double>();
            }
            for (const auto& r : node["reliability"]) {
                const auto predictor = r.first.as<std::string>();
                for (const auto& score : r.second) {
                    inst.reliabilities.set(predictor, regime_or_throw(score.first.as<std::string>()),
                                           score.second.as<double>());
                }
            }
            checkpoint.instruments.push_back(std::move(inst));
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed checkpoint: ") + e.what());
    }
    return checkpoint;
}

void save_checkpoint(const Checkpoint& checkpoint, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw ConfigError("cannot write checkpoint " + tmp.string());
        }
        file << to_yaml(checkpoint) << '\n';
        if (!file) {
            throw ConfigError("failed writing checkpoint " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path);
    LOG_DEBUG("Checkpoint written: {} instruments -> {}", checkpoint.instruments.size(), path.string());
}

std::optional<Checkpoint> load_checkpoint(const std::filesystem::path& path, double initial_reliability) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot read checkpoint " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto checkpoint = checkpoint_from_yaml(text, initial_reliability);
    LOG_INFO("Loaded checkpoint {} ({} instruments)", path.string(), checkpoint.instruments.size());
    return checkpoint;
}

}  // namespace aurum::engine
