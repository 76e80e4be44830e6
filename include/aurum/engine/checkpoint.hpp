#pragma once
// ============================================================================
// AURUM - State Checkpoint
// ============================================================================
// Long-lived per-instrument state (reliability scores, risk budget, committed
// regime) persisted as YAML so a restart resumes where it stopped
// ============================================================================

#include "aurum/ensemble/reliability.hpp"
#include "aurum/risk/risk_gate.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aurum::engine {

struct InstrumentCheckpoint {
    std::string instrument;
    ensemble::ReliabilityTable reliabilities;
    double equity = 1.0;
    double peak_equity = 1.0;
    std::map<std::string, double> positions;
    uint64_t trades = 0;
    RegimeLabel regime = RegimeLabel::Undetermined;
};

struct Checkpoint {
    static constexpr int VERSION = 1;

    Timestamp written_at{};
    std::vector<InstrumentCheckpoint> instruments;
};

[[nodiscard]] std::string to_yaml(const Checkpoint& checkpoint);

/// Throws ConfigError on malformed documents
[[nodiscard]] Checkpoint checkpoint_from_yaml(const std::string& text, double initial_reliability);

/// Write to a temporary file and rename over `path`
void save_checkpoint(const Checkpoint& checkpoint, const std::filesystem::path& path);

/// nullopt when the file does not exist
[[nodiscard]] std::optional<Checkpoint> load_checkpoint(const std::filesystem::path& path,
                                                        double initial_reliability);

}  // namespace aurum::engine
