#pragma once
// ============================================================================
// AURUM - Error Taxonomy
// ============================================================================
// Every failure raised by the decision core derives from aurum::Error
// Predictor failures are absorbed by the ensemble; everything else propagates
// ============================================================================

#include "aurum/core/types.hpp"

#include <stdexcept>
#include <string>

namespace aurum {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Feature Builder cannot build a vector: no decision this tick
class InsufficientHistory : public Error {
public:
    InsufficientHistory(size_t required, size_t available)
        : Error("insufficient history: need " + std::to_string(required) +
                " snapshots, have " + std::to_string(available)),
          required_(required), available_(available) {}

    [[nodiscard]] size_t required() const noexcept { return required_; }
    [[nodiscard]] size_t available() const noexcept { return available_; }

private:
    size_t required_;
    size_t available_;
};

/// Predictor exceeded its latency budget
class ModelTimeout : public Error {
public:
    ModelTimeout(const std::string& predictor_id, Duration budget)
        : Error("predictor '" + predictor_id + "' exceeded " +
                std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(budget).count()) +
                "ms budget"),
          predictor_id_(predictor_id) {}

    [[nodiscard]] const std::string& predictor_id() const noexcept { return predictor_id_; }

private:
    std::string predictor_id_;
};

/// Predictor failed internally (bad output, transport failure, ...)
class ModelError : public Error {
public:
    using Error::Error;
};

/// Feature vector schema does not match what a predictor was configured for
class SchemaMismatch : public Error {
public:
    SchemaMismatch(const std::string& context, const std::string& expected, const std::string& actual)
        : Error(context + ": expected schema '" + expected + "', got '" + actual + "'") {}

    explicit SchemaMismatch(const std::string& message) : Error(message) {}
};

/// Invalid or unreadable configuration / registry
class ConfigError : public Error {
public:
    using Error::Error;
};

/// Live cycle still waiting past the global per-cycle deadline
class CycleDeadlineExceeded : public Error {
public:
    using Error::Error;
};

/// Two replays of identical inputs disagreed; always a bug
class ReplayDivergence : public Error {
public:
    using Error::Error;
};

/// Malformed market data
class DataError : public Error {
public:
    using Error::Error;
};

}  // namespace aurum
