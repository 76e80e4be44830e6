#pragma once
// ============================================================================
// AURUM - Exposure Book
// ============================================================================
// Portfolio-wide view of the signed position each instrument session holds.
// Every Risk Gate evaluation reads the gross exposure of the other
// instruments from here, and every commit records its new position, so the
// aggregate max_exposure limit binds across instruments
// ============================================================================

#include "aurum/core/types.hpp"

#include <map>
#include <mutex>
#include <string>

namespace aurum::risk {

class ExposureBook {
public:
    /// Gross exposure held by every instrument except `instrument`
    [[nodiscard]] double others(const Symbol& instrument) const;

    /// Sum of |position| across instruments
    [[nodiscard]] double gross() const;

    [[nodiscard]] double position(const Symbol& instrument) const;

    void record(const Symbol& instrument, double position);

    /// Call `settle(others)` with the book locked and record the position it
    /// returns. No other instrument can commit between the read and the write
    template <typename Settle>
    double transact(const Symbol& instrument, Settle&& settle) {
        std::lock_guard<std::mutex> lock(mutex_);
        const double position = settle(others_locked(instrument));
        positions_[instrument.str()] = position;
        return position;
    }

private:
    [[nodiscard]] double others_locked(const Symbol& instrument) const;

    mutable std::mutex mutex_;
    std::map<std::string, double> positions_;
};

}  // namespace aurum::risk
