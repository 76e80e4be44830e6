// ============================================================================
// AURUM - Exposure Book Implementation
// ============================================================================

#include "aurum/risk/exposure_book.hpp"

#include <cmath>

namespace aurum::risk {

double ExposureBook::others(const Symbol& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return others_locked(instrument);
}

double ExposureBook::others_locked(const Symbol& instrument) const {
    double gross = 0.0;
    for (const auto& [name, position] : positions_) {
        if (name != instrument.view()) {
            gross += std::abs(position);
        }
    }
    return gross;
}

double ExposureBook::gross() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double gross = 0.0;
    for (const auto& [name, position] : positions_) {
        gross += std::abs(position);
    }
    return gross;
}

double ExposureBook::position(const Symbol& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument.str());
    return it != positions_.end() ? it->second : 0.0;
}

void ExposureBook::record(const Symbol& instrument, double position) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[instrument.str()] = position;
}

}  // namespace aurum::risk
