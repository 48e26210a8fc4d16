#pragma once

#include "collabscribe/core/session_clock.hpp"
#include <chrono>
#include <mutex>

namespace fixtures {

/**
 * Deterministic session clock advanced explicitly by the test.
 * Wall time starts at 2026-10-17T09:00:00Z.
 */
class ManualClock : public collabscribe::core::SessionClock {
public:
    static constexpr long long kWallEpochSeconds = 1792227600;

    ManualClock()
        : steady_(std::chrono::steady_clock::time_point(std::chrono::hours(1)))
        , wall_(std::chrono::system_clock::time_point(std::chrono::seconds(kWallEpochSeconds))) {}

    std::chrono::steady_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return steady_;
    }

    std::chrono::system_clock::time_point wallNow() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return wall_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        steady_ += delta;
        wall_ += delta;
    }

    void advanceSeconds(double seconds) {
        advance(std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0 + 0.5)));
    }

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point steady_;
    std::chrono::system_clock::time_point wall_;
};

} // namespace fixtures
