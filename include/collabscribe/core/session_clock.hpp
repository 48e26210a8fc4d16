#pragma once

#include <chrono>
#include <memory>

namespace collabscribe {
namespace core {

/**
 * Time source of a transcription session. Session-relative times are measured
 * on the monotonic clock; createdAt stamps use the wall clock.
 */
class SessionClock {
public:
    virtual ~SessionClock() = default;

    virtual std::chrono::steady_clock::time_point now() const = 0;
    virtual std::chrono::system_clock::time_point wallNow() const = 0;

    /**
     * Seconds elapsed since the given start point (never negative)
     */
    double secondsSince(std::chrono::steady_clock::time_point start) const {
        double elapsed = std::chrono::duration<double>(now() - start).count();
        return elapsed > 0.0 ? elapsed : 0.0;
    }
};

class SystemSessionClock : public SessionClock {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    std::chrono::system_clock::time_point wallNow() const override {
        return std::chrono::system_clock::now();
    }
};

inline std::shared_ptr<SessionClock> makeSystemClock() {
    return std::make_shared<SystemSessionClock>();
}

} // namespace core
} // namespace collabscribe
