#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace Prowl {
namespace Core {

using TimePoint       = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

// now() is wall time so that lease deadlines persisted in the store stay meaningful across
// restarts. steady_now() never jumps and drives in-process intervals (politeness, cooldown).
class Clock {
public:
    virtual ~Clock()                           = default;
    virtual TimePoint       now() const        = 0;
    virtual SteadyTimePoint steady_now() const = 0;

    static Clock& system();
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
    SteadyTimePoint steady_now() const override {
        return std::chrono::steady_clock::now();
    }
};

inline Clock& Clock::system() {
    static SystemClock clock;
    return clock;
}

// Manually advanced clock, safe to read from several threads.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint(std::chrono::hours(24 * 365 * 50)))
        : ticks_(start.time_since_epoch().count()) {
    }

    TimePoint now() const override {
        return TimePoint(TimePoint::duration(ticks_.load()));
    }

    SteadyTimePoint steady_now() const override {
        return SteadyTimePoint(
            std::chrono::duration_cast<SteadyTimePoint::duration>(TimePoint::duration(ticks_.load())));
    }

    void advance(std::chrono::milliseconds delta) {
        ticks_ += std::chrono::duration_cast<TimePoint::duration>(delta).count();
    }

private:
    std::atomic<TimePoint::rep> ticks_;
};

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace Core
}  // namespace Prowl
