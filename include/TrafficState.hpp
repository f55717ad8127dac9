#pragma once

#include "Direction.hpp"
#include "TrafficCounts.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace greenwave
{
    using SteadyClock = std::chrono::steady_clock;
    using TimePoint = SteadyClock::time_point;
    using ClockFn = std::function<TimePoint()>;

    struct SignalState
    {
        Direction active{Direction::North}; // the single green direction
        TimePoint phase_start{};
        bool manual_override{false};

        bool operator==(const SignalState &other) const
        {
            return active == other.active && phase_start == other.phase_start &&
                   manual_override == other.manual_override;
        }
        bool operator!=(const SignalState &other) const { return !(*this == other); }
    };

    struct TrafficSnapshot
    {
        TrafficCounts counts;
        SignalState signal;
        uint64_t revision = 0; // number of committed mutations
    };

    // Shared record of smoothed counts and signal state. Every operation takes the
    // same lock, so a snapshot always reflects a whole number of commits.
    class TrafficState
    {
    public:
        explicit TrafficState(ClockFn clock = SteadyClock::now,
                              Direction initial_active = Direction::North);

        TrafficState(const TrafficState &) = delete;
        TrafficState &operator=(const TrafficState &) = delete;

        TrafficSnapshot snapshot() const;

        // Replaces all four smoothed values in one step
        void updateCounts(const TrafficCounts &smoothed);

        // Sets the active direction and restarts the phase timer, even when `next` is already active
        SignalState switchActive(Direction next);

        // Same as switchActive, but refused (returns false) while a manual override is in force
        bool switchIfAutomatic(Direction next);

        // Forces `dir` green, raises the override flag and restarts the phase timer
        SignalState setOverride(Direction dir);

        // Lowers the override flag; active direction and timer stay as they are
        SignalState clearOverride();

        TimePoint now() const;

    private:
        ClockFn clock;
        mutable std::mutex mutex;
        TrafficCounts counts;
        SignalState signal;
        uint64_t revision;
    };

} // namespace greenwave
