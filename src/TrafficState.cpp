#include "TrafficState.hpp"

#include <utility>

namespace greenwave
{
    TrafficState::TrafficState(ClockFn clock, Direction initial_active)
        : clock(std::move(clock)),
          revision(0)
    {
        signal.active = initial_active;
        signal.phase_start = this->clock();
        signal.manual_override = false;
    }

    TrafficSnapshot TrafficState::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        TrafficSnapshot snap;
        snap.counts = counts;
        snap.signal = signal;
        snap.revision = revision;
        return snap;
    }

    void TrafficState::updateCounts(const TrafficCounts &smoothed)
    {
        std::lock_guard<std::mutex> lock(mutex);
        counts = smoothed;
        ++revision;
    }

    SignalState TrafficState::switchActive(Direction next)
    {
        const TimePoint started = clock();
        std::lock_guard<std::mutex> lock(mutex);
        signal.active = next;
        signal.phase_start = started;
        ++revision;
        return signal;
    }

    bool TrafficState::switchIfAutomatic(Direction next)
    {
        const TimePoint started = clock();
        std::lock_guard<std::mutex> lock(mutex);
        if (signal.manual_override)
        {
            return false;
        }
        signal.active = next;
        signal.phase_start = started;
        ++revision;
        return true;
    }

    SignalState TrafficState::setOverride(Direction dir)
    {
        const TimePoint started = clock();
        std::lock_guard<std::mutex> lock(mutex);
        signal.active = dir;
        signal.manual_override = true;
        signal.phase_start = started;
        ++revision;
        return signal;
    }

    SignalState TrafficState::clearOverride()
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (signal.manual_override)
        {
            signal.manual_override = false;
            ++revision;
        }
        return signal;
    }

    TimePoint TrafficState::now() const
    {
        return clock();
    }
} // namespace greenwave
