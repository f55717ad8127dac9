#include "CountSmoother.hpp"

namespace greenwave
{
    int smoothCount(int previous, int observed)
    {
        // Both inputs are non-negative counts, so integer division is a floor
        const long long weighted = static_cast<long long>(kSmoothingPreviousWeight) * previous +
                                   static_cast<long long>(kSmoothingObservedWeight) * observed;
        return static_cast<int>(weighted / 10);
    }

    TrafficCounts smoothCounts(const TrafficCounts &previous, const RawCounts &observed)
    {
        TrafficCounts smoothed;
        for (Direction dir : kAllDirections)
        {
            smoothed.set(dir, smoothCount(previous.get(dir), observed.get(dir)));
        }
        return smoothed;
    }
} // namespace greenwave
