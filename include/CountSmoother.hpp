#pragma once

#include "TrafficCounts.hpp"

namespace greenwave
{
    // Exponential moving average weights, in tenths: 0.7 * previous + 0.3 * observed
    constexpr int kSmoothingPreviousWeight = 7;
    constexpr int kSmoothingObservedWeight = 3;

    // floor(0.7 * previous + 0.3 * observed), computed in integers so the result is exact
    int smoothCount(int previous, int observed);

    // Applies smoothCount independently to every direction
    TrafficCounts smoothCounts(const TrafficCounts &previous, const RawCounts &observed);

} // namespace greenwave
