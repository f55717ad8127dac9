#pragma once

#include "Direction.hpp"

#include <array>

namespace greenwave
{
    // One vehicle count per direction, indexed by directionIndex()
    struct DirectionCounts
    {
        std::array<int, 4> values{};

        int get(Direction dir) const { return values[directionIndex(dir)]; }
        void set(Direction dir, int count) { values[directionIndex(dir)] = count; }

        int total() const
        {
            return values[0] + values[1] + values[2] + values[3];
        }

        bool operator==(const DirectionCounts &other) const { return values == other.values; }
        bool operator!=(const DirectionCounts &other) const { return values != other.values; }
    };

    // Per-frame detector output
    using RawCounts = DirectionCounts;

    // Smoothed counts held by TrafficState; only ever produced by the smoother
    using TrafficCounts = DirectionCounts;

} // namespace greenwave
