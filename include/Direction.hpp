#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace greenwave
{
    enum class Direction
    {
        North = 0,
        South = 1,
        East = 2,
        West = 3
    };

    // Fixed iteration order; also the tie-break order when searching for the busiest direction
    constexpr std::array<Direction, 4> kAllDirections = {Direction::North, Direction::South,
                                                         Direction::East, Direction::West};

    inline std::size_t directionIndex(Direction dir)
    {
        return static_cast<std::size_t>(dir);
    }

    inline bool isValidDirection(Direction dir)
    {
        return directionIndex(dir) < kAllDirections.size();
    }

    const char *directionToString(Direction dir);

    // Case-insensitive; leaves `dir` untouched when `text` is not one of the four names
    bool parseDirection(const std::string &text, Direction &dir);

    std::vector<std::string> validDirectionNames();

} // namespace greenwave
