#include "Direction.hpp"

#include <algorithm>
#include <cctype>

namespace greenwave
{
    const char *directionToString(Direction dir)
    {
        switch (dir)
        {
        case Direction::North:
            return "north";
        case Direction::South:
            return "south";
        case Direction::East:
            return "east";
        case Direction::West:
            return "west";
        }
        return "unknown";
    }

    bool parseDirection(const std::string &text, Direction &dir)
    {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        for (Direction candidate : kAllDirections)
        {
            if (lowered == directionToString(candidate))
            {
                dir = candidate;
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> validDirectionNames()
    {
        std::vector<std::string> names;
        names.reserve(kAllDirections.size());
        for (Direction dir : kAllDirections)
        {
            names.emplace_back(directionToString(dir));
        }
        return names;
    }
} // namespace greenwave
