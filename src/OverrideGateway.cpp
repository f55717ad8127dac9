#include "OverrideGateway.hpp"

#include <iostream>

namespace greenwave
{
    OverrideGateway::OverrideGateway(TrafficState &state)
        : state(state)
    {
    }

    OverrideResult OverrideGateway::setManual(const std::string &direction)
    {
        OverrideResult result;

        Direction dir{};
        if (!parseDirection(direction, dir))
        {
            result.valid_directions = validDirectionNames();
            std::string joined;
            for (const auto &name : result.valid_directions)
            {
                joined += joined.empty() ? name : ", " + name;
            }
            result.error = "Invalid direction '" + direction + "'. Use: " + joined;
            result.state = state.snapshot().signal;
            std::cerr << "Override: rejected direction '" << direction << "'" << std::endl;
            return result;
        }

        result.state = state.setOverride(dir);
        result.ok = true;
        std::cout << "Override: manual override activated, " << directionToString(dir) << " green" << std::endl;
        return result;
    }

    SignalState OverrideGateway::clearManual()
    {
        SignalState signal = state.clearOverride();
        std::cout << "Override: manual override ended, adaptive control resumed" << std::endl;
        return signal;
    }
} // namespace greenwave
