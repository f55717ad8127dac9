#pragma once

#include "TrafficState.hpp"

#include <string>
#include <vector>

namespace greenwave
{
    struct OverrideResult
    {
        bool ok = false;
        SignalState state{};
        std::string error;                         // set when ok == false
        std::vector<std::string> valid_directions; // set when ok == false
    };

    // Manual control surface. Mutates the shared TrafficState it was handed; owns nothing.
    class OverrideGateway
    {
    public:
        explicit OverrideGateway(TrafficState &state);

        // Validates `direction` (case-insensitive) before touching any state
        OverrideResult setManual(const std::string &direction);

        // Idempotent; only lowers the override flag
        SignalState clearManual();

    private:
        TrafficState &state;
    };

} // namespace greenwave
