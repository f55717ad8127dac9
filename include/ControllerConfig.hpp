#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace greenwave
{
    // Policy constants of the adaptive controller. Times are whole seconds.
    struct SignalPolicy
    {
        int max_green_seconds = 30;
        int min_green_seconds = 8;
        int high_traffic_threshold = 15;
        int low_traffic_threshold = 3;
    };

    struct DetectorConfig
    {
        // Vehicles per second entering each region, order: North, South, East, West
        std::array<double, 4> arrival_rates{0.5, 0.5, 0.5, 0.5};
        double dwell_seconds = 6.0;
        double frame_drop_probability = 0.0;
        uint32_t seed = 42;
    };

    struct ControllerConfig
    {
        SignalPolicy policy;
        double cycle_period_seconds = 0.1;
        double detection_backoff_seconds = 1.0;
        int max_consecutive_contract_violations = 3;
        int http_port = 5000;
        DetectorConfig detector;
    };

    inline ControllerConfig makeDefaultControllerConfig()
    {
        return ControllerConfig{};
    }

    // Returns one message per violated rule; empty when the config is usable
    std::vector<std::string> validateControllerConfig(const ControllerConfig &config);

} // namespace greenwave
