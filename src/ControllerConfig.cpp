#include "ControllerConfig.hpp"

#include "Direction.hpp"

namespace greenwave
{
    std::vector<std::string> validateControllerConfig(const ControllerConfig &config)
    {
        std::vector<std::string> errors;
        const SignalPolicy &policy = config.policy;

        if (policy.max_green_seconds <= 0)
        {
            errors.push_back("max_green_seconds must be positive");
        }
        if (policy.min_green_seconds <= 0)
        {
            errors.push_back("min_green_seconds must be positive");
        }
        if (policy.min_green_seconds > policy.max_green_seconds)
        {
            errors.push_back("min_green_seconds must not exceed max_green_seconds");
        }
        if (policy.high_traffic_threshold <= 0)
        {
            errors.push_back("high_traffic_threshold must be positive");
        }
        if (policy.low_traffic_threshold <= 0)
        {
            errors.push_back("low_traffic_threshold must be positive");
        }
        if (policy.low_traffic_threshold > policy.high_traffic_threshold)
        {
            errors.push_back("low_traffic_threshold must not exceed high_traffic_threshold");
        }

        if (!(config.cycle_period_seconds > 0.0))
        {
            errors.push_back("cycle_period_seconds must be positive");
        }
        if (!(config.detection_backoff_seconds > 0.0))
        {
            errors.push_back("detection_backoff_seconds must be positive");
        }
        if (config.max_consecutive_contract_violations <= 0)
        {
            errors.push_back("max_consecutive_contract_violations must be positive");
        }
        if (config.http_port < 1 || config.http_port > 65535)
        {
            errors.push_back("http_port must be in 1..65535");
        }

        for (Direction dir : kAllDirections)
        {
            if (config.detector.arrival_rates[directionIndex(dir)] < 0.0)
            {
                errors.push_back(std::string("detector.arrival_rates.") + directionToString(dir) + " must not be negative");
            }
        }
        if (!(config.detector.dwell_seconds > 0.0))
        {
            errors.push_back("detector.dwell_seconds must be positive");
        }
        if (config.detector.frame_drop_probability < 0.0 || config.detector.frame_drop_probability > 1.0)
        {
            errors.push_back("detector.frame_drop_probability must be in [0, 1]");
        }

        return errors;
    }
} // namespace greenwave
