#pragma once

#include "ControllerConfig.hpp"
#include "OverrideGateway.hpp"
#include "TrafficState.hpp"

#include <string>

namespace greenwave
{
    struct ApiResponse
    {
        int status_code = 200;
        std::string body;
    };

    struct SystemStatus
    {
        bool detection_active = false;
        bool manual_override = false;
        Direction active{Direction::North};
        double phase_age_seconds = 0.0;
        int total_vehicles = 0;
        SignalPolicy policy;
    };

    SystemStatus makeSystemStatus(const TrafficSnapshot &snapshot,
                                  TimePoint now,
                                  bool detection_active,
                                  const SignalPolicy &policy);

    std::string serviceIndexToJson();
    std::string snapshotToJson(const TrafficSnapshot &snapshot, double timestamp_seconds);
    ApiResponse setSignalResponse(const OverrideResult &result, const std::string &requested);
    std::string endOverrideToJson(const SignalState &signal);
    std::string systemStatusToJson(const SystemStatus &status);
    std::string errorToJson(const std::string &message);

    // Seconds since the Unix epoch, for the "timestamp" fields
    double wallClockSeconds();

} // namespace greenwave
