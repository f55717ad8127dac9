#pragma once

#include "ApiJson.hpp"
#include "ControllerConfig.hpp"
#include "OverrideGateway.hpp"
#include "TrafficState.hpp"

#include <functional>
#include <string>

namespace greenwave
{
    // Operations behind the HTTP endpoints. Only reads TrafficState or goes through the
    // OverrideGateway; never runs detection or the controller.
    class ApiService
    {
    public:
        using DetectionActiveProvider = std::function<bool()>;

        ApiService(TrafficState &state,
                   OverrideGateway &gateway,
                   DetectionActiveProvider detection_active,
                   const ControllerConfig &config);

        ApiResponse index() const;
        ApiResponse getCounts() const;
        ApiResponse setSignal(const std::string &direction);
        ApiResponse endOverride();
        ApiResponse systemStatus() const;
        ApiResponse activeConfig() const;

    private:
        TrafficState &state;
        OverrideGateway &gateway;
        DetectionActiveProvider detection_active;
        ControllerConfig config;
    };

} // namespace greenwave
