#include "ApiService.hpp"

#include "ControllerConfigJson.hpp"

#include <utility>

namespace greenwave
{
    ApiService::ApiService(TrafficState &state,
                           OverrideGateway &gateway,
                           DetectionActiveProvider detection_active,
                           const ControllerConfig &config)
        : state(state),
          gateway(gateway),
          detection_active(std::move(detection_active)),
          config(config)
    {
    }

    ApiResponse ApiService::index() const
    {
        return ApiResponse{200, serviceIndexToJson()};
    }

    ApiResponse ApiService::getCounts() const
    {
        return ApiResponse{200, snapshotToJson(state.snapshot(), wallClockSeconds())};
    }

    ApiResponse ApiService::setSignal(const std::string &direction)
    {
        return setSignalResponse(gateway.setManual(direction), direction);
    }

    ApiResponse ApiService::endOverride()
    {
        return ApiResponse{200, endOverrideToJson(gateway.clearManual())};
    }

    ApiResponse ApiService::systemStatus() const
    {
        const TrafficSnapshot snapshot = state.snapshot();
        const bool active = detection_active ? detection_active() : false;
        SystemStatus status = makeSystemStatus(snapshot, state.now(), active, config.policy);
        return ApiResponse{200, systemStatusToJson(status)};
    }

    ApiResponse ApiService::activeConfig() const
    {
        return ApiResponse{200, controllerConfigToJson(config)};
    }
} // namespace greenwave
