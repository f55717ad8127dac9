#include "ApiJson.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace greenwave
{
    namespace
    {
        using nlohmann::json;

        // Request text is echoed back in some bodies; invalid UTF-8 becomes U+FFFD instead of throwing
        std::string dumpBody(const json &root)
        {
            return root.dump(-1, ' ', false, json::error_handler_t::replace);
        }

        json countsToJson(const TrafficCounts &counts)
        {
            json out = json::object();
            for (Direction dir : kAllDirections)
            {
                out[directionToString(dir)] = counts.get(dir);
            }
            return out;
        }
    } // namespace

    SystemStatus makeSystemStatus(const TrafficSnapshot &snapshot,
                                  TimePoint now,
                                  bool detection_active,
                                  const SignalPolicy &policy)
    {
        SystemStatus status;
        status.detection_active = detection_active;
        status.manual_override = snapshot.signal.manual_override;
        status.active = snapshot.signal.active;
        status.phase_age_seconds = std::chrono::duration<double>(now - snapshot.signal.phase_start).count();
        status.total_vehicles = snapshot.counts.total();
        status.policy = policy;
        return status;
    }

    std::string serviceIndexToJson()
    {
        json root;
        root["status"] = "Adaptive signal controller is running";
        root["endpoints"] = {"/get_counts", "/set_signal/<direction>", "/end_override", "/system_status", "/config"};
        return dumpBody(root);
    }

    std::string snapshotToJson(const TrafficSnapshot &snapshot, double timestamp_seconds)
    {
        json root;
        root["counts"] = countsToJson(snapshot.counts);
        root["signal"] = directionToString(snapshot.signal.active);
        root["manual_override"] = snapshot.signal.manual_override;
        root["timestamp"] = timestamp_seconds;
        root["total_vehicles"] = snapshot.counts.total();
        return dumpBody(root);
    }

    ApiResponse setSignalResponse(const OverrideResult &result, const std::string &requested)
    {
        ApiResponse response;
        json root;
        if (!result.ok)
        {
            response.status_code = 400;
            root["status"] = "error";
            root["message"] = result.error;
            root["valid_directions"] = result.valid_directions;
            response.body = dumpBody(root);
            return response;
        }

        root["status"] = "success";
        root["message"] = "Signal manually set to " + requested;
        root["current_signal"] = directionToString(result.state.active);
        root["manual_override"] = result.state.manual_override;
        response.body = dumpBody(root);
        return response;
    }

    std::string endOverrideToJson(const SignalState &signal)
    {
        json root;
        root["status"] = "success";
        root["message"] = "Manual override ended, adaptive control resumed";
        root["manual_override"] = signal.manual_override;
        return dumpBody(root);
    }

    std::string systemStatusToJson(const SystemStatus &status)
    {
        json root;
        root["detection_active"] = status.detection_active;
        root["manual_override"] = status.manual_override;
        root["current_signal"] = directionToString(status.active);
        root["phase_age"] = status.phase_age_seconds;
        root["total_vehicles"] = status.total_vehicles;
        root["high_traffic_threshold"] = status.policy.high_traffic_threshold;
        root["signal_timing"] = {
            {"max_green_time", status.policy.max_green_seconds},
            {"min_green_time", status.policy.min_green_seconds},
            {"low_traffic_threshold", status.policy.low_traffic_threshold}};
        return dumpBody(root);
    }

    std::string errorToJson(const std::string &message)
    {
        json root;
        root["status"] = "error";
        root["message"] = message;
        return dumpBody(root);
    }

    double wallClockSeconds()
    {
        return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    }
} // namespace greenwave
