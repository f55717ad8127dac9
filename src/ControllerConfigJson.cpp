#include "ControllerConfigJson.hpp"

#include "Direction.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace greenwave
{
    namespace
    {
        using nlohmann::json;

        void readInt(const json &object, const char *key, int &target, std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            const json &value = object[key];
            if (!value.is_number_integer())
            {
                errors.push_back(std::string(key) + " must be an integer");
                return;
            }
            // Check unsigned values first so large ones cannot wrap in the signed read
            if (value.is_number_unsigned() &&
                value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            {
                errors.push_back(std::string(key) + " is out of range");
                return;
            }
            const std::int64_t wide = value.get<std::int64_t>();
            if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max())
            {
                errors.push_back(std::string(key) + " is out of range");
                return;
            }
            target = static_cast<int>(wide);
        }

        void readDouble(const json &object, const char *key, double &target, std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            const json &value = object[key];
            if (!value.is_number())
            {
                errors.push_back(std::string(key) + " must be a number");
                return;
            }
            target = value.get<double>();
        }

        void readDetector(const json &detector_json, DetectorConfig &detector, std::vector<std::string> &errors)
        {
            if (!detector_json.is_object())
            {
                errors.push_back("detector must be an object");
                return;
            }

            if (detector_json.contains("arrival_rates"))
            {
                const json &rates = detector_json["arrival_rates"];
                if (!rates.is_object())
                {
                    errors.push_back("detector.arrival_rates must be an object");
                }
                else
                {
                    for (auto it = rates.begin(); it != rates.end(); ++it)
                    {
                        Direction dir{};
                        if (!parseDirection(it.key(), dir))
                        {
                            errors.push_back("detector.arrival_rates has unknown direction: " + it.key());
                            continue;
                        }
                        if (!it.value().is_number())
                        {
                            errors.push_back("detector.arrival_rates." + it.key() + " must be a number");
                            continue;
                        }
                        detector.arrival_rates[directionIndex(dir)] = it.value().get<double>();
                    }
                }
            }

            readDouble(detector_json, "dwell_seconds", detector.dwell_seconds, errors);
            readDouble(detector_json, "frame_drop_probability", detector.frame_drop_probability, errors);

            if (detector_json.contains("seed"))
            {
                if (!detector_json["seed"].is_number_unsigned())
                {
                    errors.push_back("detector.seed must be a non-negative integer");
                }
                else if (detector_json["seed"].get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max())
                {
                    errors.push_back("detector.seed is out of range");
                }
                else
                {
                    detector.seed = static_cast<std::uint32_t>(detector_json["seed"].get<std::uint64_t>());
                }
            }
        }
    } // namespace

    std::string controllerConfigToJson(const ControllerConfig &config)
    {
        json root;
        root["max_green_seconds"] = config.policy.max_green_seconds;
        root["min_green_seconds"] = config.policy.min_green_seconds;
        root["high_traffic_threshold"] = config.policy.high_traffic_threshold;
        root["low_traffic_threshold"] = config.policy.low_traffic_threshold;
        root["cycle_period_seconds"] = config.cycle_period_seconds;
        root["detection_backoff_seconds"] = config.detection_backoff_seconds;
        root["max_consecutive_contract_violations"] = config.max_consecutive_contract_violations;
        root["http_port"] = config.http_port;

        json detector;
        json rates = json::object();
        for (Direction dir : kAllDirections)
        {
            rates[directionToString(dir)] = config.detector.arrival_rates[directionIndex(dir)];
        }
        detector["arrival_rates"] = rates;
        detector["dwell_seconds"] = config.detector.dwell_seconds;
        detector["frame_drop_probability"] = config.detector.frame_drop_probability;
        detector["seed"] = config.detector.seed;
        root["detector"] = detector;

        return root.dump();
    }

    ConfigParseResult controllerConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        result.config = makeDefaultControllerConfig();

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        ControllerConfig &config = result.config;
        readInt(root, "max_green_seconds", config.policy.max_green_seconds, result.errors);
        readInt(root, "min_green_seconds", config.policy.min_green_seconds, result.errors);
        readInt(root, "high_traffic_threshold", config.policy.high_traffic_threshold, result.errors);
        readInt(root, "low_traffic_threshold", config.policy.low_traffic_threshold, result.errors);
        readDouble(root, "cycle_period_seconds", config.cycle_period_seconds, result.errors);
        readDouble(root, "detection_backoff_seconds", config.detection_backoff_seconds, result.errors);
        readInt(root, "max_consecutive_contract_violations", config.max_consecutive_contract_violations, result.errors);
        readInt(root, "http_port", config.http_port, result.errors);

        if (root.contains("detector"))
        {
            readDetector(root["detector"], config.detector, result.errors);
        }

        // Type errors leave defaults in place, so only range-check a well-typed document
        if (result.errors.empty())
        {
            result.errors = validateControllerConfig(config);
        }

        result.ok = result.errors.empty();
        return result;
    }

    ConfigParseResult loadControllerConfigFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
        {
            ConfigParseResult result;
            result.errors.push_back("cannot open config file: " + path);
            return result;
        }

        std::ostringstream out;
        out << in.rdbuf();
        return controllerConfigFromJson(out.str());
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump(-1, ' ', false, json::error_handler_t::replace);
    }
} // namespace greenwave
