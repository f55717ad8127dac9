#pragma once

#include "ControllerConfig.hpp"

#include <string>
#include <vector>

namespace greenwave
{
    struct ConfigParseResult
    {
        bool ok = false;
        ControllerConfig config{};
        std::vector<std::string> errors;
    };

    std::string controllerConfigToJson(const ControllerConfig &config);

    // Missing keys keep their defaults; the result is validated before ok is set
    ConfigParseResult controllerConfigFromJson(const std::string &json_text);
    ConfigParseResult loadControllerConfigFile(const std::string &path);

    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace greenwave
