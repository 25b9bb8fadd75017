#pragma once

#include "SimulationConfig.hpp"

#include <string>
#include <vector>

namespace trafficjam
{
    struct ConfigParseResult
    {
        bool ok = false;
        SimulationConfig config{};
        std::vector<std::string> errors;
    };

    std::string simulationConfigToJson(const SimulationConfig &config);
    ConfigParseResult simulationConfigFromJson(const std::string &json_text);
    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace trafficjam
