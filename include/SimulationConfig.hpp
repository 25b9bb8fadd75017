#pragma once

#include "RulePipeline.hpp"
#include "Street.hpp"

#include <cstddef>
#include <vector>

namespace trafficjam
{
    struct SimulationConfig
    {
        StreetConfig street;
        std::vector<RuleDescriptor> rules;
        std::size_t max_steps = 250;
    };

    inline SimulationConfig makeDefaultSimulationConfig()
    {
        SimulationConfig config;
        config.street = StreetConfig{1, 250, 20, 8, 42};
        config.rules = canonicalRuleDescriptors(config.street.v_max, 0.2, config.street.seed, true);
        config.max_steps = 250;
        return config;
    }

} // namespace trafficjam
