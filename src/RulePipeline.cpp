#include "RulePipeline.hpp"
#include "SimulationError.hpp"

#include <utility>

namespace trafficjam
{
    void RulePipeline::add(std::unique_ptr<IRule> rule)
    {
        if (!rule)
        {
            throw SimulationError(ErrorKind::ConfigurationError, "pipeline rule must not be null");
        }
        rules.push_back(std::move(rule));
    }

    Grid RulePipeline::apply(Grid grid)
    {
        for (auto &rule : rules)
        {
            grid = rule->apply(std::move(grid));
        }
        return grid;
    }

    std::vector<RuleDescriptor> RulePipeline::describe() const
    {
        std::vector<RuleDescriptor> descriptors;
        descriptors.reserve(rules.size());
        for (const auto &rule : rules)
        {
            descriptors.push_back(rule->describe());
        }
        return descriptors;
    }

    RulePipeline makeRulePipeline(const std::vector<RuleDescriptor> &descriptors)
    {
        RulePipeline pipeline;
        for (const auto &descriptor : descriptors)
        {
            pipeline.add(makeRule(descriptor));
        }
        return pipeline;
    }

    std::vector<RuleDescriptor> canonicalRuleDescriptors(int v_max, double dawdling_probability, uint32_t seed,
                                                         bool overtaking)
    {
        std::vector<RuleDescriptor> descriptors;
        descriptors.push_back({rule_kind::ACCELERATE, {{"v_max", static_cast<double>(v_max)}}});
        descriptors.push_back({overtaking ? rule_kind::BREAK_OR_TAKE_OVER : rule_kind::AVOID_COLLISION, {}});
        descriptors.push_back({rule_kind::DAWDLING,
                               {{"probability", dawdling_probability}, {"seed", static_cast<double>(seed)}}});
        descriptors.push_back({rule_kind::MOVE_FORWARD, {}});
        if (overtaking)
        {
            descriptors.push_back({rule_kind::MERGE_BACK, {}});
        }
        return descriptors;
    }

} // namespace trafficjam
