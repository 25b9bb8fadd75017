#pragma once

#include "Rules.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace trafficjam
{
    // Ordered list of rules; each rule consumes the previous rule's output.
    class RulePipeline
    {
    public:
        RulePipeline() = default;
        RulePipeline(RulePipeline &&) = default;
        RulePipeline &operator=(RulePipeline &&) = default;
        RulePipeline(const RulePipeline &) = delete;
        RulePipeline &operator=(const RulePipeline &) = delete;

        void add(std::unique_ptr<IRule> rule);
        Grid apply(Grid grid);

        std::vector<RuleDescriptor> describe() const;
        std::size_t size() const { return rules.size(); }
        bool empty() const { return rules.empty(); }

    private:
        std::vector<std::unique_ptr<IRule>> rules;
    };

    RulePipeline makeRulePipeline(const std::vector<RuleDescriptor> &descriptors);

    // accelerate -> avoid collision (or break/take over) -> dawdling -> move forward
    // [-> merge back when overtaking is enabled]
    std::vector<RuleDescriptor> canonicalRuleDescriptors(int v_max, double dawdling_probability, uint32_t seed,
                                                         bool overtaking);

} // namespace trafficjam
