#pragma once

#include "Grid.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace trafficjam
{
    namespace rule_kind
    {
        static constexpr const char *ACCELERATE = "accelerate";
        static constexpr const char *DAWDLING = "dawdling";
        static constexpr const char *AVOID_COLLISION = "avoid_collision";
        static constexpr const char *BREAK_OR_TAKE_OVER = "break_or_take_over";
        static constexpr const char *MOVE_FORWARD = "move_forward";
        static constexpr const char *MERGE_BACK = "merge_back";
        static constexpr const char *DUMMY_SHUFFLE = "dummy_shuffle";
    }

    struct RuleDescriptor
    {
        std::string kind;
        std::map<std::string, double> params;

        bool operator==(const RuleDescriptor &other) const
        {
            return kind == other.kind && params == other.params;
        }
        bool operator!=(const RuleDescriptor &other) const { return !(*this == other); }
    };

    // A rule takes ownership of the grid it transforms and hands back the result.
    // Implementations keep the grid shape and the number of cars unchanged.
    class IRule
    {
    public:
        virtual ~IRule() = default;
        virtual Grid apply(Grid grid) = 0;
        virtual RuleDescriptor describe() const = 0;
    };

    // Every car below v_max gains one cell per step.
    class Accelerate : public IRule
    {
    public:
        explicit Accelerate(int v_max);

        Grid apply(Grid grid) override;
        RuleDescriptor describe() const override;

        int getMaxVelocity() const { return v_max; }

    private:
        int v_max;
    };

    // Moving cars slow down by one with the given probability. The generator
    // is seeded once and keeps its state across steps.
    class Dawdling : public IRule
    {
    public:
        Dawdling(double probability, uint32_t seed);

        Grid apply(Grid grid) override;
        RuleDescriptor describe() const override;

        double getProbability() const { return probability; }

    private:
        double probability;
        uint32_t seed;
        std::mt19937 rng;
        std::bernoulli_distribution dawdle;
    };

    class AvoidCollision : public IRule
    {
    public:
        Grid apply(Grid grid) override;
        RuleDescriptor describe() const override;
    };

    // AvoidCollision with overtaking: a blocked car switches to the next lane
    // (lane + 1) when that lane is clear over its whole forward window.
    class BreakOrTakeOver : public IRule
    {
    public:
        Grid apply(Grid grid) override;
        RuleDescriptor describe() const override;
    };

    // Expects collision avoidance to have run earlier in the pipeline.
    class MoveForward : public IRule
    {
    public:
        Grid apply(Grid grid) override;
        RuleDescriptor describe() const override;
    };

    class MergeBack : public IRule
    {
    public:
        Grid apply(Grid grid) override;
        RuleDescriptor describe() const override;
    };

    // Rotates every lane by one cell. Not a physical rule; used by tests and demos.
    class DummyShuffle : public IRule
    {
    public:
        Grid apply(Grid grid) override;
        RuleDescriptor describe() const override;
    };

    // Throws SimulationError(ConfigurationError) on unknown kinds or bad params.
    std::unique_ptr<IRule> makeRule(const RuleDescriptor &descriptor);

} // namespace trafficjam
