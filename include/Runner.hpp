#pragma once

#include "Grid.hpp"
#include "RulePipeline.hpp"
#include "Street.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace trafficjam
{
    class Runner
    {
    public:
        enum class RunState
        {
            Uninitialized,
            Running,
            Completed
        };

        using ProgressCallback = std::function<void(std::size_t step, std::size_t total)>;

        Runner(const StreetConfig &street_config, RulePipeline pipeline, std::size_t max_steps = 250);

        // Records the initial grid, then applies the pipeline max_steps times,
        // appending each committed grid. Only valid once per runner.
        void run(const ProgressCallback &progress = nullptr);

        RunState getState() const { return state; }
        std::size_t getMaxSteps() const { return max_steps; }
        const StreetConfig &getStreetConfig() const { return street.getConfig(); }
        const Street &getStreet() const { return street; }
        const std::vector<Grid> &getHistory() const { return history; }
        std::vector<RuleDescriptor> describeRules() const { return pipeline.describe(); }

        // Length of the history once run() completes.
        std::size_t expectedHistoryLength() const { return max_steps + 1; }

        std::vector<double> metricAverageRelativeSpeed() const;
        std::vector<std::size_t> metricCarThroughput() const;

        std::vector<uint8_t> serialize() const;
        static Runner deserialize(const std::vector<uint8_t> &bytes);

        // Builds a completed runner around an already recorded history.
        static Runner restore(const StreetConfig &street_config,
                              RulePipeline pipeline,
                              std::size_t max_steps,
                              std::vector<Grid> history);

    private:
        void step();

        Street street;
        RulePipeline pipeline;
        std::size_t max_steps;
        std::vector<Grid> history;
        RunState state = RunState::Uninitialized;
    };

    const char *toString(Runner::RunState state);

} // namespace trafficjam
