#include "Runner.hpp"
#include "Metrics.hpp"
#include "RunnerCodec.hpp"
#include "SimulationError.hpp"

#include <string>
#include <utility>

namespace trafficjam
{
    namespace
    {
        void checkAccelerationLimit(const std::vector<RuleDescriptor> &rules, const StreetConfig &config)
        {
            for (const auto &rule : rules)
            {
                if (rule.kind != rule_kind::ACCELERATE)
                {
                    continue;
                }
                auto it = rule.params.find("v_max");
                if (it != rule.params.end() && it->second > config.v_max)
                {
                    throw SimulationError(ErrorKind::ConfigurationError,
                                          "accelerate v_max exceeds street v_max " + std::to_string(config.v_max));
                }
            }
        }
    }

    Runner::Runner(const StreetConfig &street_config, RulePipeline pipeline, std::size_t max_steps)
        : street(street_config), pipeline(std::move(pipeline)), max_steps(max_steps)
    {
        checkAccelerationLimit(this->pipeline.describe(), street_config);
    }

    void Runner::run(const ProgressCallback &progress)
    {
        if (state != RunState::Uninitialized)
        {
            throw SimulationError(ErrorKind::InvalidRunnerState,
                                  std::string("run() requires an unused runner, state is ") + toString(state));
        }

        state = RunState::Running;
        history.reserve(expectedHistoryLength());
        history.push_back(street.read());

        for (std::size_t i = 1; i <= max_steps; ++i)
        {
            step();
            if (progress)
            {
                progress(i, max_steps);
            }
        }
        state = RunState::Completed;
    }

    void Runner::step()
    {
        // street.replace() throws before anything is committed, so a failing
        // step leaves the history as it was.
        Grid next = pipeline.apply(street.read());
        street.replace(next);
        history.push_back(std::move(next));
    }

    std::vector<double> Runner::metricAverageRelativeSpeed() const
    {
        if (history.empty())
        {
            return std::vector<double>(expectedHistoryLength(), 0.0);
        }
        return averageRelativeSpeed(history, street.getConfig().v_max);
    }

    std::vector<std::size_t> Runner::metricCarThroughput() const
    {
        if (history.empty())
        {
            return std::vector<std::size_t>(expectedHistoryLength(), 0);
        }
        return carThroughput(history);
    }

    std::vector<uint8_t> Runner::serialize() const
    {
        return encodeRunArtifact(*this);
    }

    Runner Runner::deserialize(const std::vector<uint8_t> &bytes)
    {
        return decodeRunArtifact(bytes);
    }

    Runner Runner::restore(const StreetConfig &street_config,
                           RulePipeline pipeline,
                           std::size_t max_steps,
                           std::vector<Grid> history)
    {
        Runner runner(street_config, std::move(pipeline), max_steps);
        for (const Grid &grid : history)
        {
            if (!grid.sameShape(runner.street.read()))
            {
                throw SimulationError(ErrorKind::ShapeOrCountMismatch, "history snapshot shape differs from street");
            }
            if (grid.occupiedCount() != static_cast<std::size_t>(street_config.car_count))
            {
                throw SimulationError(ErrorKind::ShapeOrCountMismatch,
                                      "history snapshot holds " + std::to_string(grid.occupiedCount()) +
                                          " cars, expected " + std::to_string(street_config.car_count));
            }
        }
        runner.history = std::move(history);
        runner.state = RunState::Completed;
        return runner;
    }

    const char *toString(Runner::RunState state)
    {
        switch (state)
        {
        case Runner::RunState::Uninitialized:
            return "uninitialized";
        case Runner::RunState::Running:
            return "running";
        case Runner::RunState::Completed:
            return "completed";
        }
        return "uninitialized";
    }

} // namespace trafficjam
