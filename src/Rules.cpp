#include "Rules.hpp"
#include "SimulationError.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace trafficjam
{
    namespace
    {
        // Distance (1..velocity) to the next car ahead in the lane, or 0 when
        // the forward window is free.
        std::size_t distanceToNextCar(const Grid &grid, std::size_t lane, std::size_t cell, std::size_t velocity)
        {
            for (std::size_t d = 1; d <= velocity; ++d)
            {
                if (grid.isOccupied(lane, grid.ahead(cell, d)))
                {
                    return d;
                }
            }
            return 0;
        }

        bool forwardWindowClear(const Grid &grid, std::size_t lane, std::size_t cell, std::size_t velocity)
        {
            const std::size_t window = std::min(velocity, grid.length() - 1);
            for (std::size_t d = 0; d <= window; ++d)
            {
                if (grid.isOccupied(lane, grid.ahead(cell, d)))
                {
                    return false;
                }
            }
            return true;
        }

        double requireParam(const RuleDescriptor &descriptor, const std::string &name)
        {
            auto it = descriptor.params.find(name);
            if (it == descriptor.params.end())
            {
                throw SimulationError(ErrorKind::ConfigurationError,
                                      "rule " + descriptor.kind + " requires parameter " + name);
            }
            return it->second;
        }

        bool isWholeNumber(double value)
        {
            return std::isfinite(value) && std::floor(value) == value;
        }
    }

    Accelerate::Accelerate(int v_max)
        : v_max(v_max)
    {
        if (v_max < 1)
        {
            throw SimulationError(ErrorKind::ConfigurationError, "accelerate v_max must be positive");
        }
    }

    Grid Accelerate::apply(Grid grid)
    {
        for (std::size_t lane = 0; lane < grid.lanes(); ++lane)
        {
            for (std::size_t cell = 0; cell < grid.length(); ++cell)
            {
                const CellValue v = grid.at(lane, cell);
                if (v >= 0 && v < v_max)
                {
                    grid.set(lane, cell, static_cast<CellValue>(v + 1));
                }
            }
        }
        return grid;
    }

    RuleDescriptor Accelerate::describe() const
    {
        return {rule_kind::ACCELERATE, {{"v_max", static_cast<double>(v_max)}}};
    }

    Dawdling::Dawdling(double probability, uint32_t seed)
        : probability(probability), seed(seed), rng(seed)
    {
        if (!(probability >= 0.0 && probability <= 1.0))
        {
            throw SimulationError(ErrorKind::ConfigurationError, "dawdling probability must be within [0, 1]");
        }
        dawdle = std::bernoulli_distribution(probability);
    }

    Grid Dawdling::apply(Grid grid)
    {
        for (std::size_t lane = 0; lane < grid.lanes(); ++lane)
        {
            for (std::size_t cell = 0; cell < grid.length(); ++cell)
            {
                const CellValue v = grid.at(lane, cell);
                if (v > 0 && dawdle(rng))
                {
                    grid.set(lane, cell, static_cast<CellValue>(v - 1));
                }
            }
        }
        return grid;
    }

    RuleDescriptor Dawdling::describe() const
    {
        return {rule_kind::DAWDLING, {{"probability", probability}, {"seed", static_cast<double>(seed)}}};
    }

    Grid AvoidCollision::apply(Grid grid)
    {
        for (std::size_t lane = 0; lane < grid.lanes(); ++lane)
        {
            for (std::size_t cell = 0; cell < grid.length(); ++cell)
            {
                const CellValue v = grid.at(lane, cell);
                if (v <= 0)
                {
                    continue;
                }
                const std::size_t d = distanceToNextCar(grid, lane, cell, static_cast<std::size_t>(v));
                if (d > 0)
                {
                    grid.set(lane, cell, static_cast<CellValue>(d - 1));
                }
            }
        }
        return grid;
    }

    RuleDescriptor AvoidCollision::describe() const
    {
        return {rule_kind::AVOID_COLLISION, {}};
    }

    Grid BreakOrTakeOver::apply(Grid grid)
    {
        const std::size_t length = grid.length();
        // Cars that already changed lane during this step, by flat index. They
        // still brake in their new lane but may not overtake again.
        std::vector<bool> overtaken(grid.size(), false);

        for (std::size_t lane = 0; lane < grid.lanes(); ++lane)
        {
            for (std::size_t cell = 0; cell < length; ++cell)
            {
                const CellValue v = grid.at(lane, cell);
                if (v <= 0)
                {
                    continue;
                }

                const std::size_t velocity = static_cast<std::size_t>(v);
                const std::size_t d = distanceToNextCar(grid, lane, cell, velocity);
                if (d == 0)
                {
                    continue;
                }

                const std::size_t left = lane + 1;
                if (!overtaken[lane * length + cell] && left < grid.lanes() &&
                    forwardWindowClear(grid, left, cell, velocity))
                {
                    grid.set(left, cell, v);
                    grid.set(lane, cell, EMPTY_CELL);
                    overtaken[left * length + cell] = true;
                    continue;
                }

                grid.set(lane, cell, static_cast<CellValue>(d - 1));
            }
        }
        return grid;
    }

    RuleDescriptor BreakOrTakeOver::describe() const
    {
        return {rule_kind::BREAK_OR_TAKE_OVER, {}};
    }

    Grid MoveForward::apply(Grid grid)
    {
        Grid moved(grid.lanes(), grid.length());
        for (std::size_t lane = 0; lane < grid.lanes(); ++lane)
        {
            for (std::size_t cell = 0; cell < grid.length(); ++cell)
            {
                const CellValue v = grid.at(lane, cell);
                if (v >= 0)
                {
                    moved.set(lane, grid.ahead(cell, static_cast<std::size_t>(v)), v);
                }
            }
        }
        return moved;
    }

    RuleDescriptor MoveForward::describe() const
    {
        return {rule_kind::MOVE_FORWARD, {}};
    }

    Grid MergeBack::apply(Grid grid)
    {
        const std::size_t length = grid.length();
        std::vector<bool> swapped(grid.size(), false);

        for (std::size_t lane = 0; lane + 1 < grid.lanes(); ++lane)
        {
            for (std::size_t cell = 0; cell < length; ++cell)
            {
                const std::size_t target = lane * length + cell;
                const std::size_t source = (lane + 1) * length + cell;
                if (swapped[target] || swapped[source])
                {
                    continue;
                }
                if (grid.isOccupied(lane, cell) || !grid.isOccupied(lane + 1, cell))
                {
                    continue;
                }

                grid.set(lane, cell, grid.at(lane + 1, cell));
                grid.set(lane + 1, cell, EMPTY_CELL);
                swapped[target] = true;
                swapped[source] = true;
            }
        }
        return grid;
    }

    RuleDescriptor MergeBack::describe() const
    {
        return {rule_kind::MERGE_BACK, {}};
    }

    Grid DummyShuffle::apply(Grid grid)
    {
        Grid rotated(grid.lanes(), grid.length());
        for (std::size_t lane = 0; lane < grid.lanes(); ++lane)
        {
            for (std::size_t cell = 0; cell < grid.length(); ++cell)
            {
                rotated.set(lane, grid.ahead(cell, 1), grid.at(lane, cell));
            }
        }
        return rotated;
    }

    RuleDescriptor DummyShuffle::describe() const
    {
        return {rule_kind::DUMMY_SHUFFLE, {}};
    }

    std::unique_ptr<IRule> makeRule(const RuleDescriptor &descriptor)
    {
        const std::string &kind = descriptor.kind;
        if (kind == rule_kind::ACCELERATE)
        {
            const double v_max = requireParam(descriptor, "v_max");
            if (!isWholeNumber(v_max) || v_max < 1.0 || v_max > std::numeric_limits<CellValue>::max())
            {
                throw SimulationError(ErrorKind::ConfigurationError, "accelerate v_max must be a positive integer");
            }
            return std::make_unique<Accelerate>(static_cast<int>(v_max));
        }
        if (kind == rule_kind::DAWDLING)
        {
            const double probability = requireParam(descriptor, "probability");
            const double seed = requireParam(descriptor, "seed");
            if (!isWholeNumber(seed) || seed < 0.0 || seed > std::numeric_limits<uint32_t>::max())
            {
                throw SimulationError(ErrorKind::ConfigurationError, "dawdling seed must be a non-negative integer");
            }
            return std::make_unique<Dawdling>(probability, static_cast<uint32_t>(seed));
        }
        if (kind == rule_kind::AVOID_COLLISION)
            return std::make_unique<AvoidCollision>();
        if (kind == rule_kind::BREAK_OR_TAKE_OVER)
            return std::make_unique<BreakOrTakeOver>();
        if (kind == rule_kind::MOVE_FORWARD)
            return std::make_unique<MoveForward>();
        if (kind == rule_kind::MERGE_BACK)
            return std::make_unique<MergeBack>();
        if (kind == rule_kind::DUMMY_SHUFFLE)
            return std::make_unique<DummyShuffle>();

        throw SimulationError(ErrorKind::ConfigurationError, "unknown rule kind: " + kind);
    }

} // namespace trafficjam
