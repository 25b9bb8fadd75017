#include <catch2/catch_all.hpp>
#include "Rules.hpp"
#include "RulePipeline.hpp"
#include "SimulationError.hpp"
#include "TestHelpers.hpp"

using namespace trafficjam;
using trafficjam::testing::gridFromRows;

TEST_CASE("Accelerate leaves cars at v_max untouched", "[rules][accelerate]")
{
    Accelerate accelerate(5);
    Grid saturated = gridFromRows({{5, -1, -1, 5, -1}, {-1, 5, -1, -1, -1}});
    REQUIRE(accelerate.apply(saturated) == saturated);
}

TEST_CASE("Accelerate adds one cell per step below v_max", "[rules][accelerate]")
{
    Accelerate accelerate(3);
    Grid grid = gridFromRows({{0, -1, 2, 3, -1, 1}});
    REQUIRE(accelerate.apply(grid) == gridFromRows({{1, -1, 3, 3, -1, 2}}));
}

TEST_CASE("Dawdling with probability zero or one", "[rules][dawdling]")
{
    Grid grid = gridFromRows({{0, -1, 2, 5, -1, 1}});

    Dawdling never(0.0, 11);
    REQUIRE(never.apply(grid) == grid);

    Dawdling always(1.0, 11);
    REQUIRE(always.apply(grid) == gridFromRows({{0, -1, 1, 4, -1, 0}}));
}

TEST_CASE("Dawdling keeps its random stream across steps", "[rules][dawdling]")
{
    Grid grid(1, 200, 5);
    Dawdling first(0.5, 99);
    Dawdling second(0.5, 99);

    Grid a1 = first.apply(grid);
    Grid a2 = first.apply(grid);
    Grid b1 = second.apply(grid);
    Grid b2 = second.apply(grid);

    REQUIRE(a1 == b1);
    REQUIRE(a2 == b2);
    REQUIRE(a1 != a2);
    REQUIRE(a1.occupiedCount() == 200);
}

TEST_CASE("AvoidCollision stops one cell short of the car ahead", "[rules][collision]")
{
    AvoidCollision avoid;
    Grid grid = gridFromRows({{5, -1, -1, 2, -1, -1, -1, -1, -1, -1}});
    Grid result = avoid.apply(grid);
    REQUIRE(result.at(0, 0) == 2);
    REQUIRE(result.at(0, 3) == 2);
}

TEST_CASE("AvoidCollision looks ahead across the lane end", "[rules][collision]")
{
    AvoidCollision avoid;
    Grid grid = gridFromRows({{-1, 0, -1, -1, -1, -1, -1, -1, 4, -1}});
    Grid result = avoid.apply(grid);
    REQUIRE(result.at(0, 8) == 2);
    REQUIRE(result.at(0, 1) == 0);
}

TEST_CASE("AvoidCollision keeps a lone car from lapping itself", "[rules][collision]")
{
    AvoidCollision avoid;
    Grid result = avoid.apply(gridFromRows({{7, -1, -1, -1, -1}}));
    REQUIRE(result.at(0, 0) == 4);
}

TEST_CASE("AvoidCollision ignores other lanes", "[rules][collision]")
{
    AvoidCollision avoid;
    Grid grid = gridFromRows({{3, -1, -1, -1, -1, -1}, {-1, 0, -1, -1, -1, -1}});
    REQUIRE(avoid.apply(grid) == grid);
}

TEST_CASE("MoveForward wraps around the lane end", "[rules][move]")
{
    MoveForward move;
    Grid grid = gridFromRows({{-1, -1, -1, -1, -1, -1, -1, -1, -1, 3}});
    Grid result = move.apply(grid);
    REQUIRE(result.at(0, 2) == 3);
    REQUIRE(result.occupiedCount() == 1);
}

TEST_CASE("MoveForward keeps cars in their lane", "[rules][move]")
{
    MoveForward move;
    Grid grid = gridFromRows({{1, -1, -1, -1}, {0, 2, -1, -1}});
    REQUIRE(move.apply(grid) == gridFromRows({{-1, 1, -1, -1}, {0, -1, -1, 2}}));
}

TEST_CASE("BreakOrTakeOver overtakes into a clear left lane", "[rules][overtake]")
{
    BreakOrTakeOver rule;
    Grid grid = gridFromRows({{5, -1, -1, 0, -1, -1, -1, -1, -1, -1},
                              {-1, -1, -1, -1, -1, -1, -1, -1, -1, -1}});
    Grid result = rule.apply(grid);

    REQUIRE(result.at(0, 0) == EMPTY_CELL);
    REQUIRE(result.at(1, 0) == 5);
    REQUIRE(result.at(0, 3) == 0);
    REQUIRE(result.occupiedCount() == 2);
}

TEST_CASE("BreakOrTakeOver brakes when the left lane window is occupied", "[rules][overtake]")
{
    BreakOrTakeOver rule;
    Grid grid = gridFromRows({{5, -1, -1, 0, -1, -1, -1, -1, -1, -1},
                              {-1, -1, -1, -1, 0, -1, -1, -1, -1, -1}});
    Grid result = rule.apply(grid);

    REQUIRE(result.at(0, 0) == 2);
    REQUIRE(result.at(1, 4) == 0);
}

TEST_CASE("BreakOrTakeOver brakes in the last lane", "[rules][overtake]")
{
    BreakOrTakeOver rule;
    AvoidCollision avoid;
    Grid grid = gridFromRows({{4, -1, 1, -1, -1, -1, 3, -1}});
    REQUIRE(rule.apply(grid) == avoid.apply(grid));
}

TEST_CASE("BreakOrTakeOver changes at most one lane per step", "[rules][overtake]")
{
    BreakOrTakeOver rule;
    Grid grid = gridFromRows({{4, -1, 0, -1, -1, -1, -1, -1},
                              {-1, -1, -1, -1, -1, -1, -1, -1},
                              {-1, -1, -1, -1, -1, -1, -1, -1}});
    Grid result = rule.apply(grid);

    REQUIRE(result.at(1, 0) == 4);
    REQUIRE(result.at(2, 0) == EMPTY_CELL);
    REQUIRE(result.occupiedCount() == 2);
}

TEST_CASE("BreakOrTakeOver brakes a car that overtook behind another overtaker", "[rules][overtake]")
{
    BreakOrTakeOver rule;
    MoveForward move;
    // Both cars in lane 0 are blocked and both find lane 1 clear; the rear car
    // must not run into the front car once both have changed lane.
    Grid grid = gridFromRows({{5, -1, 3, -1, 0, -1, -1, -1, -1, -1, -1, -1},
                              {-1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1}});
    Grid result = rule.apply(grid);

    REQUIRE(result.at(1, 0) == 1);
    REQUIRE(result.at(1, 2) == 3);
    REQUIRE(move.apply(result).occupiedCount() == 3);
}

TEST_CASE("MergeBack pulls cars into the free lane below", "[rules][merge]")
{
    MergeBack merge;
    Grid grid = gridFromRows({{-1, 2, -1, -1},
                              {3, 1, -1, -1}});
    REQUIRE(merge.apply(grid) == gridFromRows({{3, 2, -1, -1}, {-1, 1, -1, -1}}));
}

TEST_CASE("MergeBack swaps each cell at most once per step", "[rules][merge]")
{
    MergeBack merge;
    Grid grid = gridFromRows({{-1, -1},
                              {1, -1},
                              {2, -1}});
    REQUIRE(merge.apply(grid) == gridFromRows({{1, -1}, {-1, -1}, {2, -1}}));
}

TEST_CASE("DummyShuffle rotates every lane by one cell", "[rules][dummy]")
{
    DummyShuffle shuffle;
    Grid grid = gridFromRows({{1, -1, -1, 4}, {-1, 2, -1, -1}});
    REQUIRE(shuffle.apply(grid) == gridFromRows({{4, 1, -1, -1}, {-1, -1, 2, -1}}));
}

TEST_CASE("Rules rebuild from their own descriptors", "[rules][descriptor]")
{
    std::vector<std::unique_ptr<IRule>> rules;
    rules.push_back(std::make_unique<Accelerate>(7));
    rules.push_back(std::make_unique<Dawdling>(0.25, 17));
    rules.push_back(std::make_unique<AvoidCollision>());
    rules.push_back(std::make_unique<BreakOrTakeOver>());
    rules.push_back(std::make_unique<MoveForward>());
    rules.push_back(std::make_unique<MergeBack>());
    rules.push_back(std::make_unique<DummyShuffle>());

    for (const auto &rule : rules)
    {
        const RuleDescriptor descriptor = rule->describe();
        REQUIRE(makeRule(descriptor)->describe() == descriptor);
    }
}

TEST_CASE("makeRule rejects unknown kinds and bad parameters", "[rules][descriptor][errors]")
{
    auto kindOf = [](const RuleDescriptor &descriptor)
    {
        try
        {
            makeRule(descriptor);
        }
        catch (const SimulationError &e)
        {
            return e.kind();
        }
        return ErrorKind::InvalidRunnerState;
    };

    REQUIRE(kindOf({"teleport", {}}) == ErrorKind::ConfigurationError);
    REQUIRE(kindOf({rule_kind::ACCELERATE, {}}) == ErrorKind::ConfigurationError);
    REQUIRE(kindOf({rule_kind::ACCELERATE, {{"v_max", 0.0}}}) == ErrorKind::ConfigurationError);
    REQUIRE(kindOf({rule_kind::ACCELERATE, {{"v_max", 2.5}}}) == ErrorKind::ConfigurationError);
    REQUIRE(kindOf({rule_kind::DAWDLING, {{"seed", 1.0}}}) == ErrorKind::ConfigurationError);
    REQUIRE(kindOf({rule_kind::DAWDLING, {{"probability", 1.5}}}) == ErrorKind::ConfigurationError);
    REQUIRE(kindOf({rule_kind::DAWDLING, {{"probability", 0.5}, {"seed", -1.0}}}) == ErrorKind::ConfigurationError);
    REQUIRE(kindOf({rule_kind::DAWDLING, {{"probability", 0.5}}}) == ErrorKind::ConfigurationError);
}

TEST_CASE("RulePipeline refuses a null rule", "[rules][pipeline][errors]")
{
    RulePipeline pipeline;
    pipeline.add(std::make_unique<Accelerate>(5));

    REQUIRE_THROWS_AS(pipeline.add(nullptr), SimulationError);
    REQUIRE(pipeline.size() == 1);
    REQUIRE(pipeline.describe().size() == 1);
}

TEST_CASE("RulePipeline applies rules in configured order", "[rules][pipeline]")
{
    Grid grid = gridFromRows({{1, -1, -1, -1, -1, -1}});

    RulePipeline accelerate_then_move;
    accelerate_then_move.add(std::make_unique<Accelerate>(5));
    accelerate_then_move.add(std::make_unique<MoveForward>());

    RulePipeline move_then_accelerate;
    move_then_accelerate.add(std::make_unique<MoveForward>());
    move_then_accelerate.add(std::make_unique<Accelerate>(5));

    REQUIRE(accelerate_then_move.apply(grid) == gridFromRows({{-1, -1, 2, -1, -1, -1}}));
    REQUIRE(move_then_accelerate.apply(grid) == gridFromRows({{-1, 2, -1, -1, -1, -1}}));
}

TEST_CASE("Canonical pipeline follows the physical rule order", "[rules][pipeline]")
{
    auto descriptors = canonicalRuleDescriptors(5, 0.1, 3, true);
    REQUIRE(descriptors.size() == 5);
    REQUIRE(descriptors[0].kind == rule_kind::ACCELERATE);
    REQUIRE(descriptors[1].kind == rule_kind::BREAK_OR_TAKE_OVER);
    REQUIRE(descriptors[2].kind == rule_kind::DAWDLING);
    REQUIRE(descriptors[3].kind == rule_kind::MOVE_FORWARD);
    REQUIRE(descriptors[4].kind == rule_kind::MERGE_BACK);

    auto single_lane = canonicalRuleDescriptors(5, 0.1, 3, false);
    REQUIRE(single_lane.size() == 4);
    REQUIRE(single_lane[1].kind == rule_kind::AVOID_COLLISION);

    RulePipeline pipeline = makeRulePipeline(descriptors);
    REQUIRE(pipeline.describe() == descriptors);
}
