#include <catch2/catch_all.hpp>
#include "db/Database.hpp"
#include "Runner.hpp"
#include "SimulationConfigJson.hpp"

#include <filesystem>

using namespace trafficjam;

namespace
{
    std::string freshDatabasePath(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / ("trafficjam_" + name + ".db");
        std::filesystem::remove(path);
        return path.string();
    }
}

TEST_CASE("Database stores the active simulation config", "[db]")
{
    const std::string path = freshDatabasePath("config");
    db::Database database(path);
    std::string error;
    REQUIRE(database.initialize(&error));

    REQUIRE_FALSE(database.loadActiveSimulationConfigJson(&error).has_value());

    SimulationConfig config = makeDefaultSimulationConfig();
    config.street.lanes = 3;
    REQUIRE(database.saveActiveSimulationConfigJson(simulationConfigToJson(config), &error));
    config.max_steps = 40;
    REQUIRE(database.saveActiveSimulationConfigJson(simulationConfigToJson(config), &error));

    auto stored = database.loadActiveSimulationConfigJson(&error);
    REQUIRE(stored.has_value());
    ConfigParseResult parsed = simulationConfigFromJson(*stored);
    REQUIRE(parsed.ok);
    REQUIRE(parsed.config.street.lanes == 3);
    REQUIRE(parsed.config.max_steps == 40);

    std::filesystem::remove(path);
}

TEST_CASE("Database stores and lists run artifacts", "[db]")
{
    const std::string path = freshDatabasePath("runs");
    db::Database database(path);
    std::string error;
    REQUIRE(database.initialize(&error));

    Runner runner(StreetConfig{2, 50, 10, 5, 7}, makeRulePipeline(canonicalRuleDescriptors(5, 0.2, 7, true)), 8);
    runner.run();
    const auto artifact = runner.serialize();

    auto first = database.saveRunArtifact("first", artifact, &error);
    auto second = database.saveRunArtifact("second", artifact, &error);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*second > *first);

    auto loaded = database.loadRunArtifact(*first, &error);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == artifact);
    REQUIRE(Runner::deserialize(*loaded).getHistory() == runner.getHistory());

    const auto runs = database.listRuns(&error);
    REQUIRE(runs.size() == 2);
    REQUIRE(runs[0].label == "first");
    REQUIRE(runs[1].label == "second");
    REQUIRE(runs[0].artifact_bytes == artifact.size());
    REQUIRE_FALSE(runs[0].created_at.empty());

    error.clear();
    REQUIRE_FALSE(database.loadRunArtifact(*second + 100, &error).has_value());
    REQUIRE_FALSE(error.empty());

    std::filesystem::remove(path);
}
