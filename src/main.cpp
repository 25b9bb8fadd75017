#include <algorithm>
#include <iostream>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <numeric>
#include <sstream>
#include <string>
#include "Runner.hpp"
#include "RunnerCodec.hpp"
#include "SimulationConfigJson.hpp"
#include "SimulationError.hpp"
#include "db/Database.hpp"

namespace
{
    std::string timestampForFileName()
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream out;
        out << std::put_time(&local, "%Y%m%d_%H%M%S");
        return out.str();
    }

    bool readTextFile(const std::string &path, std::string &content)
    {
        std::ifstream in(path);
        if (!in.good())
        {
            return false;
        }
        content.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return true;
    }

    void printParameters(const trafficjam::Runner &runner)
    {
        const auto &street = runner.getStreetConfig();
        std::cout << "Street: " << street.lanes << " lane(s) x " << street.length << " cells, "
                  << street.car_count << " cars, v_max " << street.v_max << std::endl;
        std::cout << "Rules:" << std::endl;
        for (const auto &rule : runner.describeRules())
        {
            std::cout << "  - " << rule.kind;
            for (const auto &param : rule.params)
            {
                std::cout << " " << param.first << "=" << param.second;
            }
            std::cout << std::endl;
        }
        std::cout << "Random seed: " << street.seed << ", timesteps: " << runner.getMaxSteps() << std::endl;
    }

    void printMetrics(const trafficjam::Runner &runner)
    {
        const auto speeds = runner.metricAverageRelativeSpeed();
        const auto throughput = runner.metricCarThroughput();
        if (speeds.empty())
        {
            return;
        }

        const double mean_speed = std::accumulate(speeds.begin(), speeds.end(), 0.0) / speeds.size();
        const double mean_throughput =
            static_cast<double>(std::accumulate(throughput.begin(), throughput.end(), std::size_t{0})) / throughput.size();
        std::cout << "Snapshots recorded: " << runner.getHistory().size() << std::endl;
        std::cout << "Average relative speed: " << std::fixed << std::setprecision(3) << mean_speed
                  << " (final " << speeds.back() << ")" << std::endl;
        std::cout << "Average throughput: " << mean_throughput << " cars (final " << throughput.back() << ")"
                  << std::endl;
    }
}

int main(int argc, char **argv)
{
    std::cout << "=== Traffic Jam Cellular Automaton ===" << std::endl;
    std::cout << std::endl;

    trafficjam::db::Database database("trafficjam.db");
    std::string db_error;
    const bool db_ready = database.initialize(&db_error);
    if (!db_ready)
    {
        std::cerr << "Warning: failed to initialize run database: " << db_error << std::endl;
    }

    trafficjam::SimulationConfig config = trafficjam::makeDefaultSimulationConfig();
    if (argc > 1)
    {
        std::string text;
        if (!readTextFile(argv[1], text))
        {
            std::cerr << "Failed to read config file " << argv[1] << std::endl;
            return 1;
        }
        trafficjam::ConfigParseResult parsed = trafficjam::simulationConfigFromJson(text);
        if (!parsed.ok)
        {
            std::cerr << "Invalid config: " << trafficjam::validationErrorsToJson(parsed.errors) << std::endl;
            return 1;
        }
        config = parsed.config;
        if (db_ready && !database.saveActiveSimulationConfigJson(trafficjam::simulationConfigToJson(config), &db_error))
        {
            std::cerr << "Warning: failed to store config in database: " << db_error << std::endl;
        }
    }
    else if (db_ready)
    {
        if (auto stored = database.loadActiveSimulationConfigJson(&db_error); stored.has_value())
        {
            trafficjam::ConfigParseResult parsed = trafficjam::simulationConfigFromJson(*stored);
            if (parsed.ok)
            {
                config = parsed.config;
            }
            else
            {
                std::cerr << "Warning: stored config is invalid, using defaults" << std::endl;
            }
        }
        else if (!db_error.empty())
        {
            std::cerr << "Warning: failed to load config from database: " << db_error << std::endl;
        }
    }

    try
    {
        trafficjam::Runner runner(config.street, trafficjam::makeRulePipeline(config.rules), config.max_steps);
        printParameters(runner);
        std::cout << std::endl;

        std::cout << "Starting simulation" << std::endl;
        const std::size_t report_every = std::max<std::size_t>(1, config.max_steps / 10);
        runner.run([report_every](std::size_t step, std::size_t total)
                   {
            if (step % report_every == 0 || step == total)
            {
                std::cout << "  step " << step << "/" << total << std::endl;
            } });
        std::cout << "Ended simulation after " << config.max_steps << " steps" << std::endl;
        std::cout << std::endl;

        printMetrics(runner);

        const std::vector<uint8_t> artifact = runner.serialize();
        const std::string file_name = "traffic_jam_simulation_" + timestampForFileName() + ".bin";
        std::string io_error;
        if (!trafficjam::writeArtifactFile(file_name, artifact, &io_error))
        {
            std::cerr << "Failed to export simulation: " << io_error << std::endl;
            return 1;
        }
        std::cout << "Exported " << artifact.size() << " bytes to " << file_name << std::endl;

        if (db_ready)
        {
            if (auto run_id = database.saveRunArtifact(file_name, artifact, &db_error); run_id.has_value())
            {
                std::cout << "Stored run #" << *run_id << " in trafficjam.db" << std::endl;
            }
            else
            {
                std::cerr << "Warning: failed to store run in database: " << db_error << std::endl;
            }
        }
    }
    catch (const trafficjam::SimulationError &e)
    {
        std::cerr << "Simulation failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
