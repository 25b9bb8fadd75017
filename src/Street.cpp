#include "Street.hpp"
#include "SimulationError.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace trafficjam
{
    namespace
    {
        std::string joinErrors(const std::vector<std::string> &errors)
        {
            std::string joined;
            for (const auto &error : errors)
            {
                if (!joined.empty())
                {
                    joined += "; ";
                }
                joined += error;
            }
            return joined;
        }
    }

    std::vector<std::string> validateStreetConfig(const StreetConfig &config)
    {
        std::vector<std::string> errors;
        if (config.lanes <= 0)
        {
            errors.push_back("lanes must be positive");
        }
        if (config.length <= 0)
        {
            errors.push_back("length must be positive");
        }
        if (config.car_count <= 0)
        {
            errors.push_back("car_count must be positive");
        }
        if (config.v_max <= 0)
        {
            errors.push_back("v_max must be positive");
        }
        else if (config.v_max > MAX_STORABLE_VELOCITY)
        {
            errors.push_back("v_max must not exceed " + std::to_string(MAX_STORABLE_VELOCITY));
        }
        if (config.lanes > 0 && config.length > 0 && config.car_count > 0)
        {
            const long long capacity = static_cast<long long>(config.lanes) * config.length;
            if (config.car_count > capacity)
            {
                errors.push_back("car_count " + std::to_string(config.car_count) +
                                 " exceeds street capacity " + std::to_string(capacity));
            }
        }
        return errors;
    }

    Street::Street(const StreetConfig &config)
        : config(config), state(initialize(config))
    {
    }

    Grid Street::initialize(const StreetConfig &config)
    {
        const auto errors = validateStreetConfig(config);
        if (!errors.empty())
        {
            throw SimulationError(ErrorKind::ConfigurationError, joinErrors(errors));
        }

        std::mt19937 rng(config.seed);
        std::uniform_int_distribution<int> velocity_dist(0, config.v_max - 1);
        std::vector<CellValue> velocities(static_cast<std::size_t>(config.car_count));
        for (auto &velocity : velocities)
        {
            velocity = static_cast<CellValue>(velocity_dist(rng));
        }

        Grid grid(static_cast<std::size_t>(config.lanes), static_cast<std::size_t>(config.length));
        std::vector<std::size_t> indices(grid.size());
        std::iota(indices.begin(), indices.end(), 0);
        std::shuffle(indices.begin(), indices.end(), rng);

        for (std::size_t i = 0; i < velocities.size(); ++i)
        {
            const std::size_t flat = indices[i];
            grid.set(flat / grid.length(), flat % grid.length(), velocities[i]);
        }
        return grid;
    }

    void Street::replace(Grid new_state)
    {
        if (!new_state.sameShape(state))
        {
            throw SimulationError(ErrorKind::ShapeOrCountMismatch,
                                  "expected " + std::to_string(state.lanes()) + "x" + std::to_string(state.length()) +
                                      " grid, got " + std::to_string(new_state.lanes()) + "x" +
                                      std::to_string(new_state.length()));
        }

        const std::size_t occupied = new_state.occupiedCount();
        if (occupied != static_cast<std::size_t>(config.car_count))
        {
            throw SimulationError(ErrorKind::ShapeOrCountMismatch,
                                  "number of cars is inconsistent: expected " + std::to_string(config.car_count) +
                                      ", got " + std::to_string(occupied));
        }

        state = std::move(new_state);
    }

} // namespace trafficjam
