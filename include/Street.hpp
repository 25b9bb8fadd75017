#pragma once

#include "Grid.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace trafficjam
{
    // Cells are stored as one byte (value + 1) in run artifacts.
    static constexpr int MAX_STORABLE_VELOCITY = 254;

    struct StreetConfig
    {
        int lanes = 1;
        int length = 250;
        int car_count = 20;
        int v_max = 8;
        uint32_t seed = 42;

        bool operator==(const StreetConfig &other) const
        {
            return lanes == other.lanes && length == other.length && car_count == other.car_count &&
                   v_max == other.v_max && seed == other.seed;
        }
        bool operator!=(const StreetConfig &other) const { return !(*this == other); }
    };

    std::vector<std::string> validateStreetConfig(const StreetConfig &config);

    class Street
    {
    public:
        // Throws SimulationError(ConfigurationError) when the config is invalid.
        explicit Street(const StreetConfig &config);

        const StreetConfig &getConfig() const { return config; }

        // The returned grid is the live state; copy it before mutating.
        const Grid &read() const { return state; }

        // Accepts a grid of identical shape carrying exactly car_count cars,
        // otherwise throws SimulationError(ShapeOrCountMismatch).
        void replace(Grid new_state);

        // Rebuilds the initial grid from the configured seed.
        static Grid initialize(const StreetConfig &config);

    private:
        StreetConfig config;
        Grid state;
    };

} // namespace trafficjam
