#include "Metrics.hpp"

namespace trafficjam
{
    std::vector<double> averageRelativeSpeed(const std::vector<Grid> &history, int v_max)
    {
        std::vector<double> speeds;
        speeds.reserve(history.size());
        for (const Grid &grid : history)
        {
            long long velocity_sum = 0;
            std::size_t cars = 0;
            for (CellValue value : grid.raw())
            {
                if (value >= 0)
                {
                    velocity_sum += value;
                    ++cars;
                }
            }
            if (cars == 0 || v_max <= 0)
            {
                speeds.push_back(0.0);
                continue;
            }
            speeds.push_back(static_cast<double>(velocity_sum) / static_cast<double>(cars) / v_max);
        }
        return speeds;
    }

    std::size_t throughputStretchCells(std::size_t length)
    {
        return length / THROUGHPUT_STRETCH_DIVISOR;
    }

    std::vector<std::size_t> carThroughput(const std::vector<Grid> &history)
    {
        std::vector<std::size_t> counts;
        counts.reserve(history.size());
        for (const Grid &grid : history)
        {
            const std::size_t stretch = throughputStretchCells(grid.length());
            std::size_t count = 0;
            for (std::size_t lane = 0; lane < grid.lanes(); ++lane)
            {
                for (std::size_t cell = grid.length() - stretch; cell < grid.length(); ++cell)
                {
                    if (grid.isOccupied(lane, cell))
                        ++count;
                }
            }
            counts.push_back(count);
        }
        return counts;
    }

} // namespace trafficjam
