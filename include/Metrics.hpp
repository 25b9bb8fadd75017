#pragma once

#include "Grid.hpp"

#include <cstddef>
#include <vector>

namespace trafficjam
{
    // The measured stretch is the last 1/10 of the street.
    static constexpr std::size_t THROUGHPUT_STRETCH_DIVISOR = 10;

    // Mean velocity of all cars in each snapshot divided by v_max.
    std::vector<double> averageRelativeSpeed(const std::vector<Grid> &history, int v_max);

    // Cars inside the measured stretch, summed over lanes, per snapshot.
    std::vector<std::size_t> carThroughput(const std::vector<Grid> &history);

    std::size_t throughputStretchCells(std::size_t length);

} // namespace trafficjam
