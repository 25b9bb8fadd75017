#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace trafficjam
{
    using CellValue = int16_t;

    static constexpr CellValue EMPTY_CELL = -1;

    // Lane-major matrix of cell values. Lane 0 is the preferred (rightmost) lane,
    // the cell axis wraps at length.
    class Grid
    {
    public:
        Grid() = default;
        Grid(std::size_t lanes, std::size_t length, CellValue fill = EMPTY_CELL)
            : lane_count(lanes), lane_length(length), cells(lanes * length, fill)
        {
        }

        std::size_t lanes() const { return lane_count; }
        std::size_t length() const { return lane_length; }
        std::size_t size() const { return cells.size(); }

        CellValue at(std::size_t lane, std::size_t cell) const { return cells[lane * lane_length + cell]; }
        void set(std::size_t lane, std::size_t cell, CellValue value) { cells[lane * lane_length + cell] = value; }

        bool isOccupied(std::size_t lane, std::size_t cell) const { return at(lane, cell) >= 0; }

        // Index of the cell `offset` positions ahead, wrapping at the lane end.
        std::size_t ahead(std::size_t cell, std::size_t offset) const { return (cell + offset) % lane_length; }

        bool sameShape(const Grid &other) const
        {
            return lane_count == other.lane_count && lane_length == other.lane_length;
        }

        std::size_t occupiedCount() const
        {
            std::size_t count = 0;
            for (CellValue value : cells)
            {
                if (value >= 0)
                    ++count;
            }
            return count;
        }

        const std::vector<CellValue> &raw() const { return cells; }

        bool operator==(const Grid &other) const
        {
            return sameShape(other) && cells == other.cells;
        }
        bool operator!=(const Grid &other) const { return !(*this == other); }

    private:
        std::size_t lane_count = 0;
        std::size_t lane_length = 0;
        std::vector<CellValue> cells;
    };

} // namespace trafficjam
