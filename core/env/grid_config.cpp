#include "env/grid_config.hpp"
#include <stdexcept>
#include <string>

namespace uavrl {

std::vector<CellPos> obstacleBlock(int col_first, int col_last,
                                   int row_first, int row_last) {
    std::vector<CellPos> cells;
    for (int col = col_first; col <= col_last; col++) {
        for (int row = row_first; row <= row_last; row++) {
            cells.push_back({col, row});
        }
    }
    return cells;
}

bool GridConfig::isObstacle(int col, int row) const {
    for (const auto& o : obstacles) {
        if (o.col == col && o.row == row) return true;
    }
    return false;
}

static std::string cellName(const CellPos& p) {
    return "(" + std::to_string(p.col) + "," + std::to_string(p.row) + ")";
}

void GridConfig::validate() const {
    if (cols <= 0 || rows <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    if (flight_time <= 0) {
        throw std::invalid_argument("Flight time must be positive");
    }
    if (receivers.empty()) {
        throw std::invalid_argument("At least one receiver is required");
    }
    for (const auto& o : obstacles) {
        if (!inBounds(o.col, o.row)) {
            throw std::invalid_argument("Obstacle outside the grid: " + cellName(o));
        }
    }
    if (!inBounds(start.col, start.row)) {
        throw std::invalid_argument("Start cell outside the grid: " + cellName(start));
    }
    if (!inBounds(end.col, end.row)) {
        throw std::invalid_argument("Return cell outside the grid: " + cellName(end));
    }
    if (isObstacle(start.col, start.row) || isObstacle(end.col, end.row)) {
        throw std::invalid_argument("Start and return cells must not be obstacles");
    }
    if (channel.map_width_px < cols || channel.map_height_px < rows) {
        throw std::invalid_argument("Map must have at least one pixel per cell");
    }
    if (channel.meter_per_pixel <= 0.0 || channel.altitude_px <= 0.0) {
        throw std::invalid_argument("Invalid channel geometry");
    }
}

} // namespace uavrl
