#pragma once

#include "env/grid_config.hpp"
#include <string>
#include <vector>

namespace uavrl {

/// UAV moves. UP decreases the row, LEFT decreases the column.
enum Action : int {
    UP = 0,
    DOWN = 1,
    LEFT = 2,
    RIGHT = 3
};

constexpr int NUM_ACTIONS = 4;

std::string actionName(int action);

/// Cell displacement (dcol, drow) of a move; {0,0} for unknown actions.
CellPos actionDelta(int action);

// ─── Action Mask ───────────────────────────────────────────────
// Valid moves per cell, precomputed. A move is excluded when it would
// leave the grid or step into an obstacle cell.

class ActionMask {
public:
    static ActionMask build(const GridConfig& config);

    const std::vector<int>& valid(int col, int row) const {
        return cells_[static_cast<size_t>(col) * static_cast<size_t>(rows_) +
                      static_cast<size_t>(row)];
    }

    bool allows(int col, int row, int action) const;

private:
    int cols_ = 0;
    int rows_ = 0;
    std::vector<std::vector<int>> cells_;
};

} // namespace uavrl
