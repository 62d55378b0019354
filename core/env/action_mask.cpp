#include "env/action_mask.hpp"
#include <algorithm>
#include <array>

namespace uavrl {

std::string actionName(int action) {
    switch (action) {
        case UP: return "UP";
        case DOWN: return "DOWN";
        case LEFT: return "LEFT";
        case RIGHT: return "RIGHT";
        default: return "UNKNOWN";
    }
}

CellPos actionDelta(int action) {
    switch (action) {
        case UP: return {0, -1};
        case DOWN: return {0, 1};
        case LEFT: return {-1, 0};
        case RIGHT: return {1, 0};
        default: return {0, 0};
    }
}

ActionMask ActionMask::build(const GridConfig& config) {
    const size_t cells = static_cast<size_t>(config.cols) * static_cast<size_t>(config.rows);
    std::vector<std::array<bool, NUM_ACTIONS>> allowed(
        cells, std::array<bool, NUM_ACTIONS>{true, true, true, true});

    auto at = [&](int col, int row) -> std::array<bool, NUM_ACTIONS>& {
        return allowed[static_cast<size_t>(col) * static_cast<size_t>(config.rows) +
                       static_cast<size_t>(row)];
    };

    for (int col = 0; col < config.cols; col++) {
        at(col, 0)[UP] = false;
        at(col, config.rows - 1)[DOWN] = false;
    }
    for (int row = 0; row < config.rows; row++) {
        at(0, row)[LEFT] = false;
        at(config.cols - 1, row)[RIGHT] = false;
    }

    // Block every move that would enter an obstacle from its neighbours
    for (const auto& o : config.obstacles) {
        if (config.inBounds(o.col - 1, o.row)) at(o.col - 1, o.row)[RIGHT] = false;
        if (config.inBounds(o.col + 1, o.row)) at(o.col + 1, o.row)[LEFT] = false;
        if (config.inBounds(o.col, o.row - 1)) at(o.col, o.row - 1)[DOWN] = false;
        if (config.inBounds(o.col, o.row + 1)) at(o.col, o.row + 1)[UP] = false;
    }

    ActionMask mask;
    mask.cols_ = config.cols;
    mask.rows_ = config.rows;
    mask.cells_.resize(cells);
    for (size_t i = 0; i < cells; i++) {
        for (int a = 0; a < NUM_ACTIONS; a++) {
            if (allowed[i][a]) mask.cells_[i].push_back(a);
        }
    }
    return mask;
}

bool ActionMask::allows(int col, int row, int action) const {
    const auto& v = valid(col, row);
    return std::find(v.begin(), v.end(), action) != v.end();
}

} // namespace uavrl
