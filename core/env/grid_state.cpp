#include "env/grid_state.hpp"

namespace uavrl {

GridState::GridState(std::shared_ptr<const GridWorld> world, int col, int row, int step)
    : world_(std::move(world)), col_(col), row_(row), step_(step) {}

const std::vector<int>& GridState::validActions() const {
    return world_->actions().valid(col_, row_);
}

std::string GridState::makeKey(int col, int row, int step) {
    return "(" + std::to_string(col) + "," + std::to_string(row) + "," +
           std::to_string(step) + ")";
}

} // namespace uavrl
