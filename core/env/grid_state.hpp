#pragma once

#include "env/state.hpp"
#include "env/grid_world.hpp"
#include <memory>
#include <string>

namespace uavrl {

/// UAV position and elapsed flight time, (col, row, step).
class GridState : public State {
public:
    GridState(std::shared_ptr<const GridWorld> world, int col, int row, int step);

    int col() const { return col_; }
    int row() const { return row_; }
    int step() const { return step_; }

    const std::vector<int>& validActions() const override;

    /// "(col,row,step)"
    std::string key() const override { return makeKey(col_, row_, step_); }

    static std::string makeKey(int col, int row, int step);

private:
    std::shared_ptr<const GridWorld> world_;
    int col_;
    int row_;
    int step_;
};

} // namespace uavrl
