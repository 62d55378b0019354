#pragma once

#include "env/environment.hpp"
#include "env/grid_state.hpp"
#include "env/grid_world.hpp"
#include <memory>

namespace uavrl {

// ─── UAV Grid Environment ──────────────────────────────────────
// The UAV starts at the base cell and moves one cell per step. The
// reward of a step is the max-min fair rate at the cell reached.
//
// Episode end, checked in this order after every step:
//   1. at the return cell exactly when the flight time is used up:
//      terminated, reward unchanged;
//   2. at the return cell earlier: truncated,
//      reward -= reward * (flight_time - step);
//   3. flight time used up elsewhere: truncated, reward -= reward * 10.
//
// Moves that would leave the grid, and unknown action values, leave
// the UAV where it is; the step is still counted.

class UavGridEnv : public Environment {
public:
    static constexpr double OVERRUN_PENALTY_FACTOR = 10.0;

    explicit UavGridEnv(GridConfig config = {});
    explicit UavGridEnv(std::shared_ptr<const GridWorld> world);

    ResetResult reset() override;
    StepResult step(int action) override;

    const EnvInfo& info() const override { return *info_; }
    int elapsedSteps() const override { return step_; }
    size_t numActions() const override { return NUM_ACTIONS; }

    const GridWorld& world() const { return *world_; }
    std::shared_ptr<const GridWorld> sharedWorld() const { return world_; }

    CellPos position() const { return pos_; }

private:
    std::shared_ptr<const GridWorld> world_;
    std::shared_ptr<const EnvInfo> info_;
    CellPos pos_;
    int step_ = 0;

    std::shared_ptr<State> currentState() const;
};

} // namespace uavrl
