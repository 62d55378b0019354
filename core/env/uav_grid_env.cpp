#include "env/uav_grid_env.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace uavrl {

static std::shared_ptr<const EnvInfo> describe(const GridConfig& config) {
    const ChannelParams& ch = config.channel;
    const double width_m = ch.map_width_px * ch.meter_per_pixel;
    const double height_m = ch.map_height_px * ch.meter_per_pixel;
    const double altitude_m = ch.altitude_px * ch.meter_per_pixel;

    auto info = std::make_shared<EnvInfo>();

    std::ostringstream area;
    area << "The area is " << width_m << "-by-" << height_m << " in meters";
    info->description.emplace_back("area", area.str());

    std::ostringstream altitude;
    altitude << "UAV is flying at " << altitude_m << " meters above ground";
    info->description.emplace_back("altitude", altitude.str());

    std::ostringstream height;
    height << "The flying altitude is about the height of a "
           << std::fixed << std::setprecision(0) << altitude_m * 0.3 << "-story building";
    info->description.emplace_back("height", height.str());

    info->flight_time = config.flight_time;
    return info;
}

UavGridEnv::UavGridEnv(GridConfig config)
    : UavGridEnv(GridWorld::create(std::move(config))) {}

UavGridEnv::UavGridEnv(std::shared_ptr<const GridWorld> world)
    : world_(std::move(world)) {
    if (!world_) {
        throw std::invalid_argument("UavGridEnv needs a world");
    }
    info_ = describe(world_->config());
    reset();
}

std::shared_ptr<State> UavGridEnv::currentState() const {
    return std::make_shared<GridState>(world_, pos_.col, pos_.row, step_);
}

ResetResult UavGridEnv::reset() {
    pos_ = world_->config().start;
    step_ = 0;
    return {currentState(), info_};
}

StepResult UavGridEnv::step(int action) {
    const GridConfig& config = world_->config();

    const CellPos delta = actionDelta(action);
    const CellPos next{pos_.col + delta.col, pos_.row + delta.row};
    if (config.inBounds(next.col, next.row)) {
        pos_ = next;
    }

    step_++;

    StepResult result;
    result.reward = world_->fairRate(pos_.col, pos_.row);

    if (pos_ == config.end && step_ == config.flight_time) {
        result.terminated = true;
    } else if (pos_ == config.end) {
        // returned too early
        result.truncated = true;
        result.reward -= result.reward * (config.flight_time - step_);
    } else if (step_ == config.flight_time) {
        // failed to return in time
        result.truncated = true;
        result.reward -= result.reward * OVERRUN_PENALTY_FACTOR;
    }

    result.state = currentState();
    result.info = info_;
    return result;
}

} // namespace uavrl
