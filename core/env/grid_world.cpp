#include "env/grid_world.hpp"

namespace uavrl {

GridWorld::GridWorld(Token, GridConfig config)
    : config_(std::move(config)),
      actions_(ActionMask::build(config_)),
      rates_(RateField::compute(config_)) {}

std::shared_ptr<const GridWorld> GridWorld::create(GridConfig config) {
    config.validate();
    return std::make_shared<const GridWorld>(Token{}, std::move(config));
}

} // namespace uavrl
