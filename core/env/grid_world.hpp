#pragma once

#include "env/grid_config.hpp"
#include "env/action_mask.hpp"
#include "env/channel_model.hpp"
#include <memory>

namespace uavrl {

/// Immutable world data shared by an environment and all of its states:
/// the validated configuration, the action mask and the rate field.
class GridWorld {
    struct Token {
        explicit Token() = default;
    };

public:
    /// Validate `config` and precompute the derived tables.
    static std::shared_ptr<const GridWorld> create(GridConfig config);

    /// Only reachable through create(), which validates first.
    GridWorld(Token, GridConfig config);

    const GridConfig& config() const { return config_; }
    const ActionMask& actions() const { return actions_; }
    const RateField& rates() const { return rates_; }

    /// Max-min fair rate at a cell.
    double fairRate(int col, int row) const { return rates_.minRate(col, row); }

private:
    GridConfig config_;
    ActionMask actions_;
    RateField rates_;
};

} // namespace uavrl
