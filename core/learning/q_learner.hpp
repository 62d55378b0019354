#pragma once

#include "learning/tabular_learner.hpp"

namespace uavrl {

/// Off-policy TD control: the successor is valued by its best valid
/// action regardless of which action will be taken there.
class QLearner : public TabularLearner {
public:
    explicit QLearner(size_t num_actions, bool exploration = true,
                      TabularConfig config = {});

protected:
    double bootstrap(const State& next, int next_action) override;
};

} // namespace uavrl
