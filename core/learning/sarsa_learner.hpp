#pragma once

#include "learning/tabular_learner.hpp"

namespace uavrl {

/// On-policy TD control. The successor is valued by the action that
/// was actually chosen for it: bootstrap(s1, a1) = Q(s1, a1).
class SarsaLearner : public TabularLearner {
public:
    explicit SarsaLearner(size_t num_actions, bool exploration = true,
                          TabularConfig config = {});

protected:
    double bootstrap(const State& next, int next_action) override;
};

} // namespace uavrl
