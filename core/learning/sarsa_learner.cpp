#include "learning/sarsa_learner.hpp"

namespace uavrl {

SarsaLearner::SarsaLearner(size_t num_actions, bool exploration, TabularConfig config)
    : TabularLearner("SARSA", num_actions, exploration, std::move(config)) {}

double SarsaLearner::bootstrap(const State& next, int next_action) {
    return table().get(next.key(), next_action);
}

} // namespace uavrl
