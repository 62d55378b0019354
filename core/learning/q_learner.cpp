#include "learning/q_learner.hpp"
#include <algorithm>
#include <limits>

namespace uavrl {

QLearner::QLearner(size_t num_actions, bool exploration, TabularConfig config)
    : TabularLearner("Q-Learning", num_actions, exploration, std::move(config)) {}

double QLearner::bootstrap(const State& next, int /*next_action*/) {
    const std::vector<int>& valid = next.validActions();
    if (valid.empty()) return 0.0;

    const ValueTable::Row& q = table().get(next.key());
    double best = -std::numeric_limits<double>::infinity();
    for (int a : valid) {
        best = std::max(best, q.at(static_cast<size_t>(a)));
    }
    return best;
}

} // namespace uavrl
