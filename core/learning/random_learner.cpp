#include "learning/random_learner.hpp"
#include <stdexcept>

namespace uavrl {

RandomLearner::RandomLearner(std::optional<uint32_t> seed)
    : Learner("Random Action") {
    if (seed) {
        rng_.seed(*seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

int RandomLearner::getAction(const State& state, std::optional<double> /*reward*/) {
    const std::vector<int>& valid = state.validActions();
    if (valid.empty()) {
        throw std::logic_error("State " + state.key() + " has no valid action");
    }
    std::uniform_int_distribution<size_t> pick(0, valid.size() - 1);
    return valid[pick(rng_)];
}

} // namespace uavrl
