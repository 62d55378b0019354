#pragma once

#include "learning/learner.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace uavrl {

/// Baseline policy: a uniformly random valid action, nothing learned.
class RandomLearner : public Learner {
public:
    explicit RandomLearner(std::optional<uint32_t> seed = std::nullopt);

    int getAction(const State& state, std::optional<double> reward) override;

private:
    std::mt19937 rng_;
};

} // namespace uavrl
