#include "learning/exploration.hpp"

namespace uavrl {

DecayMode parseDecayMode(const std::string& name) {
    if (name == "exp") return DecayMode::EXPONENTIAL;
    if (name == "linear") return DecayMode::LINEAR;
    return DecayMode::NONE;
}

ExplorationParameter::ExplorationParameter(ExplorationConfig config)
    : config_(config), value_(config.initial) {}

void ExplorationParameter::decayStep() {
    if (!config_.factor) return;

    switch (config_.mode) {
        case DecayMode::EXPONENTIAL:
            value_ *= *config_.factor;
            break;
        case DecayMode::LINEAR:
            value_ -= *config_.factor;
            break;
        case DecayMode::NONE:
            break;
    }

    if (config_.floor && value_ < *config_.floor) {
        value_ = *config_.floor;
    }
}

} // namespace uavrl
