#pragma once

#include <optional>
#include <string>

namespace uavrl {

enum class DecayMode {
    EXPONENTIAL,
    LINEAR,
    NONE            // unrecognised mode names land here
};

/// "exp" and "linear" are recognised; any other name disables decay.
DecayMode parseDecayMode(const std::string& name);

struct ExplorationConfig {
    double initial = 0.9;
    std::optional<double> factor = 1.0 - 1e-8;  // nullopt: never decays
    std::optional<double> floor = 0.05;         // nullopt: may reach zero
    DecayMode mode = DecayMode::EXPONENTIAL;
};

// ─── Exploration Parameter ─────────────────────────────────────
// Decaying scalar used as the ε of ε-greedy selection. The floor,
// when set, is applied after every decay step.

class ExplorationParameter {
public:
    explicit ExplorationParameter(ExplorationConfig config = {});

    double value() const { return value_; }
    double initial() const { return config_.initial; }
    const ExplorationConfig& config() const { return config_; }

    /// One decay step according to the configured mode.
    void decayStep();

    /// Start over from the initial value.
    void reset() { value_ = config_.initial; }

    /// Overwrite the current value (used when restoring a snapshot).
    void setValue(double v) { value_ = v; }

private:
    ExplorationConfig config_;
    double value_;
};

} // namespace uavrl
