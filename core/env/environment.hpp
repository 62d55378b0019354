#pragma once

#include "env/state.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace uavrl {

/// Static facts about an environment, fixed at construction.
struct EnvInfo {
    /// (topic, text) lines in presentation order
    std::vector<std::pair<std::string, std::string>> description;
    int flight_time = 0;
};

struct ResetResult {
    std::shared_ptr<State> state;
    std::shared_ptr<const EnvInfo> info;
};

struct StepResult {
    std::shared_ptr<State> state;
    double reward = 0.0;
    bool terminated = false;    // reached the goal condition
    bool truncated = false;     // stopped for any other reason
    std::shared_ptr<const EnvInfo> info;
};

// ─── Environment ───────────────────────────────────────────────
// Episodic environment driven by integer actions.

class Environment {
public:
    virtual ~Environment() = default;

    /// Start a new episode and return its initial state.
    virtual ResetResult reset() = 0;

    /// Apply one action and advance time by one step.
    virtual StepResult step(int action) = 0;

    virtual const EnvInfo& info() const = 0;

    /// Steps taken since the last reset.
    virtual int elapsedSteps() const = 0;

    virtual size_t numActions() const = 0;
};

} // namespace uavrl
