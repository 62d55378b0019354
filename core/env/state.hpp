#pragma once

#include <string>
#include <vector>

namespace uavrl {

/// Observation handed from an environment to a learner.
/// Implementations are immutable once produced.
class State {
public:
    virtual ~State() = default;

    /// Actions that may be taken from this state.
    virtual const std::vector<int>& validActions() const = 0;

    /// Canonical, stable string form used to index value tables.
    virtual std::string key() const = 0;
};

} // namespace uavrl
