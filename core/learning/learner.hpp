#pragma once

#include "env/state.hpp"
#include <optional>
#include <string>
#include <utility>

namespace uavrl {

// ─── Learner ───────────────────────────────────────────────────
// Abstract decision maker driven by the training loop. A learner is
// told the current state together with the reward earned by its
// previous action and answers with the next action.

class Learner {
public:
    explicit Learner(std::string name, bool exploration = true)
        : name_(std::move(name)), exploration_(exploration) {}
    virtual ~Learner() = default;

    const std::string& name() const { return name_; }

    /// Choose the next action. `reward` belongs to the previous action;
    /// nullopt means there is nothing to learn from.
    virtual int getAction(const State& state, std::optional<double> reward) = 0;

    /// Set the exploration switch, returning the previous setting.
    bool setExploration(bool exploration) {
        bool previous = exploration_;
        exploration_ = exploration;
        return previous;
    }

    bool isExploration() const { return exploration_; }

    /// Current exploration probability, if the learner has one.
    virtual std::optional<double> explorationValue() const { return std::nullopt; }

    /// Load learned data. Returns the stored round, or -1 if none.
    virtual int loadData() { return -1; }

    /// Persist learned data tagged with `round`. Returns success.
    virtual bool saveData(int /*round*/) { return false; }

protected:
    std::string name_;
    bool exploration_;
};

} // namespace uavrl
