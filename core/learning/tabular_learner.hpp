#pragma once

#include "learning/learner.hpp"
#include "learning/value_table.hpp"
#include "learning/exploration.hpp"
#include "persistence/snapshot_store.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <random>
#include <string>

namespace uavrl {

/// Hyperparameters shared by the tabular TD learners.
struct TabularConfig {
    double alpha = 0.3;                 // learning rate
    double gamma = 0.9;                 // discount factor
    ExplorationConfig exploration;      // ε schedule
    std::optional<uint32_t> seed;       // nullopt: seeded from random_device
    std::string snapshot_dir = ".";     // where snapshots are read and written
};

// ─── Tabular Learner ───────────────────────────────────────────
// ε-greedy TD control over a ValueTable. Subclasses only decide how
// the successor is valued in the TD target:
//
//   Q(s,a) ← Q(s,a) + α · (r + γ · bootstrap(s1, a1) − Q(s,a))
//
// where (s,a) is the pair remembered from the previous call, s1 the
// state passed in now and a1 the action just chosen for it.

class TabularLearner : public Learner {
public:
    TabularLearner(std::string name, size_t num_actions, bool exploration,
                   TabularConfig config);

    int getAction(const State& state, std::optional<double> reward) override;

    std::optional<double> explorationValue() const override { return epsilon_.value(); }

    /// Load `<snapshot_dir>/<name>-load.json`.
    int loadData() override;

    /// Load a specific snapshot file. Returns the stored round or -1 if
    /// the file does not exist. Throws SnapshotError if it is malformed;
    /// the learner is left untouched in both failure cases.
    int loadFrom(const std::string& path);

    bool saveData(int round) override;

    /// Path of the most recent successful save (empty before any).
    const std::string& lastSnapshotPath() const { return last_snapshot_path_; }

    ValueTable& table() { return table_; }
    const ValueTable& table() const { return table_; }
    ExplorationParameter& epsilon() { return epsilon_; }
    const ExplorationParameter& epsilon() const { return epsilon_; }
    const TabularConfig& config() const { return config_; }

    /// True once a (state, action) pair is held for the next update.
    bool hasPrior() const { return prior_.has_value(); }

    /// Progress messages go here (default std::cout).
    void setLog(std::ostream& log) { log_ = &log; }

protected:
    /// Value of the successor pair used in the TD target.
    virtual double bootstrap(const State& next, int next_action) = 0;

private:
    struct Prior {
        std::string key;
        int action = 0;
    };

    TabularConfig config_;
    ValueTable table_;
    ExplorationParameter epsilon_;
    SnapshotStore store_;
    std::optional<Prior> prior_;
    std::mt19937 rng_;
    std::ostream* log_;
    std::string last_snapshot_path_;

    int selectAction(const State& state);
};

} // namespace uavrl
