#include "learning/tabular_learner.hpp"

#include <algorithm>
#include <ctime>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace uavrl {

TabularLearner::TabularLearner(std::string name, size_t num_actions, bool exploration,
                               TabularConfig config)
    : Learner(std::move(name), exploration),
      config_(std::move(config)),
      table_(num_actions),
      epsilon_(config_.exploration),
      store_(config_.snapshot_dir),
      log_(&std::cout) {
    if (config_.seed) {
        rng_.seed(*config_.seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

int TabularLearner::selectAction(const State& state) {
    const std::vector<int>& valid = state.validActions();
    if (valid.empty()) {
        throw std::logic_error("State " + state.key() + " has no valid action");
    }

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (exploration_ && coin(rng_) < epsilon_.value()) {
        std::uniform_int_distribution<size_t> pick(0, valid.size() - 1);
        return valid[pick(rng_)];
    }

    // Greedy over valid actions; ties are broken uniformly
    const ValueTable::Row& q = table_.get(state.key());
    double best = -std::numeric_limits<double>::infinity();
    for (int a : valid) {
        best = std::max(best, q.at(static_cast<size_t>(a)));
    }

    std::vector<int> best_actions;
    for (int a : valid) {
        if (q.at(static_cast<size_t>(a)) == best) {
            best_actions.push_back(a);
        }
    }

    std::uniform_int_distribution<size_t> pick(0, best_actions.size() - 1);
    return best_actions[pick(rng_)];
}

int TabularLearner::getAction(const State& state, std::optional<double> reward) {
    const int next_action = selectAction(state);

    epsilon_.decayStep();

    if (prior_ && reward) {
        const double target = *reward + config_.gamma * bootstrap(state, next_action);
        const double old_value = table_.get(prior_->key, prior_->action);
        table_.set(prior_->key, prior_->action,
                   old_value + config_.alpha * (target - old_value));
    }

    prior_ = Prior{state.key(), next_action};
    return next_action;
}

int TabularLearner::loadData() {
    return loadFrom(store_.loadPath(name_));
}

int TabularLearner::loadFrom(const std::string& path) {
    std::optional<SnapshotData> data = store_.load(path, table_.numActions());
    if (!data) {
        *log_ << "- '" << path << "' not found, no experience is used" << std::endl;
        return -1;
    }

    table_.clear();
    for (auto& [key, row] : data->rows) {
        table_.assign(key, std::move(row));
    }
    epsilon_.setValue(data->exploration);

    *log_ << "- loaded '" << path << "' containing " << table_.size() << " states\n"
          << "- stopped at round " << data->round << "\n"
          << "- epsilon is " << epsilon_.value() << std::endl;
    return data->round;
}

bool TabularLearner::saveData(int round) {
    SnapshotData data;
    data.rows = table_.rows();
    data.round = round;
    data.exploration = epsilon_.value();

    try {
        last_snapshot_path_ = store_.save(name_, data, std::time(nullptr));
    } catch (const std::runtime_error& e) {
        std::cerr << "[" << name_ << "] snapshot save failed: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace uavrl
