#pragma once

#include "env/environment.hpp"
#include "learning/learner.hpp"
#include "memory/episode_log.hpp"

#include <atomic>
#include <iostream>
#include <optional>
#include <vector>

namespace uavrl {

/// Run control for a training session.
struct TrainerConfig {
    int max_episodes = 0;           // 0 = until stopped
    bool load_data = false;         // resume from the learner's load snapshot
    bool save_data = false;         // write a snapshot when the run ends
    bool exploration = true;        // ε-greedy during training
    bool sample = true;             // periodic greedy evaluation
    int sample_interval = 10000;    // evaluate every N episodes (and the first)
    int summary_window = 100;       // recent episodes averaged in the closing summary
};

/// One greedy replay episode.
struct EvaluationResult {
    int episode = 0;
    double reward = 0.0;
    std::optional<double> exploration;  // learner's ε, if it has one
    int flight_time = 0;
    bool terminated = false;
};

struct TrainingSummary {
    int first_episode = 1;
    int last_episode = 0;           // last completed episode index
    int episodes_run = 0;
    bool interrupted = false;
    bool saved = false;
    std::vector<EvaluationResult> evaluations;
};

// ─── Trainer ───────────────────────────────────────────────────
// Drives learner and environment through repeated episodes:
//
//   action = learner.getAction(state, reward)
//   state, reward, ... = env.step(action)
//
// When an episode ends the terminal state and reward are handed to
// the learner once more so its last pending update is applied. The
// reward is not cleared on reset, so the first action of the next
// episode (or of a greedy replay) values the terminal pair against the
// new start state. Nothing is forgotten between episodes.

class Trainer {
public:
    Trainer(Environment& env, Learner& learner, TrainerConfig config = {},
            std::ostream& log = std::cout);

    /// Train until max_episodes complete or `stop` becomes true. The stop
    /// flag is polled between steps; an unfinished episode is discarded
    /// and not counted.
    TrainingSummary run(const std::atomic<bool>* stop = nullptr);

    /// Replay one episode with exploration switched off, then restore the
    /// learner's exploration setting. The replay shares the pending
    /// reward with training, so the learner keeps updating during it.
    EvaluationResult evaluate(int episode);

    const EpisodeLog& episodes() const { return episodes_; }
    const TrainerConfig& config() const { return config_; }

private:
    Environment& env_;
    Learner& learner_;
    TrainerConfig config_;
    std::ostream& log_;
    EpisodeLog episodes_;
    std::optional<double> pending_reward_;  // reward of the last step taken

    bool shouldSample(int episode) const;
    void report(const EvaluationResult& result);
    void reportProgress();
};

} // namespace uavrl
