#include "training/trainer.hpp"
#include <iomanip>

namespace uavrl {

Trainer::Trainer(Environment& env, Learner& learner, TrainerConfig config,
                 std::ostream& log)
    : env_(env), learner_(learner), config_(config), log_(log) {}

bool Trainer::shouldSample(int episode) const {
    if (!config_.sample) return false;
    if (episode == 1) return true;
    return config_.sample_interval > 0 && episode % config_.sample_interval == 0;
}

void Trainer::report(const EvaluationResult& result) {
    const std::ios::fmtflags flags = log_.flags();
    const std::streamsize precision = log_.precision();

    log_ << "Episode " << result.episode << ": reward = "
         << std::fixed << std::setprecision(2) << result.reward << ", epsilon = ";
    if (result.exploration) {
        log_ << std::setprecision(4) << *result.exploration;
    } else {
        log_ << "N/A";
    }
    log_ << ", flight time = " << result.flight_time
         << (result.terminated ? " (returned on time)" : "") << std::endl;
    log_.flags(flags);
    log_.precision(precision);
}

void Trainer::reportProgress() {
    const std::ios::fmtflags flags = log_.flags();
    const std::streamsize precision = log_.precision();

    log_ << "- " << episodes_.count() << " episodes, returned on time "
         << std::fixed << std::setprecision(1) << episodes_.returnRate() * 100.0 << "%"
         << ", average reward " << std::setprecision(2) << episodes_.averageReward();
    if (config_.summary_window > 0 &&
        episodes_.count() > static_cast<size_t>(config_.summary_window)) {
        log_ << " (last " << config_.summary_window << ": "
             << episodes_.averageReward(static_cast<size_t>(config_.summary_window)) << ")";
    }
    log_ << std::endl;
    log_.flags(flags);
    log_.precision(precision);
}

EvaluationResult Trainer::evaluate(int episode) {
    const bool previous = learner_.setExploration(false);

    EvaluationResult result;
    result.episode = episode;

    std::shared_ptr<State> state = env_.reset().state;

    while (true) {
        int action = learner_.getAction(*state, pending_reward_);
        StepResult step = env_.step(action);
        state = step.state;
        pending_reward_ = step.reward;
        result.reward += step.reward;

        if (step.terminated || step.truncated) {
            result.terminated = step.terminated;
            result.flight_time = env_.elapsedSteps();
            break;
        }
    }

    result.exploration = learner_.explorationValue();
    learner_.setExploration(previous);
    return result;
}

TrainingSummary Trainer::run(const std::atomic<bool>* stop) {
    TrainingSummary summary;
    learner_.setExploration(config_.exploration);

    int episode = 1;
    if (config_.load_data) {
        log_ << "- Load data requested" << std::endl;
        int progress = learner_.loadData();
        if (progress != -1) {
            episode = progress + 1;
        } else {
            log_ << "- Failed to load data" << std::endl;
        }
    }
    summary.first_episode = episode;
    summary.last_episode = episode - 1;

    auto stopRequested = [stop]() {
        return stop != nullptr && stop->load();
    };

    std::shared_ptr<State> state = env_.reset().state;
    double episode_reward = 0.0;

    while (config_.max_episodes == 0 || summary.episodes_run < config_.max_episodes) {
        if (stopRequested()) {
            summary.interrupted = true;
            break;
        }

        int action = learner_.getAction(*state, pending_reward_);
        StepResult step = env_.step(action);
        state = step.state;
        pending_reward_ = step.reward;
        episode_reward += step.reward;

        if (!step.terminated && !step.truncated) continue;

        // Flush the update for the final transition
        learner_.getAction(*state, pending_reward_);

        episodes_.store({episode, episode_reward, step.terminated, env_.elapsedSteps()});

        if (shouldSample(episode)) {
            EvaluationResult eval = evaluate(episode);
            report(eval);
            summary.evaluations.push_back(eval);
        }

        // The pending reward is kept: the first action of the next
        // episode updates the terminal pair chosen by the flush above.
        state = env_.reset().state;
        episode_reward = 0.0;

        summary.last_episode = episode;
        summary.episodes_run++;
        episode++;
    }

    if (summary.interrupted) {
        log_ << " [Interrupted] Program stopped." << std::endl;
    }

    if (summary.episodes_run > 0) {
        reportProgress();
    }

    log_ << "Stopping " << learner_.name() << " algorithm..." << std::endl;
    if (config_.save_data) {
        log_ << "- Save data requested" << std::endl;
        summary.saved = learner_.saveData(summary.last_episode);
        if (summary.saved) {
            log_ << "- Progress saved, number of rounds = " << summary.last_episode << std::endl;
        } else {
            log_ << "- Failed to save data" << std::endl;
        }
    }

    return summary;
}

} // namespace uavrl
