// Command-line trainer for the UAV grid world.
//
//   uav_train --episodes 100000 --load --save --sample-interval 10000
//
// Ctrl-C stops training between two steps; --save is still honoured
// with the last completed episode.

#include "cli/train_options.hpp"
#include "env/uav_grid_env.hpp"
#include "learning/sarsa_learner.hpp"
#include "learning/q_learner.hpp"
#include "learning/random_learner.hpp"
#include "persistence/snapshot_store.hpp"
#include "training/trainer.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::atomic<bool> g_stop{false};

void onInterrupt(int) {
    g_stop.store(true);
}

std::unique_ptr<uavrl::Learner> makeLearner(const uavrl::TrainOptions& opts, size_t num_actions) {
    if (opts.agent == "qlearning") {
        return std::make_unique<uavrl::QLearner>(num_actions, opts.trainer.exploration, opts.learner);
    }
    if (opts.agent == "random") {
        return std::make_unique<uavrl::RandomLearner>(opts.learner.seed);
    }
    return std::make_unique<uavrl::SarsaLearner>(num_actions, opts.trainer.exploration, opts.learner);
}

} // namespace

int main(int argc, char** argv) {
    uavrl::TrainOptions opts;
    try {
        opts = uavrl::parseTrainOptions(argc, argv);
    } catch (const uavrl::UsageError& e) {
        std::cerr << e.what() << "\n\n";
        uavrl::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (opts.help) {
        uavrl::printUsage(std::cout, argv[0]);
        return 0;
    }

    try {
        uavrl::UavGridEnv env;

        std::cout << "Simulation info:" << std::endl;
        for (const auto& [topic, text] : env.info().description) {
            std::cout << "- " << text << std::endl;
        }

        std::unique_ptr<uavrl::Learner> learner = makeLearner(opts, env.numActions());
        std::cout << "Running simulation using " << learner->name() << " algorithm." << std::endl;

        std::signal(SIGINT, onInterrupt);

        uavrl::Trainer trainer(env, *learner, opts.trainer, std::cout);
        uavrl::TrainingSummary summary = trainer.run(&g_stop);

        if (!opts.episode_log.empty()) {
            trainer.episodes().exportToFile(opts.episode_log);
            std::cout << "- Episode log written to " << opts.episode_log << std::endl;
        }

        if (opts.trainer.save_data && !summary.saved) {
            return 1;
        }
    } catch (const uavrl::SnapshotError& e) {
        std::cerr << "Corrupt snapshot: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
