#pragma once

#include "learning/tabular_learner.hpp"
#include "training/trainer.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

namespace uavrl {

/// Bad command line; the message names the offending flag or value.
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

// ─── Training Options ──────────────────────────────────────────
// Everything uav_train reads from its command line.

struct TrainOptions {
    TrainerConfig trainer;
    TabularConfig learner;
    std::string agent = "sarsa";        // sarsa | qlearning | random
    std::string episode_log;            // CSV export path, empty for none
    bool help = false;
};

/// Parse long options with getopt_long. Throws UsageError.
TrainOptions parseTrainOptions(int argc, char** argv);

void printUsage(std::ostream& out, const char* prog);

} // namespace uavrl
