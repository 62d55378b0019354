#include "cli/train_options.hpp"

#include <getopt.h>

#include <ostream>

namespace uavrl {

namespace {

int parseInt(const char* flag, const char* text) {
    const std::string message =
        std::string("--") + flag + " expects an integer, got '" + text + "'";
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw UsageError(message);
    }
    if (text[used] != '\0') {
        throw UsageError(message);
    }
    return value;
}

} // namespace

void printUsage(std::ostream& out, const char* prog) {
    out <<
        "Usage: " << prog << " [OPTIONS]\n\n"
        "  --episodes N            episodes to train (default: 0 = until Ctrl-C)\n"
        "  --agent NAME            sarsa|qlearning|random (default: sarsa)\n"
        "  --load                  resume from <snapshot-dir>/<agent>-load.json\n"
        "  --save                  write a timestamped snapshot when stopping\n"
        "  --snapshot-dir DIR      snapshot directory (default: .)\n"
        "  --no-explore            greedy actions only\n"
        "  --sample-interval N     greedy evaluation every N episodes (default: 10000)\n"
        "  --no-sample             disable greedy evaluation\n"
        "  --seed N                random seed (default: nondeterministic)\n"
        "  --episode-log FILE      write per-episode outcomes as CSV when stopping\n"
        "  --help                  show this message\n";
}

TrainOptions parseTrainOptions(int argc, char** argv) {
    TrainOptions opts;

    struct option long_opts[] = {
        {"episodes",        required_argument, nullptr, 1},
        {"agent",           required_argument, nullptr, 2},
        {"load",            no_argument,       nullptr, 3},
        {"save",            no_argument,       nullptr, 4},
        {"snapshot-dir",    required_argument, nullptr, 5},
        {"no-explore",      no_argument,       nullptr, 6},
        {"sample-interval", required_argument, nullptr, 7},
        {"no-sample",       no_argument,       nullptr, 8},
        {"seed",            required_argument, nullptr, 9},
        {"episode-log",     required_argument, nullptr, 10},
        {"help",            no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    // glibc rescans from the start when optind is 0
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":h", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 1: opts.trainer.max_episodes = parseInt("episodes", optarg); break;
            case 2: opts.agent = optarg; break;
            case 3: opts.trainer.load_data = true; break;
            case 4: opts.trainer.save_data = true; break;
            case 5: opts.learner.snapshot_dir = optarg; break;
            case 6: opts.trainer.exploration = false; break;
            case 7: opts.trainer.sample_interval = parseInt("sample-interval", optarg); break;
            case 8: opts.trainer.sample = false; break;
            case 9: opts.learner.seed = static_cast<uint32_t>(parseInt("seed", optarg)); break;
            case 10: opts.episode_log = optarg; break;
            case 'h': opts.help = true; break;
            case ':':
                throw UsageError(std::string("Missing value for ") + argv[optind - 1]);
            default:
                throw UsageError(std::string("Unknown option ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        throw UsageError(std::string("Unexpected argument ") + argv[optind]);
    }
    if (opts.trainer.max_episodes < 0) {
        throw UsageError("--episodes must not be negative");
    }
    if (opts.trainer.sample_interval <= 0) {
        throw UsageError("--sample-interval must be positive");
    }
    if (opts.agent != "sarsa" && opts.agent != "qlearning" && opts.agent != "random") {
        throw UsageError("Unknown agent '" + opts.agent + "'");
    }
    return opts;
}

} // namespace uavrl
