#include <gtest/gtest.h>
#include "cli/train_options.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace uavrl;

// getopt wants mutable argv
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "uav_train");
        for (auto& s : storage_) ptrs_.push_back(&s[0]);
        ptrs_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

TEST(TrainOptionsTest, Defaults) {
    Args args{};
    TrainOptions opts = parseTrainOptions(args.argc(), args.argv());

    EXPECT_FALSE(opts.help);
    EXPECT_EQ(opts.agent, "sarsa");
    EXPECT_EQ(opts.trainer.max_episodes, 0);
    EXPECT_EQ(opts.trainer.sample_interval, 10000);
    EXPECT_TRUE(opts.trainer.exploration);
    EXPECT_FALSE(opts.learner.seed.has_value());
    EXPECT_TRUE(opts.episode_log.empty());
}

TEST(TrainOptionsTest, HelpIsNotAnError) {
    Args args{"--help"};
    TrainOptions opts;
    ASSERT_NO_THROW(opts = parseTrainOptions(args.argc(), args.argv()));
    EXPECT_TRUE(opts.help);

    Args short_form{"-h"};
    EXPECT_TRUE(parseTrainOptions(short_form.argc(), short_form.argv()).help);
}

TEST(TrainOptionsTest, AllFlags) {
    Args args{"--episodes", "500", "--agent", "qlearning", "--load", "--save",
              "--snapshot-dir", "/tmp/snaps", "--no-explore", "--sample-interval", "25",
              "--no-sample", "--seed", "42", "--episode-log", "episodes.csv"};
    TrainOptions opts = parseTrainOptions(args.argc(), args.argv());

    EXPECT_EQ(opts.trainer.max_episodes, 500);
    EXPECT_EQ(opts.agent, "qlearning");
    EXPECT_TRUE(opts.trainer.load_data);
    EXPECT_TRUE(opts.trainer.save_data);
    EXPECT_EQ(opts.learner.snapshot_dir, "/tmp/snaps");
    EXPECT_FALSE(opts.trainer.exploration);
    EXPECT_EQ(opts.trainer.sample_interval, 25);
    EXPECT_FALSE(opts.trainer.sample);
    ASSERT_TRUE(opts.learner.seed.has_value());
    EXPECT_EQ(*opts.learner.seed, 42u);
    EXPECT_EQ(opts.episode_log, "episodes.csv");
}

TEST(TrainOptionsTest, RejectsBadInput) {
    Args not_a_number{"--episodes", "ten"};
    EXPECT_THROW(parseTrainOptions(not_a_number.argc(), not_a_number.argv()), UsageError);

    Args trailing{"--seed", "12abc"};
    EXPECT_THROW(parseTrainOptions(trailing.argc(), trailing.argv()), UsageError);

    Args unknown{"--fly-fast"};
    EXPECT_THROW(parseTrainOptions(unknown.argc(), unknown.argv()), UsageError);

    Args agent{"--agent", "dqn"};
    EXPECT_THROW(parseTrainOptions(agent.argc(), agent.argv()), UsageError);

    Args interval{"--sample-interval", "0"};
    EXPECT_THROW(parseTrainOptions(interval.argc(), interval.argv()), UsageError);

    Args missing{"--episodes"};
    EXPECT_THROW(parseTrainOptions(missing.argc(), missing.argv()), UsageError);
}

TEST(TrainOptionsTest, UsageListsEveryFlag) {
    std::ostringstream out;
    printUsage(out, "uav_train");
    const std::string text = out.str();
    for (const char* flag : {"--episodes", "--agent", "--load", "--save", "--snapshot-dir",
                             "--no-explore", "--sample-interval", "--no-sample", "--seed",
                             "--episode-log", "--help"}) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
}
