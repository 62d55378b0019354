#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace uavrl {

// ─── Episode Record ────────────────────────────────────────────
// Outcome of one training episode.

struct EpisodeRecord {
    int episode = 0;
    double reward = 0.0;        // cumulative, penalties included
    bool terminated = false;    // returned to base exactly on time
    int flight_time = 0;        // steps flown
};

// ─── Episode Log ───────────────────────────────────────────────
// Append-only history of episode outcomes for progress reporting.

class EpisodeLog {
public:
    EpisodeLog() = default;

    void store(const EpisodeRecord& record);

    const std::vector<EpisodeRecord>& all() const { return records_; }

    size_t count() const { return records_.size(); }

    /// Fraction of episodes that ended with an on-time return.
    double returnRate() const;

    /// Mean cumulative reward, optionally over the last `window` records.
    double averageReward(size_t window = 0) const;

    /// Write all records as CSV: episode,reward,terminated,flight_time
    void exportToFile(const std::string& path) const;

    void clear() { records_.clear(); }

private:
    std::vector<EpisodeRecord> records_;
};

} // namespace uavrl
