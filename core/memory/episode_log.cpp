#include "memory/episode_log.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace uavrl {

void EpisodeLog::store(const EpisodeRecord& record) {
    records_.push_back(record);
}

double EpisodeLog::returnRate() const {
    if (records_.empty()) return 0.0;
    int returned = 0;
    for (const auto& r : records_) {
        if (r.terminated) returned++;
    }
    return static_cast<double>(returned) / records_.size();
}

double EpisodeLog::averageReward(size_t window) const {
    if (records_.empty()) return 0.0;
    size_t first = 0;
    if (window > 0 && window < records_.size()) {
        first = records_.size() - window;
    }
    double total = 0.0;
    for (size_t i = first; i < records_.size(); i++) {
        total += records_[i].reward;
    }
    return total / (records_.size() - first);
}

void EpisodeLog::exportToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write episode log: " + path);
    }
    out << "episode,reward,terminated,flight_time\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& r : records_) {
        out << r.episode << ","
            << r.reward << ","
            << (r.terminated ? 1 : 0) << ","
            << r.flight_time << "\n";
    }
}

} // namespace uavrl
