#pragma once

#include "env/grid_config.hpp"
#include <cstddef>
#include <vector>

namespace uavrl {

struct PointPx {
    double x = 0.0;
    double y = 0.0;
};

/// Convert a power level from dBm to watts.
double dbmToWatts(double dbm);

/// Pixel position of the centre of a (possibly fractional) cell.
PointPx cellCenterPx(double col, double row, const GridConfig& config);

/// True if the closed segment a-b touches the closed rectangle.
bool segmentTouchesRect(PointPx a, PointPx b,
                        double x_min, double y_min, double x_max, double y_max);

/// Shannon rate (bit/s/Hz) at `distance_m` with LOS or NLOS shadowing.
double shannonRate(double distance_m, bool nlos, const ChannelParams& params);

// ─── Rate Field ────────────────────────────────────────────────
// Achievable rate for every (receiver, cell) pair, computed once.
// A cell is NLOS for a receiver when the straight line between the
// receiver and the cell centre touches any obstacle cell.

class RateField {
public:
    static RateField compute(const GridConfig& config);

    double rate(size_t receiver, int col, int row) const {
        return rates_[index(receiver, col, row)];
    }

    bool blocked(size_t receiver, int col, int row) const {
        return nlos_[index(receiver, col, row)] != 0;
    }

    /// Number of receivers whose line of sight to this cell is blocked.
    int blockage(int col, int row) const;

    /// Max-min fairness value of a cell: the worst receiver's rate.
    double minRate(int col, int row) const;

    size_t receiverCount() const { return receivers_; }

private:
    size_t receivers_ = 0;
    int cols_ = 0;
    int rows_ = 0;
    std::vector<double> rates_;
    std::vector<char> nlos_;

    size_t index(size_t receiver, int col, int row) const {
        return (receiver * static_cast<size_t>(cols_) + static_cast<size_t>(col))
                   * static_cast<size_t>(rows_) + static_cast<size_t>(row);
    }
};

} // namespace uavrl
