#include "env/channel_model.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace uavrl {

double dbmToWatts(double dbm) {
    return std::pow(10.0, dbm / 10.0) / 1000.0;
}

PointPx cellCenterPx(double col, double row, const GridConfig& config) {
    const int cell_w = config.channel.map_width_px / config.cols;
    const int cell_h = config.channel.map_height_px / config.rows;
    return {col * cell_w + cell_w / 2, row * cell_h + cell_h / 2};
}

bool segmentTouchesRect(PointPx a, PointPx b,
                        double x_min, double y_min, double x_max, double y_max) {
    // Liang-Barsky clipping against a closed box
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double p[4] = {-dx, dx, -dy, dy};
    const double q[4] = {a.x - x_min, x_max - a.x, a.y - y_min, y_max - a.y};

    double t0 = 0.0;
    double t1 = 1.0;
    for (int i = 0; i < 4; i++) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) return false;  // parallel and outside
            continue;
        }
        double t = q[i] / p[i];
        if (p[i] < 0.0) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
        if (t0 > t1) return false;
    }
    return true;
}

double shannonRate(double distance_m, bool nlos, const ChannelParams& params) {
    const double beta = nlos ? params.beta_nlos : params.beta_los;
    const double path_loss = std::pow(distance_m, -params.path_loss_exponent) * beta;
    const double snr = dbmToWatts(params.tx_power_dbm) * path_loss / dbmToWatts(params.noise_dbm);
    return std::log2(1.0 + snr);
}

RateField RateField::compute(const GridConfig& config) {
    RateField field;
    field.receivers_ = config.receivers.size();
    field.cols_ = config.cols;
    field.rows_ = config.rows;

    const size_t cells = field.receivers_ * config.cols * config.rows;
    field.rates_.assign(cells, 0.0);
    field.nlos_.assign(cells, 0);

    const int cell_w = config.channel.map_width_px / config.cols;
    const int cell_h = config.channel.map_height_px / config.rows;
    const ChannelParams& ch = config.channel;

    for (size_t r = 0; r < field.receivers_; r++) {
        const PointPx rx = cellCenterPx(config.receivers[r].col, config.receivers[r].row, config);

        for (int col = 0; col < config.cols; col++) {
            for (int row = 0; row < config.rows; row++) {
                const PointPx cell = cellCenterPx(col, row, config);

                bool nlos = false;
                for (const auto& o : config.obstacles) {
                    const double x = o.col * cell_w;
                    const double y = o.row * cell_h;
                    if (segmentTouchesRect(rx, cell, x, y, x + cell_w, y + cell_h)) {
                        nlos = true;
                        break;
                    }
                }

                const double dx = rx.x - cell.x;
                const double dy = rx.y - cell.y;
                const double distance_m = std::sqrt(ch.altitude_px * ch.altitude_px +
                                                    dx * dx + dy * dy) * ch.meter_per_pixel;

                const size_t i = field.index(r, col, row);
                field.nlos_[i] = nlos ? 1 : 0;
                field.rates_[i] = shannonRate(distance_m, nlos, ch);
            }
        }
    }

    return field;
}

int RateField::blockage(int col, int row) const {
    int count = 0;
    for (size_t r = 0; r < receivers_; r++) {
        count += blocked(r, col, row) ? 1 : 0;
    }
    return count;
}

double RateField::minRate(int col, int row) const {
    double worst = std::numeric_limits<double>::infinity();
    for (size_t r = 0; r < receivers_; r++) {
        worst = std::min(worst, rate(r, col, row));
    }
    return worst;
}

} // namespace uavrl
