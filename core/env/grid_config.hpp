#pragma once

#include <vector>

namespace uavrl {

struct CellPos {
    int col = 0;
    int row = 0;

    bool operator==(const CellPos& other) const {
        return col == other.col && row == other.row;
    }
    bool operator!=(const CellPos& other) const { return !(*this == other); }
};

/// Ground receiver position in (fractional) cell coordinates.
struct ReceiverSite {
    double col = 0.0;
    double row = 0.0;
};

// ─── Channel Parameters ────────────────────────────────────────
// Air-to-ground link model. Geometry is expressed in map pixels and
// converted with meter_per_pixel, so the cell size follows the grid
// dimensions (map_width_px / cols, integer division).

struct ChannelParams {
    int map_width_px = 800;
    int map_height_px = 800;
    double altitude_px = 20.0;          // UAV flying altitude
    double meter_per_pixel = 2.0;
    double frequency_hz = 2.4e9;        // carrier, informational
    double path_loss_exponent = 2.0;
    double beta_los = 1.0;              // shadowing attenuation, line of sight
    double beta_nlos = 0.01;            // shadowing attenuation, blocked
    double noise_dbm = -174.0;          // thermal noise per Hz
    double tx_power_dbm = 15.0;
};

/// Rectangle of obstacle cells, bounds inclusive.
std::vector<CellPos> obstacleBlock(int col_first, int col_last,
                                   int row_first, int row_last);

// ─── Grid Configuration ────────────────────────────────────────
// Static description of the world. Defaults reproduce the 15x15
// reference map: a 2x4 building, two ground users and a base cell in
// the bottom-left corner that the UAV must return to after 50 steps.

struct GridConfig {
    int cols = 15;
    int rows = 15;
    std::vector<CellPos> obstacles = obstacleBlock(9, 10, 8, 11);
    CellPos start{0, 14};
    CellPos end{0, 14};
    int flight_time = 50;
    std::vector<ReceiverSite> receivers{{4.5, 2.5}, {11.5, 6.5}};
    ChannelParams channel;

    bool inBounds(int col, int row) const {
        return col >= 0 && col < cols && row >= 0 && row < rows;
    }

    bool isObstacle(int col, int row) const;

    /// Throws std::invalid_argument describing the first problem found.
    void validate() const;
};

} // namespace uavrl
