#pragma once

#include <cstddef>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace uavrl {

/// Raised when a snapshot file exists but cannot be trusted.
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& what) : std::runtime_error(what) {}
};

/// Learned state captured in one snapshot file.
struct SnapshotData {
    std::unordered_map<std::string, std::vector<double>> rows;
    int round = 0;
    double exploration = 0.0;
};

// ─── Snapshot Store ────────────────────────────────────────────
// JSON persistence for value tables. A snapshot is one object whose
// keys are state keys mapped to value arrays, plus two reserved keys:
// "round" (last completed episode) and "epsilon" (exploration value).
//
// Saves never overwrite: each file is stamped with the local time and
// disambiguated with a numeric suffix if that name is taken. Files are
// written to a temporary name first and renamed into place.

class SnapshotStore {
public:
    static constexpr const char* ROUND_KEY = "round";
    static constexpr const char* EXPLORATION_KEY = "epsilon";

    explicit SnapshotStore(std::string directory = ".");

    const std::string& directory() const { return directory_; }

    /// `<dir>/<name>-load.json`, the file picked up when resuming.
    std::string loadPath(const std::string& name) const;

    /// Read a snapshot. nullopt if the file does not exist; throws
    /// SnapshotError if it is malformed or rows have the wrong width.
    std::optional<SnapshotData> load(const std::string& path, size_t num_actions) const;

    /// Write a new snapshot and return its path. Throws std::runtime_error
    /// on I/O failure.
    std::string save(const std::string& name, const SnapshotData& data,
                     std::time_t when) const;

    /// First unused `<dir>/<name>-[YYYY-MM-DD][HHhMMmSSs][-N].json`.
    /// Throws std::runtime_error if `when` has no local calendar time.
    std::string uniquePath(const std::string& name, std::time_t when) const;

private:
    std::string directory_;
};

} // namespace uavrl
