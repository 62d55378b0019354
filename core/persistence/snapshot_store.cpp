#include "persistence/snapshot_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace uavrl {

SnapshotStore::SnapshotStore(std::string directory)
    : directory_(directory.empty() ? std::string(".") : std::move(directory)) {}

std::string SnapshotStore::loadPath(const std::string& name) const {
    return (fs::path(directory_) / (name + "-load.json")).string();
}

std::optional<SnapshotData> SnapshotStore::load(const std::string& path,
                                                 size_t num_actions) const {
    if (!fs::exists(path)) return std::nullopt;

    std::ifstream in(path);
    if (!in) {
        throw SnapshotError("Cannot open snapshot: " + path);
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw SnapshotError("Snapshot " + path + " is not valid JSON: " + e.what());
    }

    if (!doc.is_object()) {
        throw SnapshotError("Snapshot " + path + " must contain a JSON object");
    }

    SnapshotData data;
    bool has_round = false;
    bool has_exploration = false;

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == ROUND_KEY) {
            if (!value.is_number_integer()) {
                throw SnapshotError("Snapshot " + path + ": \"round\" must be an integer");
            }
            data.round = value.get<int>();
            has_round = true;
            continue;
        }
        if (key == EXPLORATION_KEY) {
            if (!value.is_number()) {
                throw SnapshotError("Snapshot " + path + ": \"epsilon\" must be a number");
            }
            data.exploration = value.get<double>();
            has_exploration = true;
            continue;
        }

        if (!value.is_array() || value.size() != num_actions) {
            throw SnapshotError("Snapshot " + path + ": row " + key +
                " must be an array of " + std::to_string(num_actions) + " numbers");
        }
        std::vector<double> row;
        row.reserve(num_actions);
        for (const auto& v : value) {
            if (!v.is_number()) {
                throw SnapshotError("Snapshot " + path + ": row " + key +
                    " contains a non-numeric value");
            }
            row.push_back(v.get<double>());
        }
        data.rows.emplace(key, std::move(row));
    }

    if (!has_round) {
        throw SnapshotError("Snapshot " + path + " has no \"round\" entry");
    }
    if (!has_exploration) {
        throw SnapshotError("Snapshot " + path + " has no \"epsilon\" entry");
    }
    return data;
}

std::string SnapshotStore::uniquePath(const std::string& name, std::time_t when) const {
    const std::tm* local = std::localtime(&when);
    if (local == nullptr) {
        throw std::runtime_error("Cannot convert snapshot time " + std::to_string(when) +
                                 " to local time");
    }
    std::ostringstream stamp;
    stamp << name << "-" << std::put_time(local, "[%Y-%m-%d][%Hh%Mm%Ss]");
    const std::string base = stamp.str();

    fs::path candidate = fs::path(directory_) / (base + ".json");
    for (int n = 1; fs::exists(candidate); n++) {
        candidate = fs::path(directory_) / (base + "-" + std::to_string(n) + ".json");
    }
    return candidate.string();
}

std::string SnapshotStore::save(const std::string& name, const SnapshotData& data,
                                std::time_t when) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create snapshot directory " + directory_ +
                                 ": " + ec.message());
    }

    json doc = json::object();
    for (const auto& [key, row] : data.rows) {
        doc[key] = row;
    }
    doc[ROUND_KEY] = data.round;
    doc[EXPLORATION_KEY] = data.exploration;

    const std::string path = uniquePath(name, when);
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write snapshot: " + tmp_path);
        }
        out << doc.dump(4) << "\n";
        out.flush();
        if (!out) {
            fs::remove(tmp_path, ec);
            throw std::runtime_error("Failed while writing snapshot: " + tmp_path);
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw std::runtime_error("Cannot move snapshot into place: " + path);
    }
    return path;
}

} // namespace uavrl
