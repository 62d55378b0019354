#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace uavrl {

// ─── Value Table ───────────────────────────────────────────────
// Sparse state-key → action-value mapping. Rows are created lazily
// (all zeros) on first reference, so reads never fail on unseen
// states. The table grows with every distinct key it is asked about.

class ValueTable {
public:
    using Row = std::vector<double>;

    explicit ValueTable(size_t num_actions);

    /// Row for a state key, created as zeros on first access.
    Row& get(const std::string& key);

    /// Single entry. Throws std::out_of_range on a bad action index.
    double get(const std::string& key, int action);

    /// Mutate a single entry in place.
    void set(const std::string& key, int action, double value);

    /// Replace a whole row. The row length must equal numActions().
    void assign(const std::string& key, Row values);

    bool contains(const std::string& key) const {
        return rows_.count(key) > 0;
    }

    size_t size() const { return rows_.size(); }
    size_t numActions() const { return num_actions_; }

    const std::unordered_map<std::string, Row>& rows() const { return rows_; }

    void clear() { rows_.clear(); }

private:
    size_t num_actions_;
    std::unordered_map<std::string, Row> rows_;

    void checkAction(int action) const;
};

} // namespace uavrl
