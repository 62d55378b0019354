#include "learning/value_table.hpp"
#include <stdexcept>

namespace uavrl {

ValueTable::ValueTable(size_t num_actions) : num_actions_(num_actions) {
    if (num_actions == 0) {
        throw std::invalid_argument("ValueTable needs at least one action");
    }
}

ValueTable::Row& ValueTable::get(const std::string& key) {
    auto it = rows_.find(key);
    if (it == rows_.end()) {
        it = rows_.emplace(key, Row(num_actions_, 0.0)).first;
    }
    return it->second;
}

double ValueTable::get(const std::string& key, int action) {
    checkAction(action);
    return get(key)[static_cast<size_t>(action)];
}

void ValueTable::set(const std::string& key, int action, double value) {
    checkAction(action);
    get(key)[static_cast<size_t>(action)] = value;
}

void ValueTable::assign(const std::string& key, Row values) {
    if (values.size() != num_actions_) {
        throw std::invalid_argument("Row for " + key + " has " +
            std::to_string(values.size()) + " values, expected " +
            std::to_string(num_actions_));
    }
    rows_[key] = std::move(values);
}

void ValueTable::checkAction(int action) const {
    if (action < 0 || static_cast<size_t>(action) >= num_actions_) {
        throw std::out_of_range("Action index out of range: " + std::to_string(action));
    }
}

} // namespace uavrl
