#include <crossfire/core/series.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace crossfire::core {

Series::Series(std::vector<Timestamp> index, std::vector<Value> values)
    : index_(std::move(index)), values_(std::move(values)) {
    if (index_.size() != values_.size()) {
        throw std::invalid_argument("Series index has " + std::to_string(index_.size()) +
                                    " entries but " + std::to_string(values_.size()) + " values");
    }
    for (size_t i = 1; i < index_.size(); ++i) {
        if (index_[i] <= index_[i - 1]) {
            throw std::invalid_argument("Series index must be strictly increasing");
        }
    }
}

Series Series::undefined_like(const std::vector<Timestamp>& index) {
    return Series(index, std::vector<Value>(index.size()));
}

Series Series::constant_like(const std::vector<Timestamp>& index, double value) {
    return Series(index, std::vector<Value>(index.size(), value));
}

Series::Value Series::at_timestamp(Timestamp ts) const {
    auto it = std::lower_bound(index_.begin(), index_.end(), ts);
    if (it == index_.end() || *it != ts) {
        return std::nullopt;
    }
    return values_[static_cast<size_t>(it - index_.begin())];
}

bool Series::all_undefined() const {
    return std::none_of(values_.begin(), values_.end(),
                        [](const Value& v) { return v.has_value(); });
}

size_t Series::defined_count() const {
    return static_cast<size_t>(std::count_if(values_.begin(), values_.end(),
                                             [](const Value& v) { return v.has_value(); }));
}

void Series::push_back(Timestamp ts, Value value) {
    if (!index_.empty() && ts <= index_.back()) {
        throw std::invalid_argument("Series timestamp " + std::to_string(ts) +
                                    " does not follow " + std::to_string(index_.back()));
    }
    index_.push_back(ts);
    values_.push_back(value);
}

} // namespace crossfire::core
