#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace crossfire::core {

using Timestamp = int64_t;

// A labelled column: one optional value per timestamp, index strictly increasing.
// nullopt marks a value that is undefined (warm-up, missing data, failed computation).
class Series {
public:
    using Value = std::optional<double>;

    Series() = default;

    // Throws std::invalid_argument if the sizes differ or the index is not strictly increasing
    Series(std::vector<Timestamp> index, std::vector<Value> values);

    static Series undefined_like(const std::vector<Timestamp>& index);
    static Series constant_like(const std::vector<Timestamp>& index, double value);

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const std::vector<Timestamp>& index() const { return index_; }
    const std::vector<Value>& values() const { return values_; }

    const Value& operator[](size_t i) const { return values_[i]; }
    Timestamp timestamp(size_t i) const { return index_[i]; }

    // Join on the timestamp key; nullopt when the key is absent or the value undefined
    Value at_timestamp(Timestamp ts) const;

    bool all_undefined() const;
    size_t defined_count() const;

    // Throws std::invalid_argument if ts does not extend the index
    void push_back(Timestamp ts, Value value);

private:
    std::vector<Timestamp> index_;
    std::vector<Value> values_;
};

} // namespace crossfire::core
