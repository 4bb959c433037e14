#include <crossfire/core/market_data.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace crossfire::core {

Bar::Bar()
    : timestamp(0), open(0.0), high(0.0), low(0.0), close(0.0) {}

Bar::Bar(Timestamp ts, double o, double h, double l, double c, std::optional<double> vol)
    : timestamp(ts), open(o), high(h), low(l), close(c), volume(vol) {}

OhlcvTable::OhlcvTable(std::string symbol) : symbol_(std::move(symbol)) {}

void OhlcvTable::append(const Bar& bar) {
    if (!bars_.empty() && bar.timestamp <= bars_.back().timestamp) {
        throw std::invalid_argument("Bar timestamp " + std::to_string(bar.timestamp) +
                                    " must be greater than " +
                                    std::to_string(bars_.back().timestamp));
    }
    bars_.push_back(bar);
}

std::vector<Timestamp> OhlcvTable::timestamps() const {
    std::vector<Timestamp> index;
    index.reserve(bars_.size());
    for (const auto& bar : bars_) {
        index.push_back(bar.timestamp);
    }
    return index;
}

Series OhlcvTable::open_series() const {
    std::vector<Series::Value> values;
    values.reserve(bars_.size());
    for (const auto& bar : bars_) {
        values.emplace_back(bar.open);
    }
    return Series(timestamps(), std::move(values));
}

Series OhlcvTable::close_series() const {
    std::vector<Series::Value> values;
    values.reserve(bars_.size());
    for (const auto& bar : bars_) {
        values.emplace_back(bar.close);
    }
    return Series(timestamps(), std::move(values));
}

Series OhlcvTable::volume_series() const {
    std::vector<Series::Value> values;
    values.reserve(bars_.size());
    for (const auto& bar : bars_) {
        values.push_back(bar.volume);
    }
    return Series(timestamps(), std::move(values));
}

bool OhlcvTable::has_volume() const {
    return std::any_of(bars_.begin(), bars_.end(),
                       [](const Bar& bar) { return bar.volume && std::isfinite(*bar.volume); });
}

double OhlcvTable::mean_close() const {
    if (bars_.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(bars_.begin(), bars_.end(), 0.0,
                                 [](double acc, const Bar& bar) { return acc + bar.close; });
    return sum / static_cast<double>(bars_.size());
}

} // namespace crossfire::core
