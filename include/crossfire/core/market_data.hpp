#pragma once
#include <crossfire/core/series.hpp>
#include <optional>
#include <string>
#include <vector>

namespace crossfire::core {

// One OHLCV bar. Volume may be missing for individual bars or for a whole feed.
struct Bar {
    Timestamp timestamp;
    double open;
    double high;
    double low;
    double close;
    std::optional<double> volume;

    Bar();

    Bar(Timestamp ts, double o, double h, double l, double c,
        std::optional<double> vol = std::nullopt);
};

// Time-indexed OHLCV bars for one instrument, timestamps strictly increasing.
class OhlcvTable {
public:
    OhlcvTable() = default;
    explicit OhlcvTable(std::string symbol);

    // Throws std::invalid_argument if the bar's timestamp does not follow the last one
    void append(const Bar& bar);

    const std::string& symbol() const { return symbol_; }
    void set_symbol(const std::string& symbol) { symbol_ = symbol; }

    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& operator[](size_t i) const { return bars_[i]; }
    const std::vector<Bar>& bars() const { return bars_; }

    std::vector<Timestamp> timestamps() const;
    Series open_series() const;
    Series close_series() const;
    Series volume_series() const;

    // True when at least one bar carries a volume
    bool has_volume() const;

    // 0.0 for an empty table
    double mean_close() const;

private:
    std::string symbol_;
    std::vector<Bar> bars_;
};

} // namespace crossfire::core
