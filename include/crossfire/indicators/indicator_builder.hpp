#pragma once
#include <crossfire/core/error.hpp>
#include <crossfire/core/market_data.hpp>
#include <crossfire/core/series.hpp>
#include <crossfire/utils/config.hpp>
#include <cstddef>
#include <vector>

namespace crossfire::indicators {

struct IndicatorConfig {
    size_t ema_fast_span = 20;
    size_t ema_slow_span = 50;
    size_t rsi_period = 14;
    size_t volume_ma_window = 20;
    double volume_multiplier = 1.2;

    // Reads the "indicators." keys, keeping these defaults for missing ones
    static IndicatorConfig from_config(const utils::Config& config);
};

// The OHLCV table plus every derived column, all on the table's index.
struct IndicatorTable {
    core::OhlcvTable bars;
    core::Series volume;      // after the fill / substitution policy
    core::Series ema_fast;
    core::Series ema_slow;
    core::Series rsi;
    core::Series volume_ma;
    std::vector<bool> volume_filter;

    // Volume was absent and replaced by the mean close; the filter is forced on
    bool volume_substituted = false;

    // Recovered data-quality problems, in the order they were met
    std::vector<core::Error> diagnostics;

    size_t size() const { return bars.size(); }
    bool empty() const { return bars.empty(); }
};

class IndicatorBuilder {
public:
    explicit IndicatorBuilder(IndicatorConfig config = IndicatorConfig());

    // Never modifies `table`. An empty table gives an empty IndicatorTable
    // carrying a DATA_UNAVAILABLE diagnostic.
    IndicatorTable build(const core::OhlcvTable& table) const;

    const IndicatorConfig& config() const { return config_; }

    // Forward fill, then zero fill whatever precedes the first defined value
    static core::Series fill_volume(const core::Series& volume);

    // volume > multiplier * volume_ma, joined on timestamp; a row that cannot
    // be joined is false and reported through `diagnostics`
    static std::vector<bool> volume_filter(const std::vector<core::Timestamp>& index,
                                           const core::Series& volume,
                                           const core::Series& volume_ma,
                                           double multiplier,
                                           std::vector<core::Error>& diagnostics);

private:
    IndicatorConfig config_;
};

} // namespace crossfire::indicators
