#include <crossfire/indicators/indicator_builder.hpp>
#include <crossfire/indicators/moving_average.hpp>
#include <crossfire/indicators/rsi.hpp>
#include <crossfire/utils/logger.hpp>
#include <cmath>
#include <string>

namespace crossfire::indicators {

namespace {

// Reads a window length; anything below 1 keeps the default
size_t positive_length(const utils::Config& config, const std::string& key, size_t default_value) {
    const long long value = config.get<long long>(key, static_cast<long long>(default_value));
    if (value <= 0) {
        utils::Logger::warn() << "Ignoring " << key << " = " << value << ", using "
                              << default_value << utils::Logger::endl;
        return default_value;
    }
    return static_cast<size_t>(value);
}

} // namespace

IndicatorConfig IndicatorConfig::from_config(const utils::Config& config) {
    IndicatorConfig out;
    out.ema_fast_span = positive_length(config, "indicators.ema_fast_span", out.ema_fast_span);
    out.ema_slow_span = positive_length(config, "indicators.ema_slow_span", out.ema_slow_span);
    out.rsi_period = positive_length(config, "indicators.rsi_period", out.rsi_period);
    out.volume_ma_window = positive_length(config, "indicators.volume_ma_window", out.volume_ma_window);

    const double multiplier = config.get<double>("indicators.volume_multiplier", out.volume_multiplier);
    if (std::isfinite(multiplier) && multiplier > 0.0) {
        out.volume_multiplier = multiplier;
    } else {
        utils::Logger::warn() << "Ignoring indicators.volume_multiplier = " << multiplier
                              << ", using " << out.volume_multiplier << utils::Logger::endl;
    }
    return out;
}

IndicatorBuilder::IndicatorBuilder(IndicatorConfig config) : config_(config) {}

core::Series IndicatorBuilder::fill_volume(const core::Series& volume) {
    std::vector<core::Series::Value> filled;
    filled.reserve(volume.size());

    core::Series::Value last;
    for (size_t i = 0; i < volume.size(); ++i) {
        // NaN and inf count as missing
        if (volume[i] && std::isfinite(*volume[i])) {
            last = volume[i];
        }
        filled.emplace_back(last ? *last : 0.0);
    }
    return core::Series(volume.index(), std::move(filled));
}

std::vector<bool> IndicatorBuilder::volume_filter(const std::vector<core::Timestamp>& index,
                                                  const core::Series& volume,
                                                  const core::Series& volume_ma,
                                                  double multiplier,
                                                  std::vector<core::Error>& diagnostics) {
    std::vector<bool> filter(index.size(), false);
    size_t unaligned = 0;

    for (size_t i = 0; i < index.size(); ++i) {
        const auto v = volume.at_timestamp(index[i]);
        const auto ma = volume_ma.at_timestamp(index[i]);
        if (!v || !ma) {
            ++unaligned;
            continue;
        }
        filter[i] = *v > multiplier * *ma;
    }

    if (unaligned > 0) {
        std::string message = "volume filter defaulted to false on " + std::to_string(unaligned) +
                              " of " + std::to_string(index.size()) + " rows";
        utils::Logger::warn() << message << utils::Logger::endl;
        diagnostics.emplace_back(core::ErrorCode::ALIGNMENT, std::move(message));
    }
    return filter;
}

IndicatorTable IndicatorBuilder::build(const core::OhlcvTable& table) const {
    IndicatorTable out;
    out.bars = table;

    if (table.empty()) {
        utils::Logger::warn() << "No data for " << table.symbol()
                              << ", skipping indicators" << utils::Logger::endl;
        out.diagnostics.emplace_back(core::ErrorCode::DATA_UNAVAILABLE, "empty OHLCV table");
        return out;
    }

    const auto index = table.timestamps();
    const auto closes = table.close_series();

    auto record = [&out](IndicatorResult result) {
        if (!result.ok()) {
            out.diagnostics.push_back(*result.error);
        }
        return std::move(result.series);
    };

    out.ema_fast = record(compute_ema(closes, config_.ema_fast_span));
    out.ema_slow = record(compute_ema(closes, config_.ema_slow_span));
    out.rsi = record(compute_rsi(closes, config_.rsi_period));

    if (!table.has_volume()) {
        // Nonsensical units, but it switches the volume confirmation off instead of failing
        const double mean_close = table.mean_close();
        utils::Logger::warn() << "No volume for " << table.symbol()
                              << ", volume filter disabled" << utils::Logger::endl;
        out.volume = core::Series::constant_like(index, mean_close);
        out.volume_ma = out.volume;
        out.volume_filter.assign(index.size(), true);
        out.volume_substituted = true;
    } else {
        out.volume = fill_volume(table.volume_series());
        out.volume_ma = rolling_mean(out.volume, config_.volume_ma_window, 1);
        out.volume_filter = volume_filter(index, out.volume, out.volume_ma,
                                          config_.volume_multiplier, out.diagnostics);
    }

    utils::Logger::debug() << "Built indicators for " << table.symbol() << " over "
                           << table.size() << " bars (" << out.ema_slow.defined_count()
                           << " with slow EMA, " << out.rsi.defined_count() << " with RSI)"
                           << utils::Logger::endl;
    return out;
}

} // namespace crossfire::indicators
