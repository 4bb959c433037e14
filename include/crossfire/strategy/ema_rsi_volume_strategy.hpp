#pragma once
#include <crossfire/strategy/strategy_base.hpp>
#include <crossfire/core/signal.hpp>
#include <crossfire/utils/config.hpp>

namespace crossfire::strategy {

// Trend (fast EMA vs slow EMA) + RSI extreme + volume spike + candle direction.
//
//   BUY  : ema_fast > ema_slow, rsi < oversold,   volume filter, close > open
//   SELL : ema_fast < ema_slow, rsi > overbought, volume filter, close < open
//
// Any undefined indicator makes its condition false. A signal equal to the
// previous row's raw signal is dropped, so signals only fire on change.
class EmaRsiVolumeStrategy : public StrategyBase {
public:
    EmaRsiVolumeStrategy();

    SignalFrame generate_signals(const indicators::IndicatorTable& data) const override;

    // Keys: rsi_oversold, rsi_overbought
    void configure(const std::unordered_map<std::string, std::string>& config) override;

    // Reads the "strategy." keys
    void configure(const utils::Config& config);

    // Raw (unsuppressed) signal for one row
    core::SignalType evaluate_row(const indicators::IndicatorTable& data, size_t row) const;

    double rsi_oversold() const { return rsi_oversold_; }
    double rsi_overbought() const { return rsi_overbought_; }

private:
    double rsi_oversold_ = 30.0;
    double rsi_overbought_ = 70.0;
};

} // namespace crossfire::strategy
