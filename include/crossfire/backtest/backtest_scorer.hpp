#pragma once

#include <crossfire/core/series.hpp>
#include <crossfire/strategy/signal_frame.hpp>
#include <crossfire/utils/config.hpp>
#include <optional>
#include <vector>

namespace crossfire::backtest {

struct PerformanceMetrics {
    double total_return = 0.0;
    double sharpe_ratio = 0.0;
    double volatility = 0.0;           // annualised
    double max_drawdown = 0.0;         // fraction of the running peak
    double max_drawdown_duration = 0.0; // bars
    double exposure = 0.0;             // share of scored bars with a position
    double win_rate = 0.0;             // share of in-market bars with a positive return
    int buy_signals = 0;
    int sell_signals = 0;
};

struct BacktestResult {
    // Undefined for fewer than two rows
    std::optional<double> cumulative_return;

    // s[i] = r[i] * signal[i-1]; undefined at i = 0
    core::Series strategy_returns;

    // Running product of (1 + s[i]), starting at 1.0
    std::vector<double> equity_curve;

    PerformanceMetrics metrics;
};

struct BacktestConfiguration {
    int periods_per_year = 252;
    double risk_free_rate = 0.0;

    // Reads the "backtest." keys
    static BacktestConfiguration from_config(const utils::Config& config);
};

// Scores a signal series by holding, on each bar, the position of the
// previous bar's signal. No look-ahead: the signal on bar i only earns bar i+1.
class BacktestScorer {
public:
    explicit BacktestScorer(BacktestConfiguration config = BacktestConfiguration());

    std::optional<double> cumulative_return(const strategy::SignalFrame& frame) const;

    BacktestResult score(const strategy::SignalFrame& frame) const;

    // Helper methods
    double calculate_sharpe_ratio(const std::vector<double>& returns) const;
    double calculate_volatility(const std::vector<double>& returns) const;
    static double calculate_max_drawdown(const std::vector<double>& curve, double& duration);

    const BacktestConfiguration& config() const { return config_; }

private:
    BacktestConfiguration config_;
};

} // namespace crossfire::backtest
