#include <crossfire/backtest/backtest_scorer.hpp>
#include <crossfire/utils/logger.hpp>
#include <cmath>
#include <numeric>

namespace crossfire::backtest {

namespace {

core::SignalType signal_at(const strategy::SignalFrame& frame, size_t i) {
    return i < frame.signals.size() ? frame.signals[i] : core::SignalType::HOLD;
}

} // namespace

BacktestConfiguration BacktestConfiguration::from_config(const utils::Config& config) {
    BacktestConfiguration out;
    out.periods_per_year = config.get<int>("backtest.periods_per_year", out.periods_per_year);
    out.risk_free_rate = config.get<double>("backtest.risk_free_rate", out.risk_free_rate);
    return out;
}

BacktestScorer::BacktestScorer(BacktestConfiguration config) : config_(config) {}

std::optional<double> BacktestScorer::cumulative_return(const strategy::SignalFrame& frame) const {
    return score(frame).cumulative_return;
}

BacktestResult BacktestScorer::score(const strategy::SignalFrame& frame) const {
    BacktestResult result;
    const auto& bars = frame.data.bars;
    const size_t n = bars.size();

    result.metrics.buy_signals = static_cast<int>(frame.count(core::SignalType::BUY));
    result.metrics.sell_signals = static_cast<int>(frame.count(core::SignalType::SELL));

    std::vector<core::Series::Value> strategy_returns(n);
    result.equity_curve.reserve(n);

    std::vector<double> scored;  // defined s[i]
    size_t in_market = 0;
    size_t winners = 0;
    double equity = 1.0;

    for (size_t i = 0; i < n; ++i) {
        if (i > 0 && bars[i - 1].close != 0.0) {
            const double bar_return = bars[i].close / bars[i - 1].close - 1.0;
            const int position = core::to_int(signal_at(frame, i - 1));
            const double s = bar_return * position;

            strategy_returns[i] = s;
            scored.push_back(s);
            equity *= 1.0 + s;

            if (position != 0) {
                ++in_market;
                if (s > 0.0) {
                    ++winners;
                }
            }
        }
        result.equity_curve.push_back(equity);
    }

    result.strategy_returns = core::Series(bars.timestamps(), std::move(strategy_returns));

    if (n < 2) {
        utils::Logger::debug() << "Backtest needs at least 2 bars, got " << n << utils::Logger::endl;
        return result;
    }

    result.cumulative_return = equity - 1.0;

    auto& m = result.metrics;
    m.total_return = *result.cumulative_return;
    m.sharpe_ratio = calculate_sharpe_ratio(scored);
    m.volatility = calculate_volatility(scored);
    m.max_drawdown = calculate_max_drawdown(result.equity_curve, m.max_drawdown_duration);
    m.exposure = static_cast<double>(in_market) / static_cast<double>(n - 1);
    m.win_rate = in_market > 0 ? static_cast<double>(winners) / static_cast<double>(in_market) : 0.0;

    return result;
}

double BacktestScorer::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }

    return std::sqrt(sq_sum / returns.size()) * std::sqrt(static_cast<double>(config_.periods_per_year));
}

double BacktestScorer::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double annualized_std_dev = calculate_volatility(returns);

    if (annualized_std_dev < 0.000001) {
        return 0.0;
    }

    double annualized_return = mean * config_.periods_per_year;
    return (annualized_return - config_.risk_free_rate) / annualized_std_dev;
}

double BacktestScorer::calculate_max_drawdown(const std::vector<double>& curve, double& duration) {
    if (curve.size() < 2) {
        duration = 0.0;
        return 0.0;
    }

    double max_dd = 0.0;
    double peak = curve[0];
    double max_duration = 0.0;
    double current_duration = 0.0;

    for (size_t i = 1; i < curve.size(); i++) {
        if (curve[i] > peak) {
            peak = curve[i];
            current_duration = 0.0;
        } else {
            current_duration += 1.0;
            double dd = peak > 0.0 ? (peak - curve[i]) / peak : 0.0;
            if (dd > max_dd) {
                max_dd = dd;
                max_duration = current_duration;
            }
        }
    }

    duration = max_duration;
    return max_dd;
}

} // namespace crossfire::backtest
