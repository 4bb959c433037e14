#pragma once

#include <crossfire/backtest/backtest_scorer.hpp>
#include <crossfire/core/error.hpp>
#include <crossfire/core/market_data.hpp>
#include <crossfire/indicators/indicator_builder.hpp>
#include <crossfire/strategy/strategy_base.hpp>
#include <crossfire/utils/config.hpp>
#include <optional>

namespace crossfire::core {

struct EngineConfiguration {
    indicators::IndicatorConfig indicators;
    backtest::BacktestConfiguration backtest;

    static EngineConfiguration from_config(const utils::Config& config);
};

struct AnalysisResult {
    // false only when the pipeline itself failed; no partial output then
    bool success = false;

    // DATA_UNAVAILABLE for empty input, UNEXPECTED for a failed run
    std::optional<Error> status;

    std::optional<strategy::SignalFrame> frame;
    std::optional<backtest::BacktestResult> backtest;

    std::optional<double> cumulative_return() const {
        return backtest ? backtest->cumulative_return : std::nullopt;
    }
};

// Runs indicators -> signals -> scoring once per call. Holds no per-call
// state, so one instance may serve many instruments.
class Engine {
public:
    // Uses EmaRsiVolumeStrategy unless another strategy is set
    explicit Engine(EngineConfiguration config = EngineConfiguration());

    void configure(const EngineConfiguration& config);
    const EngineConfiguration& config() const { return config_; }

    void set_strategy(strategy::StrategyPtr strategy);
    const strategy::StrategyPtr& strategy() const { return strategy_; }

    // Never throws
    AnalysisResult analyze(const OhlcvTable& table) const;

private:
    EngineConfiguration config_;
    strategy::StrategyPtr strategy_;
};

} // namespace crossfire::core
