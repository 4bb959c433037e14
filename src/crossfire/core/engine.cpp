#include <crossfire/core/engine.hpp>
#include <crossfire/strategy/ema_rsi_volume_strategy.hpp>
#include <crossfire/utils/logger.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

namespace crossfire::core {

EngineConfiguration EngineConfiguration::from_config(const utils::Config& config) {
    EngineConfiguration out;
    out.indicators = indicators::IndicatorConfig::from_config(config);
    out.backtest = backtest::BacktestConfiguration::from_config(config);
    return out;
}

Engine::Engine(EngineConfiguration config)
    : config_(config), strategy_(std::make_shared<strategy::EmaRsiVolumeStrategy>()) {}

void Engine::configure(const EngineConfiguration& config) {
    config_ = config;
}

void Engine::set_strategy(strategy::StrategyPtr strategy) {
    if (!strategy) {
        throw std::invalid_argument("Engine strategy must not be null");
    }
    strategy_ = std::move(strategy);
}

AnalysisResult Engine::analyze(const OhlcvTable& table) const {
    AnalysisResult result;

    if (table.empty()) {
        utils::Logger::warn() << "No data available for " << table.symbol()
                              << ", nothing to analyze" << utils::Logger::endl;
        result.success = true;
        result.status = Error(ErrorCode::DATA_UNAVAILABLE, "empty OHLCV table for " + table.symbol());
        strategy::SignalFrame frame;
        frame.data.bars = table;
        result.frame = std::move(frame);
        result.backtest.emplace();
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();

    try {
        indicators::IndicatorBuilder builder(config_.indicators);
        auto indicator_table = builder.build(table);

        auto frame = strategy_->generate_signals(indicator_table);

        backtest::BacktestScorer scorer(config_.backtest);
        auto scored = scorer.score(frame);

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        utils::Logger::debug() << "Analyzed " << table.size() << " bars of " << table.symbol()
                               << " with " << strategy_->name() << " in " << duration << "us"
                               << utils::Logger::endl;

        result.success = true;
        result.frame = std::move(frame);
        result.backtest = std::move(scored);
    } catch (const std::exception& e) {
        utils::Logger::error() << "Analysis of " << table.symbol() << " failed: " << e.what()
                               << utils::Logger::endl;
        result = AnalysisResult{};
        result.status = Error(ErrorCode::UNEXPECTED, e.what());
    }

    return result;
}

} // namespace crossfire::core
