#include <crossfire/strategy/ema_rsi_volume_strategy.hpp>
#include <crossfire/utils/logger.hpp>
#include <stdexcept>

namespace crossfire::strategy {

EmaRsiVolumeStrategy::EmaRsiVolumeStrategy() : StrategyBase("EmaRsiVolume") {}

void EmaRsiVolumeStrategy::configure(const std::unordered_map<std::string, std::string>& config) {
    StrategyBase::configure(config);

    auto read = [this](const std::string& key, double current) {
        const std::string text = get_config(key);
        if (text.empty()) {
            return current;
        }
        try {
            return std::stod(text);
        } catch (const std::exception&) {
            utils::Logger::warn() << name_ << ": ignoring non-numeric " << key << "=" << text
                                  << utils::Logger::endl;
            return current;
        }
    };

    rsi_oversold_ = read("rsi_oversold", rsi_oversold_);
    rsi_overbought_ = read("rsi_overbought", rsi_overbought_);
}

void EmaRsiVolumeStrategy::configure(const utils::Config& config) {
    std::unordered_map<std::string, std::string> values;
    for (const char* key : {"rsi_oversold", "rsi_overbought"}) {
        const std::string full_key = std::string("strategy.") + key;
        if (config.has(full_key)) {
            values[key] = config.get(full_key, "");
        }
    }
    configure(values);
}

core::SignalType EmaRsiVolumeStrategy::evaluate_row(const indicators::IndicatorTable& data,
                                                    size_t row) const {
    const auto& bar = data.bars[row];

    const auto ema_fast = data.ema_fast.at_timestamp(bar.timestamp);
    const auto ema_slow = data.ema_slow.at_timestamp(bar.timestamp);
    const auto rsi = data.rsi.at_timestamp(bar.timestamp);
    const bool volume_ok = row < data.volume_filter.size() && data.volume_filter[row];

    if (!ema_fast || !ema_slow || !rsi || !volume_ok) {
        return core::SignalType::HOLD;
    }

    if (*ema_fast > *ema_slow && *rsi < rsi_oversold_ && bar.close > bar.open) {
        return core::SignalType::BUY;
    }
    if (*ema_fast < *ema_slow && *rsi > rsi_overbought_ && bar.close < bar.open) {
        return core::SignalType::SELL;
    }
    return core::SignalType::HOLD;
}

SignalFrame EmaRsiVolumeStrategy::generate_signals(const indicators::IndicatorTable& data) const {
    SignalFrame frame;
    frame.data = data;

    if (data.empty()) {
        return frame;
    }

    frame.raw_signals.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        frame.raw_signals.push_back(evaluate_row(data, i));
    }
    frame.signals = suppress_repeats(frame.raw_signals);

    utils::Logger::debug() << name_ << " on " << data.bars.symbol() << ": "
                           << frame.count(core::SignalType::BUY) << " buy, "
                           << frame.count(core::SignalType::SELL) << " sell signals"
                           << utils::Logger::endl;
    return frame;
}

} // namespace crossfire::strategy
