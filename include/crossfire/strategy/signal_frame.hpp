#pragma once
#include <crossfire/core/signal.hpp>
#include <crossfire/indicators/indicator_builder.hpp>
#include <vector>

namespace crossfire::strategy {

// Indicator table with the Signal column attached
struct SignalFrame {
    indicators::IndicatorTable data;
    std::vector<core::SignalType> raw_signals;  // before chatter suppression
    std::vector<core::SignalType> signals;

    size_t size() const { return signals.size(); }
    bool empty() const { return signals.empty(); }

    // Non-HOLD rows, oldest first
    std::vector<core::Signal> events() const;

    size_t count(core::SignalType type) const;
};

// signals[i] = HOLD whenever raw[i] == raw[i-1]; raw[0] stands.
// Zero runs are collapsed as well, which leaves them unchanged.
std::vector<core::SignalType> suppress_repeats(const std::vector<core::SignalType>& raw);

} // namespace crossfire::strategy
