#include <crossfire/strategy/signal_frame.hpp>
#include <algorithm>

namespace crossfire::strategy {

std::vector<core::SignalType> suppress_repeats(const std::vector<core::SignalType>& raw) {
    std::vector<core::SignalType> out;
    out.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        if (i > 0 && raw[i] == raw[i - 1]) {
            out.push_back(core::SignalType::HOLD);
        } else {
            out.push_back(raw[i]);
        }
    }
    return out;
}

std::vector<core::Signal> SignalFrame::events() const {
    std::vector<core::Signal> out;
    for (size_t i = 0; i < signals.size() && i < data.bars.size(); ++i) {
        if (signals[i] == core::SignalType::HOLD) {
            continue;
        }
        const auto& bar = data.bars[i];
        out.emplace_back(data.bars.symbol(), signals[i], bar.close, bar.timestamp);
    }
    return out;
}

size_t SignalFrame::count(core::SignalType type) const {
    return static_cast<size_t>(std::count(signals.begin(), signals.end(), type));
}

} // namespace crossfire::strategy
