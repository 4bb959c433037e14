#include "crossfire/core/signal.hpp"

namespace crossfire::core {

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::BUY:
            return "BUY";
        case SignalType::SELL:
            return "SELL";
        case SignalType::HOLD:
            return "HOLD";
    }
    return "HOLD";
}

Signal::Signal()
    : symbol(""), type(SignalType::HOLD), price(0.0), timestamp(0) {
}

Signal::Signal(const std::string& sym, SignalType t, double p, Timestamp ts)
    : symbol(sym), type(t), price(p), timestamp(ts) {
}

} // namespace crossfire::core
