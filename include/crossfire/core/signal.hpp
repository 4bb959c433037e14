#pragma once
#include <crossfire/core/series.hpp>
#include <string>

namespace crossfire::core {

// Underlying value is the position the signal stands for
enum class SignalType : int {
    SELL = -1,
    HOLD = 0,
    BUY = 1
};

inline int to_int(SignalType type) { return static_cast<int>(type); }

const char* to_string(SignalType type);

// A fired (non-HOLD) signal, as handed to reporting
struct Signal {
    std::string symbol;
    SignalType type;
    double price = 0.0;
    Timestamp timestamp = 0;

    Signal();
    Signal(const std::string& sym, SignalType t, double p, Timestamp ts);
};

} // namespace crossfire::core
