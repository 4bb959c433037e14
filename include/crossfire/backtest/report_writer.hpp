#pragma once
#include <crossfire/backtest/backtest_scorer.hpp>
#include <crossfire/strategy/signal_frame.hpp>
#include <ostream>
#include <string>

namespace crossfire::backtest {

// Hands results to the plotting/reporting side: the annotated table as CSV
// and a one-screen summary through the logger.
class ReportWriter {
public:
    // timestamp,open,high,low,close,volume,ema_fast,ema_slow,rsi,volume_ma,volume_filter,signal
    // Undefined values are written as empty cells.
    static void write_csv(const strategy::SignalFrame& frame, std::ostream& out);
    static bool write_csv(const strategy::SignalFrame& frame, const std::string& path);

    static void log_summary(const std::string& symbol, const strategy::SignalFrame& frame,
                            const BacktestResult& result);
};

} // namespace crossfire::backtest
