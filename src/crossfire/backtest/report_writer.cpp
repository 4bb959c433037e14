#include <crossfire/backtest/report_writer.hpp>
#include <crossfire/utils/logger.hpp>
#include <fstream>
#include <iomanip>

namespace crossfire::backtest {

namespace {

void write_value(std::ostream& out, const core::Series::Value& value) {
    if (value) {
        out << *value;
    }
}

void write_column(std::ostream& out, const core::Series& series, core::Timestamp ts) {
    out << ',';
    write_value(out, series.at_timestamp(ts));
}

} // namespace

void ReportWriter::write_csv(const strategy::SignalFrame& frame, std::ostream& out) {
    const auto& data = frame.data;
    out << "timestamp,open,high,low,close,volume,ema_fast,ema_slow,rsi,volume_ma,volume_filter,signal\n";
    out << std::setprecision(10);

    for (size_t i = 0; i < data.bars.size(); ++i) {
        const auto& bar = data.bars[i];
        out << bar.timestamp << ',' << bar.open << ',' << bar.high << ',' << bar.low << ',' << bar.close;
        write_column(out, data.volume, bar.timestamp);
        write_column(out, data.ema_fast, bar.timestamp);
        write_column(out, data.ema_slow, bar.timestamp);
        write_column(out, data.rsi, bar.timestamp);
        write_column(out, data.volume_ma, bar.timestamp);

        const bool filter = i < data.volume_filter.size() && data.volume_filter[i];
        const int signal = i < frame.signals.size() ? core::to_int(frame.signals[i]) : 0;
        out << ',' << (filter ? 1 : 0) << ',' << signal << '\n';
    }
}

bool ReportWriter::write_csv(const strategy::SignalFrame& frame, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to open report file: " << path << utils::Logger::endl;
        return false;
    }

    write_csv(frame, file);
    file.flush();
    if (!file) {
        utils::Logger::error() << "Failed writing report file: " << path << utils::Logger::endl;
        return false;
    }

    utils::Logger::info() << "Wrote " << frame.size() << " rows to " << path << utils::Logger::endl;
    return true;
}

void ReportWriter::log_summary(const std::string& symbol, const strategy::SignalFrame& frame,
                               const BacktestResult& result) {
    const auto& m = result.metrics;
    utils::Logger::info() << symbol << ": " << frame.size() << " bars, "
                          << m.buy_signals << " buy / " << m.sell_signals << " sell signals"
                          << utils::Logger::endl;

    for (const auto& event : frame.events()) {
        utils::Logger::info() << "  " << event.timestamp << " " << core::to_string(event.type)
                              << " @ " << event.price << utils::Logger::endl;
    }

    if (!result.cumulative_return) {
        utils::Logger::info() << symbol << ": not enough bars to score the strategy" << utils::Logger::endl;
        return;
    }

    utils::Logger::info() << std::fixed << std::setprecision(2)
                          << "Strategy return: " << (*result.cumulative_return * 100.0) << "%"
                          << " | Sharpe: " << m.sharpe_ratio
                          << " | MaxDD: " << (m.max_drawdown * 100.0) << "%"
                          << " | Exposure: " << (m.exposure * 100.0) << "%"
                          << utils::Logger::endl;
}

} // namespace crossfire::backtest
