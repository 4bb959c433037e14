// applications/analyze_app/main.cpp
#include "crossfire/core/engine.hpp"
#include "crossfire/data/csv_loader.hpp"
#include "crossfire/backtest/report_writer.hpp"
#include "crossfire/strategy/ema_rsi_volume_strategy.hpp"
#include "crossfire/utils/config.hpp"
#include "crossfire/utils/logger.hpp"
#include <iostream>
#include <string>
#include <memory>

using crossfire::utils::Logger;

int main(int argc, char** argv) {
    try {
        // Load configuration
        const std::string config_file = argc > 1 ? argv[1] : "crossfire.conf";
        auto config = crossfire::utils::Config::instance();
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        Logger::set_level(Logger::parse_level(config->get("log.level", "INFO")));

        const std::string symbol = config->get("data.symbol", "UNKNOWN");
        const std::string data_file = config->get("data.file", "data.csv");

        auto table = crossfire::data::CsvLoader::load(data_file, symbol);

        auto strategy = std::make_shared<crossfire::strategy::EmaRsiVolumeStrategy>();
        strategy->configure(*config);

        crossfire::core::Engine engine(crossfire::core::EngineConfiguration::from_config(*config));
        engine.set_strategy(strategy);

        auto result = engine.analyze(table);
        if (!result.success) {
            std::cerr << "Analysis failed: " << (result.status ? result.status->message : "unknown error")
                      << std::endl;
            return 1;
        }

        if (result.status && result.status->code == crossfire::core::ErrorCode::DATA_UNAVAILABLE) {
            Logger::warn() << "No data for " << symbol << ", nothing to report" << Logger::endl;
            return 2;
        }

        crossfire::backtest::ReportWriter::log_summary(symbol, *result.frame, *result.backtest);

        const std::string output_file = config->get("report.output_file", "signals.csv");
        if (!output_file.empty() &&
            !crossfire::backtest::ReportWriter::write_csv(*result.frame, output_file)) {
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
