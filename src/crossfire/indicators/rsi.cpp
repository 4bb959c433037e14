#include <crossfire/indicators/rsi.hpp>
#include <crossfire/indicators/moving_average.hpp>
#include <crossfire/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace crossfire::indicators {

double rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return avg_gain > 0.0 ? 100.0 : 50.0;
    }
    const double rs = avg_gain / avg_loss;
    return std::clamp(100.0 - (100.0 / (1.0 + rs)), 0.0, 100.0);
}

IndicatorResult compute_rsi(const core::Series& closes, size_t period) {
    auto fail = [&closes](const std::string& reason) {
        utils::Logger::warn() << "RSI computation failed: " << reason << utils::Logger::endl;
        return IndicatorResult::failure(closes.index(), "RSI: " + reason);
    };

    if (period == 0) {
        return fail("period must be positive");
    }

    std::vector<core::Series::Value> gains;
    std::vector<core::Series::Value> losses;
    gains.reserve(closes.size());
    losses.reserve(closes.size());

    for (size_t i = 0; i < closes.size(); ++i) {
        const auto& close = closes[i];
        if (!close || !std::isfinite(*close)) {
            return fail("undefined or non-finite close at row " + std::to_string(i));
        }
        // The first row has no delta and counts as a zero gain and zero loss
        const double change = i == 0 ? 0.0 : *close - *closes[i - 1];
        gains.emplace_back(std::max(change, 0.0));
        losses.emplace_back(std::max(-change, 0.0));
    }

    const double alpha = 1.0 / static_cast<double>(period);
    auto avg_gain = ewm_mean(core::Series(closes.index(), std::move(gains)), alpha, period);
    auto avg_loss = ewm_mean(core::Series(closes.index(), std::move(losses)), alpha, period);
    if (!avg_gain.ok()) {
        return fail(avg_gain.error->message);
    }
    if (!avg_loss.ok()) {
        return fail(avg_loss.error->message);
    }

    std::vector<core::Series::Value> rsi;
    rsi.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        const auto& g = avg_gain.series[i];
        const auto& l = avg_loss.series[i];
        if (g && l) {
            rsi.emplace_back(rsi_from_averages(*g, *l));
        } else {
            rsi.emplace_back(std::nullopt);
        }
    }

    return IndicatorResult::success(core::Series(closes.index(), std::move(rsi)));
}

} // namespace crossfire::indicators
