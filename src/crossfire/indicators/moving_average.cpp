#include <crossfire/indicators/moving_average.hpp>
#include <crossfire/utils/logger.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace crossfire::indicators {

IndicatorResult ewm_mean(const core::Series& input, double alpha, size_t min_periods) {
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        return IndicatorResult::failure(input.index(),
                                        "smoothing factor " + std::to_string(alpha) + " outside (0, 1]");
    }

    const double decay = 1.0 - alpha;
    double weighted_sum = 0.0;
    double weight_total = 0.0;
    size_t observations = 0;

    std::vector<core::Series::Value> out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        const auto& value = input[i];
        if (!value || !std::isfinite(*value)) {
            return IndicatorResult::failure(input.index(),
                                            "undefined or non-finite value at row " + std::to_string(i));
        }

        weighted_sum = *value + decay * weighted_sum;
        weight_total = 1.0 + decay * weight_total;
        ++observations;

        if (observations >= min_periods) {
            out.emplace_back(weighted_sum / weight_total);
        } else {
            out.emplace_back(std::nullopt);
        }
    }

    return IndicatorResult::success(core::Series(input.index(), std::move(out)));
}

IndicatorResult compute_ema(const core::Series& closes, size_t span) {
    if (span == 0) {
        utils::Logger::warn() << "EMA computation failed: span must be positive" << utils::Logger::endl;
        return IndicatorResult::failure(closes.index(), "EMA: span must be positive");
    }
    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    auto result = ewm_mean(closes, alpha, span);
    if (!result.ok()) {
        utils::Logger::warn() << "EMA(" << span << ") computation failed: "
                              << result.error->message << utils::Logger::endl;
        result.error->message = "EMA(" + std::to_string(span) + "): " + result.error->message;
    }
    return result;
}

core::Series rolling_mean(const core::Series& input, size_t window, size_t min_periods) {
    std::vector<core::Series::Value> out;
    out.reserve(input.size());
    if (window == 0) {
        return core::Series::undefined_like(input.index());
    }

    double sum = 0.0;
    size_t defined = 0;
    auto usable = [&input](size_t i) { return input[i] && std::isfinite(*input[i]); };

    for (size_t i = 0; i < input.size(); ++i) {
        if (usable(i)) {
            sum += *input[i];
            ++defined;
        }
        // Drop the row that just left the window
        if (i >= window && usable(i - window)) {
            sum -= *input[i - window];
            --defined;
        }

        if (defined > 0 && defined >= min_periods) {
            out.emplace_back(sum / static_cast<double>(defined));
        } else {
            out.emplace_back(std::nullopt);
        }
    }

    return core::Series(input.index(), std::move(out));
}

} // namespace crossfire::indicators
