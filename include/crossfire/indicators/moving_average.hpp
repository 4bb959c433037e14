#pragma once
#include <crossfire/core/series.hpp>
#include <crossfire/indicators/indicator_result.hpp>
#include <cstddef>

namespace crossfire::indicators {

// Exponentially weighted mean with adjusted weights:
//   y[t] = sum_k (1-alpha)^k x[t-k] / sum_k (1-alpha)^k
// Values before `min_periods` observations are undefined. Fails on an
// undefined or non-finite input value, or alpha outside (0, 1].
IndicatorResult ewm_mean(const core::Series& input, double alpha, size_t min_periods);

// Span-weighted EMA, alpha = 2 / (span + 1), undefined for the first span - 1 rows.
IndicatorResult compute_ema(const core::Series& closes, size_t span);

// Trailing mean over the last min(window, rows so far) defined values.
// Rows with fewer than `min_periods` defined values in the window are undefined.
core::Series rolling_mean(const core::Series& input, size_t window, size_t min_periods = 1);

} // namespace crossfire::indicators
