#pragma once
#include <crossfire/core/series.hpp>
#include <crossfire/indicators/indicator_result.hpp>
#include <cstddef>

namespace crossfire::indicators {

constexpr size_t DEFAULT_RSI_PERIOD = 14;

// RSI with gains and losses smoothed with alpha = 1/period, the first
// period - 1 rows undefined. A window with no losses saturates at 100, a flat
// window (no gains, no losses) reads 50.
//
// Never throws: a zero period or an undefined/non-finite close yields an
// all-undefined series plus an INDICATOR_COMPUTATION error, logged at WARN.
IndicatorResult compute_rsi(const core::Series& closes, size_t period = DEFAULT_RSI_PERIOD);

// RSI from already smoothed averages
double rsi_from_averages(double avg_gain, double avg_loss);

} // namespace crossfire::indicators
