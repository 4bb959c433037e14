#pragma once
#include <crossfire/core/error.hpp>
#include <crossfire/core/series.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crossfire::indicators {

// Either a computed series, or an all-undefined series of the input's shape
// together with the reason the computation failed.
struct IndicatorResult {
    core::Series series;
    std::optional<core::Error> error;

    bool ok() const { return !error.has_value(); }

    static IndicatorResult success(core::Series values) {
        return IndicatorResult{std::move(values), std::nullopt};
    }

    static IndicatorResult failure(const std::vector<core::Timestamp>& index, std::string message) {
        return IndicatorResult{core::Series::undefined_like(index),
                               core::Error(core::ErrorCode::INDICATOR_COMPUTATION, std::move(message))};
    }
};

} // namespace crossfire::indicators
