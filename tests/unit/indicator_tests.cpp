#include <gtest/gtest.h>
#include <crossfire/core/market_data.hpp>
#include <crossfire/core/series.hpp>
#include <crossfire/indicators/indicator_builder.hpp>
#include <crossfire/indicators/moving_average.hpp>
#include <crossfire/indicators/rsi.hpp>
#include <crossfire/utils/logger.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <vector>

using crossfire::core::Bar;
using crossfire::core::ErrorCode;
using crossfire::core::OhlcvTable;
using crossfire::core::Series;
using crossfire::core::Timestamp;
using namespace crossfire::indicators;

namespace {

Series make_series(const std::vector<double>& values) {
    std::vector<Timestamp> index;
    std::vector<Series::Value> out;
    for (size_t i = 0; i < values.size(); ++i) {
        index.push_back(static_cast<Timestamp>(1000 + i * 60));
        out.emplace_back(values[i]);
    }
    return Series(index, out);
}

std::vector<double> ramp(size_t n, double start, double step) {
    std::vector<double> values;
    for (size_t i = 0; i < n; ++i) {
        values.push_back(start + step * static_cast<double>(i));
    }
    return values;
}

OhlcvTable make_table(const std::vector<double>& closes, const std::vector<std::optional<double>>& volumes) {
    OhlcvTable table("TEST");
    for (size_t i = 0; i < closes.size(); ++i) {
        const double open = closes[i] - 0.5;
        table.append(Bar(static_cast<Timestamp>(i + 1), open, closes[i] + 1.0, open - 1.0, closes[i],
                         i < volumes.size() ? volumes[i] : std::nullopt));
    }
    return table;
}

} // namespace

class IndicatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Keep expected WARN lines out of the test output
        crossfire::utils::Logger::set_output(&log_);
    }

    void TearDown() override {
        crossfire::utils::Logger::set_output(nullptr);
    }

    std::stringstream log_;
};

// Moving averages
TEST_F(IndicatorTest, EmaWarmUpMatchesSpan) {
    auto closes = make_series(ramp(60, 100.0, 1.0));

    auto ema20 = compute_ema(closes, 20);
    ASSERT_TRUE(ema20.ok());
    ASSERT_EQ(ema20.series.size(), 60);
    for (size_t i = 0; i < 19; ++i) {
        EXPECT_FALSE(ema20.series[i].has_value()) << "row " << i;
    }
    for (size_t i = 19; i < 60; ++i) {
        EXPECT_TRUE(ema20.series[i].has_value()) << "row " << i;
    }

    auto ema50 = compute_ema(closes, 50);
    ASSERT_TRUE(ema50.ok());
    EXPECT_FALSE(ema50.series[48].has_value());
    EXPECT_TRUE(ema50.series[49].has_value());

    // The faster average sits closer to a rising price
    EXPECT_GT(*ema20.series[59], *ema50.series[59]);
}

TEST_F(IndicatorTest, EmaUsesAdjustedWeights) {
    // alpha = 0.5: (3 + 0.5 * 2 + 0.25 * 1) / (1 + 0.5 + 0.25)
    auto ema = compute_ema(make_series({1.0, 2.0, 3.0}), 3);
    ASSERT_TRUE(ema.ok());
    ASSERT_TRUE(ema.series[2].has_value());
    EXPECT_NEAR(*ema.series[2], 4.25 / 1.75, 1e-12);
}

TEST_F(IndicatorTest, EmaOfConstantIsConstant) {
    auto ema = compute_ema(make_series(std::vector<double>(30, 42.0)), 20);
    ASSERT_TRUE(ema.ok());
    EXPECT_NEAR(*ema.series[29], 42.0, 1e-9);
}

TEST_F(IndicatorTest, EmaFailureIsAllUndefined) {
    auto closes = make_series({1.0, std::numeric_limits<double>::quiet_NaN(), 3.0});
    auto ema = compute_ema(closes, 2);
    EXPECT_FALSE(ema.ok());
    EXPECT_EQ(ema.error->code, ErrorCode::INDICATOR_COMPUTATION);
    EXPECT_EQ(ema.series.size(), 3);
    EXPECT_TRUE(ema.series.all_undefined());

    EXPECT_FALSE(compute_ema(make_series({1.0, 2.0}), 0).ok());
}

TEST_F(IndicatorTest, RollingMeanShrinksAtTheStart) {
    auto mean = rolling_mean(make_series({1.0, 2.0, 3.0, 4.0, 5.0}), 3);
    ASSERT_EQ(mean.size(), 5);
    EXPECT_DOUBLE_EQ(*mean[0], 1.0);
    EXPECT_DOUBLE_EQ(*mean[1], 1.5);
    EXPECT_DOUBLE_EQ(*mean[2], 2.0);
    EXPECT_DOUBLE_EQ(*mean[3], 3.0);
    EXPECT_DOUBLE_EQ(*mean[4], 4.0);
}

// RSI
TEST_F(IndicatorTest, RsiRisingSeriesSaturatesAt100) {
    auto rsi = compute_rsi(make_series(ramp(40, 50.0, 0.75)));
    ASSERT_TRUE(rsi.ok());
    for (size_t i = 0; i < 13; ++i) {
        EXPECT_FALSE(rsi.series[i].has_value()) << "row " << i;
    }
    for (size_t i = 13; i < 40; ++i) {
        ASSERT_TRUE(rsi.series[i].has_value()) << "row " << i;
        EXPECT_DOUBLE_EQ(*rsi.series[i], 100.0);
    }
}

TEST_F(IndicatorTest, RsiFallingSeriesReachesZero) {
    auto rsi = compute_rsi(make_series(ramp(40, 200.0, -2.0)));
    ASSERT_TRUE(rsi.ok());
    for (size_t i = 13; i < 40; ++i) {
        ASSERT_TRUE(rsi.series[i].has_value());
        EXPECT_NEAR(*rsi.series[i], 0.0, 1e-9);
    }
}

TEST_F(IndicatorTest, RsiFlatSeriesReads50) {
    auto rsi = compute_rsi(make_series(std::vector<double>(20, 10.0)));
    ASSERT_TRUE(rsi.ok());
    EXPECT_DOUBLE_EQ(*rsi.series[19], 50.0);
}

TEST_F(IndicatorTest, RsiStaysInRange) {
    std::vector<double> closes;
    for (int i = 0; i < 120; ++i) {
        closes.push_back(100.0 + 10.0 * std::sin(i * 0.3) + 0.1 * i);
    }
    auto rsi = compute_rsi(make_series(closes));
    ASSERT_TRUE(rsi.ok());
    for (size_t i = 13; i < closes.size(); ++i) {
        ASSERT_TRUE(rsi.series[i].has_value());
        EXPECT_GE(*rsi.series[i], 0.0);
        EXPECT_LE(*rsi.series[i], 100.0);
    }
}

TEST_F(IndicatorTest, RsiFromAverages) {
    EXPECT_DOUBLE_EQ(rsi_from_averages(1.0, 1.0), 50.0);
    EXPECT_DOUBLE_EQ(rsi_from_averages(3.0, 1.0), 75.0);
    EXPECT_DOUBLE_EQ(rsi_from_averages(2.0, 0.0), 100.0);
    EXPECT_DOUBLE_EQ(rsi_from_averages(0.0, 0.0), 50.0);
    EXPECT_DOUBLE_EQ(rsi_from_averages(0.0, 2.0), 0.0);
}

TEST_F(IndicatorTest, RsiMalformedInputDoesNotThrow) {
    auto closes = make_series({1.0, 2.0, std::numeric_limits<double>::infinity(), 4.0});

    IndicatorResult rsi;
    EXPECT_NO_THROW(rsi = compute_rsi(closes, 2));
    EXPECT_FALSE(rsi.ok());
    EXPECT_EQ(rsi.error->code, ErrorCode::INDICATOR_COMPUTATION);
    EXPECT_EQ(rsi.series.size(), 4);
    EXPECT_EQ(rsi.series.index(), closes.index());
    EXPECT_TRUE(rsi.series.all_undefined());
    EXPECT_NE(log_.str().find("RSI computation failed"), std::string::npos);

    auto zero_period = compute_rsi(make_series({1.0, 2.0}), 0);
    EXPECT_FALSE(zero_period.ok());
    EXPECT_TRUE(zero_period.series.all_undefined());
}

// Indicator builder
TEST_F(IndicatorTest, BuilderOnEmptyTableIsNoOp) {
    IndicatorBuilder builder;
    auto table = builder.build(OhlcvTable("NONE"));

    EXPECT_TRUE(table.empty());
    EXPECT_TRUE(table.ema_fast.empty());
    EXPECT_TRUE(table.rsi.empty());
    EXPECT_TRUE(table.volume_filter.empty());
    ASSERT_EQ(table.diagnostics.size(), 1);
    EXPECT_EQ(table.diagnostics[0].code, ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(IndicatorTest, BuilderAddsAllColumns) {
    const auto closes = ramp(80, 100.0, 0.5);
    auto input = make_table(closes, std::vector<std::optional<double>>(80, 1000.0));

    IndicatorBuilder builder;
    auto table = builder.build(input);

    ASSERT_EQ(table.size(), 80);
    EXPECT_EQ(table.ema_fast.size(), 80);
    EXPECT_EQ(table.ema_slow.size(), 80);
    EXPECT_EQ(table.rsi.size(), 80);
    EXPECT_EQ(table.volume_ma.size(), 80);
    EXPECT_EQ(table.volume_filter.size(), 80);
    EXPECT_EQ(table.ema_slow.defined_count(), 31);
    EXPECT_EQ(table.ema_fast.defined_count(), 61);
    EXPECT_EQ(table.rsi.defined_count(), 67);
    EXPECT_TRUE(table.diagnostics.empty());
    EXPECT_FALSE(table.volume_substituted);

    // The caller's table is untouched
    EXPECT_EQ(input.size(), 80);
    EXPECT_DOUBLE_EQ(table.bars[10].close, input[10].close);
}

TEST_F(IndicatorTest, VolumeFilterNeedsASpike) {
    std::vector<std::optional<double>> volumes(5, 100.0);
    volumes.push_back(1000.0);
    auto table = IndicatorBuilder().build(make_table(ramp(6, 10.0, 1.0), volumes));

    // (5 * 100 + 1000) / 6 = 250, and 1000 > 1.2 * 250
    EXPECT_DOUBLE_EQ(*table.volume_ma[5], 250.0);
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_FALSE(table.volume_filter[i]);
    }
    EXPECT_TRUE(table.volume_filter[5]);
}

TEST_F(IndicatorTest, MissingVolumesAreForwardThenZeroFilled) {
    auto filled = IndicatorBuilder::fill_volume(
        Series({1, 2, 3, 4, 5}, {std::nullopt, 5.0, std::nullopt, 7.0, std::nullopt}));
    EXPECT_DOUBLE_EQ(*filled[0], 0.0);
    EXPECT_DOUBLE_EQ(*filled[1], 5.0);
    EXPECT_DOUBLE_EQ(*filled[2], 5.0);
    EXPECT_DOUBLE_EQ(*filled[3], 7.0);
    EXPECT_DOUBLE_EQ(*filled[4], 7.0);
}

TEST_F(IndicatorTest, NanVolumeCountsAsMissing) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<std::optional<double>> volumes(60, 1000.0);
    volumes[5] = nan;
    volumes[50] = 5000.0;
    auto table = IndicatorBuilder().build(make_table(ramp(60, 10.0, 1.0), volumes));

    EXPECT_DOUBLE_EQ(*table.volume[5], 1000.0);
    for (size_t i = 0; i < 60; ++i) {
        ASSERT_TRUE(table.volume_ma[i].has_value()) << "row " << i;
        EXPECT_TRUE(std::isfinite(*table.volume_ma[i])) << "row " << i;
    }

    // (19 * 1000 + 5000) / 20 = 1200, and 5000 > 1.2 * 1200
    EXPECT_DOUBLE_EQ(*table.volume_ma[50], 1200.0);
    EXPECT_TRUE(table.volume_filter[50]);
    EXPECT_FALSE(table.volume_filter[49]);
    EXPECT_FALSE(table.volume_filter[51]);
}

TEST_F(IndicatorTest, RollingMeanSkipsNonFiniteValues) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto mean = rolling_mean(Series({1, 2, 3, 4}, {1.0, nan, 3.0, 5.0}), 2);

    EXPECT_DOUBLE_EQ(*mean[0], 1.0);
    EXPECT_DOUBLE_EQ(*mean[1], 1.0);
    EXPECT_DOUBLE_EQ(*mean[2], 3.0);
    EXPECT_DOUBLE_EQ(*mean[3], 4.0);
}

TEST_F(IndicatorTest, AllNanVolumeIsTreatedAsAbsent) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto input = make_table(ramp(10, 10.0, 1.0), std::vector<std::optional<double>>(10, nan));
    EXPECT_FALSE(input.has_volume());

    auto table = IndicatorBuilder().build(input);
    EXPECT_TRUE(table.volume_substituted);
    for (bool passed : table.volume_filter) {
        EXPECT_TRUE(passed);
    }
}

TEST_F(IndicatorTest, AbsentVolumeDisablesTheFilter) {
    const auto closes = ramp(30, 10.0, 1.0);
    auto table = IndicatorBuilder().build(make_table(closes, {}));

    EXPECT_TRUE(table.volume_substituted);
    ASSERT_EQ(table.volume_filter.size(), 30);
    for (bool passed : table.volume_filter) {
        EXPECT_TRUE(passed);
    }

    // Volume becomes the mean close, and its moving average the same series
    const double mean_close = 10.0 + 29.0 / 2.0;
    for (size_t i = 0; i < 30; ++i) {
        EXPECT_DOUBLE_EQ(*table.volume[i], mean_close);
        EXPECT_DOUBLE_EQ(*table.volume_ma[i], mean_close);
    }
}

TEST_F(IndicatorTest, UnalignedVolumeRowsDefaultToFalse) {
    std::vector<Timestamp> index{1, 2, 3, 4};
    Series volume(index, {500.0, 500.0, 500.0, 500.0});
    Series volume_ma({1, 2, 4}, {100.0, 100.0, 100.0});

    std::vector<crossfire::core::Error> diagnostics;
    auto filter = IndicatorBuilder::volume_filter(index, volume, volume_ma, 1.2, diagnostics);

    ASSERT_EQ(filter.size(), 4);
    EXPECT_TRUE(filter[0]);
    EXPECT_TRUE(filter[1]);
    EXPECT_FALSE(filter[2]);
    EXPECT_TRUE(filter[3]);
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::ALIGNMENT);
}

TEST_F(IndicatorTest, ConfigOverridesDefaults) {
    crossfire::utils::Config config;
    config.load_from_string("[indicators]\nema_fast_span = 12\nrsi_period = 7\nvolume_multiplier = 1.5\n");

    auto settings = IndicatorConfig::from_config(config);
    EXPECT_EQ(settings.ema_fast_span, 12);
    EXPECT_EQ(settings.ema_slow_span, 50);
    EXPECT_EQ(settings.rsi_period, 7);
    EXPECT_EQ(settings.volume_ma_window, 20);
    EXPECT_DOUBLE_EQ(settings.volume_multiplier, 1.5);

    auto table = IndicatorBuilder(settings).build(make_table(ramp(20, 10.0, 1.0), {}));
    EXPECT_EQ(table.rsi.defined_count(), 14);
    EXPECT_EQ(table.ema_fast.defined_count(), 9);
}

TEST_F(IndicatorTest, ConfigRejectsNonPositiveLengths) {
    crossfire::utils::Config config;
    config.load_from_string("[indicators]\nema_fast_span = -5\nrsi_period = 0\n"
                            "volume_ma_window = 10\nvolume_multiplier = -1\n");

    auto settings = IndicatorConfig::from_config(config);
    EXPECT_EQ(settings.ema_fast_span, 20);
    EXPECT_EQ(settings.rsi_period, 14);
    EXPECT_EQ(settings.volume_ma_window, 10);
    EXPECT_DOUBLE_EQ(settings.volume_multiplier, 1.2);
    EXPECT_NE(log_.str().find("Ignoring indicators.ema_fast_span = -5"), std::string::npos);
    EXPECT_NE(log_.str().find("Ignoring indicators.rsi_period = 0"), std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
