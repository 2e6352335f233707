#include <gtest/gtest.h>
#include "chunkwire/transfer/throughput_predictor.hpp"
#include <cmath>

using namespace chunkwire::transfer;
using namespace std::chrono_literals;

class HoltSmootherTest : public ::testing::Test {};

TEST_F(HoltSmootherTest, ConstantThroughputConverges) {
    HoltSmoother holt;
    EXPECT_FALSE(holt.initialized());
    EXPECT_DOUBLE_EQ(holt.forecast(1), 0.0);

    holt.update(1000.0);
    EXPECT_FALSE(holt.is_stable());
    holt.update(1000.0);
    EXPECT_FALSE(holt.is_stable());
    holt.update(1000.0);
    EXPECT_TRUE(holt.is_stable());

    EXPECT_NEAR(holt.forecast(1), 1000.0, 1.0);
    EXPECT_NEAR(holt.trend(), 0.0, 1e-9);
}

TEST_F(HoltSmootherTest, TracksTrend) {
    HoltSmoother holt;
    for (int i = 1; i <= 20; ++i) {
        holt.update(100.0 * i);
    }

    EXPECT_GT(holt.trend(), 50.0);
    EXPECT_GT(holt.forecast(5), holt.forecast(1));
}

TEST_F(HoltSmootherTest, ForecastNeverNegative) {
    HoltSmoother holt;
    for (double value : {1000.0, 600.0, 200.0, 10.0}) {
        holt.update(value);
    }

    EXPECT_LT(holt.trend(), 0.0);
    EXPECT_GE(holt.forecast(50), 0.0);
}

TEST_F(HoltSmootherTest, BoundsBeforeEnoughResiduals) {
    HoltSmoother holt;
    holt.update(1000.0);
    holt.update(1000.0);

    auto bounds = holt.forecast_bounds(1);
    EXPECT_NEAR(bounds.low, 800.0, 1e-6);
    EXPECT_NEAR(bounds.high, 1200.0, 1e-6);
}

TEST_F(HoltSmootherTest, BoundsWidenWithNoiseAndHorizon) {
    HoltSmoother holt;
    for (double value : {1000.0, 1400.0, 700.0, 1300.0, 800.0, 1200.0}) {
        holt.update(value);
    }

    EXPECT_EQ(holt.residual_count(), 5u);
    EXPECT_GT(holt.residual_stddev(), 0.0);

    auto near = holt.forecast_bounds(1);
    auto far = holt.forecast_bounds(10);
    EXPECT_LE(near.low, holt.forecast(1));
    EXPECT_GE(near.high, holt.forecast(1));
    EXPECT_GT(far.high - far.low, near.high - near.low);
}

TEST_F(HoltSmootherTest, ResidualHistoryIsBounded) {
    HoltSmoother holt;
    for (int i = 0; i < 200; ++i) {
        holt.update(i % 2 == 0 ? 900.0 : 1100.0);
    }
    EXPECT_EQ(holt.residual_count(), 60u);

    holt.reset();
    EXPECT_FALSE(holt.initialized());
    EXPECT_EQ(holt.update_count(), 0u);
    EXPECT_EQ(holt.residual_count(), 0u);
}

class ThroughputPredictorTest : public ::testing::Test {
protected:
    ThroughputPredictor::Clock::time_point start = ThroughputPredictor::Clock::now();
};

TEST_F(ThroughputPredictorTest, EtaUnknownUntilStable) {
    ThroughputPredictor predictor(10000);

    auto estimate = predictor.update(start);
    EXPECT_FALSE(estimate.stable);
    EXPECT_TRUE(std::isinf(estimate.eta));
}

TEST_F(ThroughputPredictorTest, SteadyRateGivesEta) {
    ThroughputPredictor predictor(10000);

    EtaEstimate estimate;
    for (int second = 1; second <= 3; ++second) {
        predictor.on_bytes(1000, start + std::chrono::seconds(second) - 500ms);
        estimate = predictor.update(start + std::chrono::seconds(second));
        if (second < 3) {
            EXPECT_FALSE(estimate.stable);
        }
    }

    ASSERT_TRUE(estimate.stable);
    EXPECT_FALSE(estimate.stalled);
    EXPECT_GT(estimate.forecast_bps, 0.0);
    EXPECT_EQ(predictor.received_bytes(), 3000u);

    double expected = 7000.0 / estimate.forecast_bps;
    EXPECT_NEAR(estimate.eta, expected, 1e-6);
    EXPECT_LE(estimate.eta_low, estimate.eta);
    EXPECT_GE(estimate.eta_high, estimate.eta);
}

TEST_F(ThroughputPredictorTest, StallFreezesModel) {
    ThroughputPredictor predictor(100000);

    for (int second = 1; second <= 3; ++second) {
        predictor.on_bytes(1000, start + std::chrono::seconds(second));
        predictor.update(start + std::chrono::seconds(second));
    }
    auto before = predictor.last_estimate();

    auto stalled = predictor.update(start + 10s);
    EXPECT_TRUE(stalled.stalled);
    EXPECT_DOUBLE_EQ(stalled.current_bps, 0.0);
    EXPECT_DOUBLE_EQ(stalled.eta, before.eta);
    EXPECT_DOUBLE_EQ(stalled.forecast_bps, before.forecast_bps);
}

TEST_F(ThroughputPredictorTest, ResumedBytesAreNotThroughput) {
    ThroughputPredictor predictor(10000);
    predictor.set_received_bytes(9000);

    auto estimate = predictor.update(start);
    EXPECT_DOUBLE_EQ(estimate.current_bps, 0.0);
    EXPECT_EQ(predictor.received_bytes(), 9000u);
}

TEST_F(ThroughputPredictorTest, NothingRemainingMeansZeroEta) {
    ThroughputPredictor predictor(2000);
    predictor.on_bytes(2000, start);

    auto estimate = predictor.update(start + 100ms);
    EXPECT_DOUBLE_EQ(estimate.eta, 0.0);
    EXPECT_DOUBLE_EQ(estimate.eta_high, 0.0);
}

TEST_F(ThroughputPredictorTest, ClampsTinyForecasts) {
    PredictorConfig config;
    config.min_bps = 100.0;
    ThroughputPredictor predictor(1000000, config);

    for (int second = 1; second <= 3; ++second) {
        predictor.on_bytes(1, start + std::chrono::seconds(second));
        predictor.update(start + std::chrono::seconds(second));
    }

    auto estimate = predictor.last_estimate();
    ASSERT_TRUE(estimate.stable);
    EXPECT_LE(estimate.eta, (1000000.0 - 3.0) / 100.0 + 1e-6);
}

TEST_F(ThroughputPredictorTest, ResetForgetsEverything) {
    ThroughputPredictor predictor(5000);
    predictor.on_bytes(1000, start);
    predictor.update(start + 1s);

    predictor.reset();
    EXPECT_EQ(predictor.received_bytes(), 0u);
    EXPECT_FALSE(predictor.last_estimate().stable);
    EXPECT_EQ(predictor.total_bytes(), 5000u);
}
