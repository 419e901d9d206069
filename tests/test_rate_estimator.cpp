#include "termbar/core/rate_estimator.hpp"
#include <gtest/gtest.h>
#include <chrono>

using termbar::core::Clock;
using termbar::core::RateEstimator;

class RateEstimatorTest : public ::testing::Test {
protected:
    Clock::TimePoint at(int milliseconds) const {
        return start_ + std::chrono::milliseconds(milliseconds);
    }
    
    Clock::TimePoint start_ = Clock::TimePoint{} + std::chrono::hours(1);
};

TEST_F(RateEstimatorTest, SteadyFeedConvergesToTrueRate) {
    RateEstimator estimator(start_);
    
    for (int i = 1; i <= 10; ++i) {
        estimator.record(100, at(500 * i));
    }
    
    EXPECT_EQ(estimator.sampleCount(), 5u);
    EXPECT_NEAR(estimator.rate(1000.0, 5.0), 200.0, 1e-9);
}

TEST_F(RateEstimatorTest, IntervalBoundaryIsExclusive) {
    RateEstimator estimator(start_);
    
    estimator.record(10, at(500));
    EXPECT_FALSE(estimator.hasSamples());
    
    estimator.record(10, at(501));
    EXPECT_EQ(estimator.sampleCount(), 1u);
    EXPECT_EQ(estimator.windowStart(), at(501));
}

TEST_F(RateEstimatorTest, SingleBurstFallsBackToOverall) {
    RateEstimator estimator(start_);
    estimator.record(1000, at(100));
    
    EXPECT_FALSE(estimator.hasSamples());
    EXPECT_DOUBLE_EQ(estimator.rate(1000.0, 2.0), 500.0);
}

TEST_F(RateEstimatorTest, WindowKeepsLastTenSamples) {
    RateEstimator estimator(start_);
    
    for (int i = 1; i <= 30; ++i) {
        estimator.record(i <= 20 ? 1 : 1000, at(1000 * i));
    }
    
    EXPECT_EQ(estimator.sampleCount(), termbar::constants::bar::RATE_WINDOW_CAPACITY);
    EXPECT_DOUBLE_EQ(estimator.windowAverage(), 1000.0);
}

TEST_F(RateEstimatorTest, OverallRateOnRequest) {
    RateEstimator estimator(start_);
    for (int i = 1; i <= 4; ++i) {
        estimator.record(100, at(1000 * i));
    }
    
    EXPECT_DOUBLE_EQ(estimator.rate(400.0, 8.0), 100.0);
    EXPECT_DOUBLE_EQ(estimator.rate(400.0, 8.0, true), 50.0);
}

TEST_F(RateEstimatorTest, NoElapsedTimeMeansZero) {
    RateEstimator estimator(start_);
    EXPECT_DOUBLE_EQ(estimator.rate(100.0, 0.0), 0.0);
}

TEST_F(RateEstimatorTest, ResetDropsSamples) {
    RateEstimator estimator(start_);
    estimator.record(100, at(1000));
    ASSERT_TRUE(estimator.hasSamples());
    
    estimator.reset(at(2000));
    EXPECT_FALSE(estimator.hasSamples());
    EXPECT_EQ(estimator.windowStart(), at(2000));
}
