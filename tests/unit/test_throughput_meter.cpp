#include <gtest/gtest.h>
#include <chrono>

#include "core/ThroughputMeter.hpp"

using namespace std::chrono_literals;

TEST(ThroughputMeterTest, WaitsForInterval)
{
    ThroughputMeter meter(500ms);
    auto start = ThroughputMeter::Clock::now();
    meter.reset(start, 0);

    EXPECT_FALSE(meter.shouldEmit(start + 100ms, 1000, 10000));
    EXPECT_FALSE(meter.shouldEmit(start + 499ms, 4000, 10000));
    EXPECT_TRUE(meter.shouldEmit(start + 500ms, 5000, 10000));
}

TEST(ThroughputMeterTest, LastByteForcesEmission)
{
    ThroughputMeter meter(500ms);
    auto start = ThroughputMeter::Clock::now();
    meter.reset(start, 0);

    EXPECT_TRUE(meter.shouldEmit(start + 10ms, 10000, 10000));

    meter.recordEmission(start + 10ms, 10000);
    EXPECT_FALSE(meter.shouldEmit(start + 20ms, 10000, 10000));
}

TEST(ThroughputMeterTest, RateCoversOnlyLastWindow)
{
    ThroughputMeter meter(500ms);
    auto start = ThroughputMeter::Clock::now();
    meter.reset(start, 0);

    EXPECT_DOUBLE_EQ(meter.recordEmission(start + 1s, 1000), 1000.0);
    EXPECT_DOUBLE_EQ(meter.recordEmission(start + 2s, 5000), 4000.0);
    EXPECT_DOUBLE_EQ(meter.getLastRate(), 4000.0);
}

TEST(ThroughputMeterTest, TinyWindowKeepsPreviousRate)
{
    ThroughputMeter meter(500ms);
    auto start = ThroughputMeter::Clock::now();
    meter.reset(start, 0);

    meter.recordEmission(start + 1s, 2000);
    EXPECT_DOUBLE_EQ(meter.recordEmission(start + 1s, 2500), 2000.0);
}

TEST(ThroughputMeterTest, ResumedBytesAreNotCountedAsThroughput)
{
    ThroughputMeter meter(500ms);
    auto start = ThroughputMeter::Clock::now();
    meter.reset(start, 500);

    EXPECT_DOUBLE_EQ(meter.recordEmission(start + 1s, 600), 100.0);
}

TEST(ThroughputMeterTest, EstimateRemaining)
{
    auto eta = ThroughputMeter::estimateSecondsRemaining(1000, 200, 100.0);
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(*eta, 8.0);

    EXPECT_FALSE(ThroughputMeter::estimateSecondsRemaining(0, 200, 100.0).has_value());
    EXPECT_FALSE(ThroughputMeter::estimateSecondsRemaining(1000, 200, 0.0).has_value());

    auto done = ThroughputMeter::estimateSecondsRemaining(1000, 1000, 50.0);
    ASSERT_TRUE(done.has_value());
    EXPECT_DOUBLE_EQ(*done, 0.0);
}
