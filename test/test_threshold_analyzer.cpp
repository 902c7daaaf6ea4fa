/**
 * @file test_threshold_analyzer.cpp
 * @brief Google Test unit tests for the threshold analyzer
 */

#include <gtest/gtest.h>
#include <string.h>
#include <cmath>
#include "../src/threshold_analyzer.h"
#include "../src/config.h"

// ============================================================================
// CHANNEL CONFIG TESTS
// ============================================================================

TEST(ChannelConfigTest, Defaults) {
    ChannelConfig config;
    config.setDefaults();

    EXPECT_FLOAT_EQ(config.thresholds[1], 5.0f);
    EXPECT_FLOAT_EQ(config.thresholds[2], 10.0f);
    EXPECT_FLOAT_EQ(config.thresholds[3], 20.0f);
    EXPECT_FLOAT_EQ(config.hysteresis, 1.0f);
    EXPECT_EQ(config.escalateRun, 3);
    EXPECT_EQ(config.deescalateRun, 3);
    EXPECT_TRUE(config.escalateInclusive);
    EXPECT_FALSE(config.deescalateInclusive);
}

TEST(ChannelConfigTest, LargestAxisWins) {
    ChannelConfig config;
    config.setDefaults();
    config.scale = 0.1f;

    const uint16_t raw[] = { 62, 10, 71 };
    EXPECT_NEAR(config.toPhysical(raw, 3), 7.1f, 0.001f);
    EXPECT_NEAR(config.toPhysical(raw, 1), 6.2f, 0.001f);
}

TEST(ChannelConfigTest, SignedRegisters) {
    ChannelConfig config;
    config.setDefaults();
    config.scale = 1.0f;
    config.signedValues = true;

    const uint16_t raw[] = { 0xFFF6, 0xFFFB };   // -10, -5
    EXPECT_FLOAT_EQ(config.toPhysical(raw, 2), -5.0f);

    config.signedValues = false;
    config.offset = -65000.0f;
    EXPECT_FLOAT_EQ(config.toPhysical(raw, 1), 526.0f);
}

// ============================================================================
// ANALYZER TESTS
// ============================================================================

class ThresholdAnalyzerTest : public ::testing::Test {
protected:
    ThresholdAnalyzer* analyzer;
    ChannelConfig config;
    uint64_t now;

    void SetUp() override {
        analyzer = new ThresholdAnalyzer();
        now = 1700000000000ULL;

        config.setDefaults();
        strcpy(config.id, "crank_left");
        config.windowSize = 5;
        ASSERT_EQ(analyzer->addChannel(config), 0);
    }

    void TearDown() override {
        delete analyzer;
    }

    FaultLevel feed(float value) {
        now += 1000;
        return analyzer->classify("crank_left", value, now);
    }

    FaultLevel feedRun(float value, int count) {
        FaultLevel level = FaultLevel::NORMAL;
        for (int i = 0; i < count; i++) {
            level = feed(value);
        }
        return level;
    }
};

TEST_F(ThresholdAnalyzerTest, StartsNormalWithEmptyWindow) {
    EXPECT_EQ(analyzer->getLevel(0), FaultLevel::NORMAL);
    EXPECT_EQ(analyzer->getWindowStats(0).count, 0);
}

TEST_F(ThresholdAnalyzerTest, WarningOnThirdConsecutiveValueAboveThreshold) {
    EXPECT_EQ(feed(4.0f), FaultLevel::NORMAL);
    EXPECT_EQ(feed(4.0f), FaultLevel::NORMAL);
    EXPECT_EQ(feed(6.0f), FaultLevel::NORMAL);
    EXPECT_EQ(feed(6.0f), FaultLevel::NORMAL);
    EXPECT_EQ(feed(6.0f), FaultLevel::WARNING);
}

TEST_F(ThresholdAnalyzerTest, SpikeDoesNotEscalate) {
    feedRun(2.0f, 3);
    EXPECT_EQ(feed(50.0f), FaultLevel::NORMAL);
    EXPECT_EQ(feed(50.0f), FaultLevel::NORMAL);
    EXPECT_EQ(feed(2.0f), FaultLevel::NORMAL);
    EXPECT_EQ(feed(50.0f), FaultLevel::NORMAL);
}

TEST_F(ThresholdAnalyzerTest, BelowWarningAlwaysNormal) {
    const float justBelow = std::nextafter(5.0f, 0.0f);

    // Long run pinned just under the boundary
    for (int i = 0; i < 200; i++) {
        ASSERT_EQ(feed(justBelow), FaultLevel::NORMAL) << "sample " << i;
    }

    // Pseudo-random values in [0, 5), fixed seed
    uint32_t seed = 0x2545F491u;
    for (int i = 0; i < 5000; i++) {
        seed ^= seed << 13;
        seed ^= seed >> 17;
        seed ^= seed << 5;
        float value = (float)(seed % 50000u) / 10000.0f;
        if (i % 7 == 0) {
            value = justBelow;
        }
        ASSERT_LT(value, 5.0f);
        ASSERT_EQ(feed(value), FaultLevel::NORMAL) << "sample " << i << " value " << value;
    }
    EXPECT_EQ(analyzer->getLevel(0), FaultLevel::NORMAL);
}

TEST_F(ThresholdAnalyzerTest, EscalatesOneLevelPerRun) {
    EXPECT_EQ(feedRun(22.0f, 3), FaultLevel::WARNING);
    EXPECT_EQ(feedRun(22.0f, 3), FaultLevel::ALARM);
    EXPECT_EQ(feedRun(22.0f, 2), FaultLevel::ALARM);
    EXPECT_EQ(feed(22.0f), FaultLevel::CRITICAL);
}

TEST_F(ThresholdAnalyzerTest, ValueAtHysteresisLimitHoldsLevel) {
    ASSERT_EQ(feedRun(22.0f, 9), FaultLevel::CRITICAL);

    // 19 equals 20 - 1 and is not strictly below it
    EXPECT_EQ(feedRun(19.0f, 3), FaultLevel::CRITICAL);
    EXPECT_EQ(feedRun(19.5f, 5), FaultLevel::CRITICAL);

    EXPECT_EQ(feedRun(18.9f, 3), FaultLevel::ALARM);
}

TEST_F(ThresholdAnalyzerTest, DeescalationNeedsConsecutiveRun) {
    ASSERT_EQ(feedRun(7.0f, 3), FaultLevel::WARNING);

    feed(3.0f);
    feed(3.0f);
    feed(4.5f);                 // inside the hysteresis band, run restarts
    EXPECT_EQ(feedRun(3.0f, 2), FaultLevel::WARNING);
    EXPECT_EQ(feed(3.0f), FaultLevel::NORMAL);
}

TEST_F(ThresholdAnalyzerTest, DeescalatesOneLevelPerRun) {
    ASSERT_EQ(feedRun(25.0f, 9), FaultLevel::CRITICAL);

    EXPECT_EQ(feedRun(0.0f, 3), FaultLevel::ALARM);
    EXPECT_EQ(feedRun(0.0f, 3), FaultLevel::WARNING);
    EXPECT_EQ(feedRun(0.0f, 3), FaultLevel::NORMAL);
}

TEST_F(ThresholdAnalyzerTest, ExclusiveEscalationBoundary) {
    config.escalateInclusive = false;
    strcpy(config.id, "tail_bearing");
    ASSERT_EQ(analyzer->addChannel(config), 1);

    for (int i = 0; i < 3; i++) {
        analyzer->classifyIndex(1, 5.0f, now);
    }
    EXPECT_EQ(analyzer->getLevel(1), FaultLevel::NORMAL);

    for (int i = 0; i < 3; i++) {
        analyzer->classifyIndex(1, 5.01f, now);
    }
    EXPECT_EQ(analyzer->getLevel(1), FaultLevel::WARNING);
}

TEST_F(ThresholdAnalyzerTest, InclusiveDeescalationBoundary) {
    config.deescalateInclusive = true;
    strcpy(config.id, "mid_bearing");
    ASSERT_EQ(analyzer->addChannel(config), 1);

    for (int i = 0; i < 3; i++) {
        analyzer->classifyIndex(1, 6.0f, now);
    }
    ASSERT_EQ(analyzer->getLevel(1), FaultLevel::WARNING);

    for (int i = 0; i < 3; i++) {
        analyzer->classifyIndex(1, 4.0f, now);
    }
    EXPECT_EQ(analyzer->getLevel(1), FaultLevel::NORMAL);
}

TEST_F(ThresholdAnalyzerTest, WindowEvictsOldest) {
    for (int i = 1; i <= 7; i++) {
        feed((float)i);
    }

    WindowStats stats = analyzer->getWindowStats(0);
    EXPECT_EQ(stats.count, 5);
    EXPECT_FLOAT_EQ(stats.mean, 5.0f);   // 3..7
    EXPECT_FLOAT_EQ(stats.peak, 7.0f);
    EXPECT_FLOAT_EQ(stats.latest, 7.0f);
    EXPECT_EQ(analyzer->getLastTimestamp(0), now);
}

TEST_F(ThresholdAnalyzerTest, ResetReturnsToNormal) {
    ASSERT_EQ(feedRun(12.0f, 6), FaultLevel::ALARM);

    analyzer->reset("crank_left");
    EXPECT_EQ(analyzer->getLevel(0), FaultLevel::NORMAL);
    EXPECT_EQ(analyzer->getWindowStats(0).count, 0);

    // Recovery re-accumulates from scratch
    EXPECT_EQ(feedRun(12.0f, 2), FaultLevel::NORMAL);
    EXPECT_EQ(feed(12.0f), FaultLevel::WARNING);
}

TEST_F(ThresholdAnalyzerTest, ChannelsAreIndependent) {
    strcpy(config.id, "crank_right");
    ASSERT_EQ(analyzer->addChannel(config), 1);

    feedRun(8.0f, 3);
    EXPECT_EQ(analyzer->getLevel(0), FaultLevel::WARNING);
    EXPECT_EQ(analyzer->getLevel(1), FaultLevel::NORMAL);
}

TEST_F(ThresholdAnalyzerTest, DuplicateIdRejected) {
    EXPECT_EQ(analyzer->addChannel(config), -1);
    EXPECT_EQ(analyzer->getChannelCount(), 1);
}

TEST_F(ThresholdAnalyzerTest, UnknownChannelIsNormal) {
    EXPECT_EQ(analyzer->classify("gearbox", 99.0f, now), FaultLevel::NORMAL);
    EXPECT_EQ(analyzer->findChannel("gearbox"), -1);
}

TEST_F(ThresholdAnalyzerTest, RunOfOneEscalatesImmediately) {
    config.escalateRun = 1;
    strcpy(config.id, "fast");
    ASSERT_EQ(analyzer->addChannel(config), 1);

    EXPECT_EQ(analyzer->classifyIndex(1, 30.0f, now), FaultLevel::WARNING);
    EXPECT_EQ(analyzer->classifyIndex(1, 30.0f, now), FaultLevel::ALARM);
    EXPECT_EQ(analyzer->classifyIndex(1, 30.0f, now), FaultLevel::CRITICAL);
    EXPECT_EQ(analyzer->classifyIndex(1, 30.0f, now), FaultLevel::CRITICAL);
}
