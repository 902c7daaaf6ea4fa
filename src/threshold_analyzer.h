/**
 * @file threshold_analyzer.h
 * @brief Sliding-window severity classifier with hysteresis, one state per channel
 *
 * Escalation from level L to L+1 requires escalateRun consecutive samples at
 * or above threshold(L+1). De-escalation from L to L-1 requires deescalateRun
 * consecutive samples strictly below threshold(L) - hysteresis. At most one
 * transition happens per sample and both run counters restart after it, so
 * a channel climbs from NORMAL to CRITICAL one level at a time.
 */

#ifndef THRESHOLD_ANALYZER_H
#define THRESHOLD_ANALYZER_H

#include <stdint.h>
#include <stdbool.h>
#include "config.h"
#include "fault_level.h"

// ============================================================================
// CHANNEL CONFIGURATION
// ============================================================================

struct ChannelConfig {
    char id[CHANNEL_ID_LENGTH];     // Location name, e.g. "crank_left"

    // Register source
    uint8_t unitAddress;
    uint16_t registerAddress;
    uint8_t registerCount;          // Axes read together (Vx, Vy, Vz)
    float scale;                    // Physical = raw * scale + offset
    float offset;
    bool signedValues;              // Registers hold int16 values

    // Severity boundaries indexed by FaultLevel (NORMAL..CRITICAL)
    float thresholds[ORDINARY_LEVEL_COUNT];
    float hysteresis;

    uint8_t windowSize;
    uint8_t escalateRun;
    uint8_t deescalateRun;
    bool escalateInclusive;         // true: >= threshold, false: >
    bool deescalateInclusive;       // true: <= limit, false: < limit

    void setDefaults();

    /**
     * @brief Convert raw registers to the physical value used for classification
     *
     * Multi-axis channels are classified on the largest axis.
     */
    float toPhysical(const uint16_t* raw, uint8_t count) const;
};

// ============================================================================
// WINDOW STATISTICS
// ============================================================================

struct WindowStats {
    uint8_t count;
    float mean;
    float peak;
    float latest;
};

// ============================================================================
// THRESHOLD ANALYZER
// ============================================================================

class ThresholdAnalyzer {
public:
    ThresholdAnalyzer();

    /**
     * @brief Register a channel. It starts at NORMAL with an empty window.
     * @return Channel index, or -1 if full or the id is already registered
     */
    int addChannel(const ChannelConfig& config);

    uint8_t getChannelCount() const { return channelCount_; }
    int findChannel(const char* channelId) const;

    /**
     * @brief Feed one sample and return the channel's level after it
     *
     * Never returns COMM_FAULT. An unknown channel id logs a warning and
     * returns NORMAL.
     */
    FaultLevel classify(const char* channelId, float value, uint64_t timestampMs);
    FaultLevel classifyIndex(uint8_t channelIndex, float value, uint64_t timestampMs);

    FaultLevel getLevel(uint8_t channelIndex) const;
    WindowStats getWindowStats(uint8_t channelIndex) const;
    uint64_t getLastTimestamp(uint8_t channelIndex) const;

    // Back to NORMAL with an empty window and cleared run counters
    void reset(const char* channelId);
    void resetIndex(uint8_t channelIndex);
    void resetAll();

private:
    struct ChannelWindowState {
        ChannelConfig config;
        float samples[MAX_WINDOW_SIZE];
        uint8_t head;               // Next write position
        uint8_t count;
        FaultLevel level;
        uint8_t overRun;
        uint8_t underRun;
        uint64_t lastTimestampMs;
    };

    ChannelWindowState channels_[MAX_CHANNELS];
    uint8_t channelCount_;

    void pushSample(ChannelWindowState& state, float value);
    bool exceedsNext(const ChannelWindowState& state, float value) const;
    bool belowCurrent(const ChannelWindowState& state, float value) const;
};

#endif // THRESHOLD_ANALYZER_H
