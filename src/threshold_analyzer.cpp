/**
 * @file threshold_analyzer.cpp
 * @brief Threshold analyzer implementation
 */

#include "threshold_analyzer.h"
#include "logger.h"

#include <string.h>

static const char* TAG = "analyzer";

// ============================================================================
// CHANNEL CONFIG
// ============================================================================

void ChannelConfig::setDefaults() {
    id[0] = '\0';
    unitAddress = MODBUS_MIN_UNIT_ADDRESS;
    registerAddress = 0;
    registerCount = 1;
    scale = REGISTER_SCALE_DEFAULT;
    offset = 0.0f;
    signedValues = false;

    thresholds[static_cast<uint8_t>(FaultLevel::NORMAL)] = THRESHOLD_NORMAL_DEFAULT;
    thresholds[static_cast<uint8_t>(FaultLevel::WARNING)] = THRESHOLD_WARNING_DEFAULT;
    thresholds[static_cast<uint8_t>(FaultLevel::ALARM)] = THRESHOLD_ALARM_DEFAULT;
    thresholds[static_cast<uint8_t>(FaultLevel::CRITICAL)] = THRESHOLD_CRITICAL_DEFAULT;
    hysteresis = HYSTERESIS_DEFAULT;

    windowSize = WINDOW_SIZE_DEFAULT;
    escalateRun = ESCALATE_RUN_DEFAULT;
    deescalateRun = DEESCALATE_RUN_DEFAULT;
    escalateInclusive = true;
    deescalateInclusive = false;
}

float ChannelConfig::toPhysical(const uint16_t* raw, uint8_t count) const {
    float result = 0.0f;
    for (uint8_t i = 0; i < count; i++) {
        float reg = signedValues ? (float)(int16_t)raw[i] : (float)raw[i];
        float value = reg * scale + offset;
        if (i == 0 || value > result) {
            result = value;
        }
    }
    return result;
}

// ============================================================================
// ANALYZER IMPLEMENTATION
// ============================================================================

ThresholdAnalyzer::ThresholdAnalyzer() : channelCount_(0) {
}

int ThresholdAnalyzer::addChannel(const ChannelConfig& config) {
    if (channelCount_ >= MAX_CHANNELS) {
        LOG_ERROR(TAG, "cannot add %s: %d channels already registered", config.id, MAX_CHANNELS);
        return -1;
    }
    if (findChannel(config.id) >= 0) {
        LOG_ERROR(TAG, "duplicate channel id %s", config.id);
        return -1;
    }

    ChannelWindowState& state = channels_[channelCount_];
    state.config = config;
    if (state.config.windowSize == 0) {
        state.config.windowSize = 1;
    } else if (state.config.windowSize > MAX_WINDOW_SIZE) {
        state.config.windowSize = MAX_WINDOW_SIZE;
    }
    if (state.config.escalateRun == 0) {
        state.config.escalateRun = 1;
    }
    if (state.config.deescalateRun == 0) {
        state.config.deescalateRun = 1;
    }
    resetIndex(channelCount_);
    return channelCount_++;
}

int ThresholdAnalyzer::findChannel(const char* channelId) const {
    for (uint8_t i = 0; i < channelCount_; i++) {
        if (strcmp(channels_[i].config.id, channelId) == 0) {
            return i;
        }
    }
    return -1;
}

FaultLevel ThresholdAnalyzer::classify(const char* channelId, float value, uint64_t timestampMs) {
    int index = findChannel(channelId);
    if (index < 0) {
        LOG_WARN(TAG, "sample for unknown channel %s ignored", channelId);
        return FaultLevel::NORMAL;
    }
    return classifyIndex((uint8_t)index, value, timestampMs);
}

FaultLevel ThresholdAnalyzer::classifyIndex(uint8_t channelIndex, float value, uint64_t timestampMs) {
    if (channelIndex >= channelCount_) {
        return FaultLevel::NORMAL;
    }
    ChannelWindowState& state = channels_[channelIndex];

    pushSample(state, value);
    state.lastTimestampMs = timestampMs;

    if (state.level != FaultLevel::CRITICAL && exceedsNext(state, value)) {
        state.overRun++;
    } else {
        state.overRun = 0;
    }

    if (state.level != FaultLevel::NORMAL && belowCurrent(state, value)) {
        state.underRun++;
    } else {
        state.underRun = 0;
    }

    if (state.overRun >= state.config.escalateRun) {
        state.level = static_cast<FaultLevel>(static_cast<uint8_t>(state.level) + 1);
        state.overRun = 0;
        state.underRun = 0;
    } else if (state.underRun >= state.config.deescalateRun) {
        state.level = static_cast<FaultLevel>(static_cast<uint8_t>(state.level) - 1);
        state.overRun = 0;
        state.underRun = 0;
    }

    return state.level;
}

bool ThresholdAnalyzer::exceedsNext(const ChannelWindowState& state, float value) const {
    float threshold = state.config.thresholds[static_cast<uint8_t>(state.level) + 1];
    return state.config.escalateInclusive ? value >= threshold : value > threshold;
}

bool ThresholdAnalyzer::belowCurrent(const ChannelWindowState& state, float value) const {
    float limit = state.config.thresholds[static_cast<uint8_t>(state.level)] - state.config.hysteresis;
    return state.config.deescalateInclusive ? value <= limit : value < limit;
}

void ThresholdAnalyzer::pushSample(ChannelWindowState& state, float value) {
    state.samples[state.head] = value;
    state.head = (uint8_t)((state.head + 1) % state.config.windowSize);
    if (state.count < state.config.windowSize) {
        state.count++;
    }
}

FaultLevel ThresholdAnalyzer::getLevel(uint8_t channelIndex) const {
    if (channelIndex >= channelCount_) {
        return FaultLevel::NORMAL;
    }
    return channels_[channelIndex].level;
}

WindowStats ThresholdAnalyzer::getWindowStats(uint8_t channelIndex) const {
    WindowStats stats;
    stats.count = 0;
    stats.mean = 0.0f;
    stats.peak = 0.0f;
    stats.latest = 0.0f;

    if (channelIndex >= channelCount_) {
        return stats;
    }
    const ChannelWindowState& state = channels_[channelIndex];
    if (state.count == 0) {
        return stats;
    }

    float sum = 0.0f;
    for (uint8_t i = 0; i < state.count; i++) {
        float v = state.samples[i];
        sum += v;
        if (i == 0 || v > stats.peak) {
            stats.peak = v;
        }
    }
    stats.count = state.count;
    stats.mean = sum / state.count;
    uint8_t last = (uint8_t)((state.head + state.config.windowSize - 1) % state.config.windowSize);
    stats.latest = state.samples[last];
    return stats;
}

uint64_t ThresholdAnalyzer::getLastTimestamp(uint8_t channelIndex) const {
    if (channelIndex >= channelCount_) {
        return 0;
    }
    return channels_[channelIndex].lastTimestampMs;
}

void ThresholdAnalyzer::reset(const char* channelId) {
    int index = findChannel(channelId);
    if (index >= 0) {
        resetIndex((uint8_t)index);
    }
}

void ThresholdAnalyzer::resetIndex(uint8_t channelIndex) {
    if (channelIndex >= MAX_CHANNELS) {
        return;
    }
    ChannelWindowState& state = channels_[channelIndex];
    state.head = 0;
    state.count = 0;
    state.level = FaultLevel::NORMAL;
    state.overRun = 0;
    state.underRun = 0;
    state.lastTimestampMs = 0;
}

void ThresholdAnalyzer::resetAll() {
    for (uint8_t i = 0; i < channelCount_; i++) {
        resetIndex(i);
    }
}
