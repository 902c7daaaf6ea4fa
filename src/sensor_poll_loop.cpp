/**
 * @file sensor_poll_loop.cpp
 * @brief Sensor poll loop implementation
 */

#include "sensor_poll_loop.h"
#include "logger.h"
#include "sys_clock.h"

#include <string.h>

static const char* TAG = "poll";

void PollConfig::setDefaults() {
    intervalMs = POLL_INTERVAL_MS_DEFAULT;
    commFaultThreshold = COMM_FAULT_THRESHOLD_DEFAULT;
    tickBudgetPercent = TICK_BUDGET_PERCENT;
}

// ============================================================================
// POLL LOOP IMPLEMENTATION
// ============================================================================

SensorPollLoop::SensorPollLoop(ModbusLink* link, FaultStateStore* store, const ChannelConfig* channels,
                               uint8_t channelCount, const PollConfig& config)
    : link_(link)
    , store_(store)
    , channelCount_(0)
    , config_(config)
    , skippedLastTick_(0)
    , lastPublishFailed_(false) {
    state_.clear();
    if (config_.commFaultThreshold == 0) {
        config_.commFaultThreshold = 1;
    }

    for (uint8_t i = 0; i < channelCount && channelCount_ < MAX_CHANNELS; i++) {
        if (channels[i].registerCount < 1 || channels[i].registerCount > MAX_CHANNEL_REGISTERS) {
            LOG_ERROR(TAG, "%s: register count %u out of range (1-%d), channel dropped", channels[i].id,
                      (unsigned)channels[i].registerCount, MAX_CHANNEL_REGISTERS);
            continue;
        }
        if (analyzer_.addChannel(channels[i]) < 0) {
            continue;
        }
        channels_[channelCount_] = channels[i];
        state_.addChannel(channels[i].id);
        failures_[channelCount_] = 0;
        channelCount_++;
    }
}

TickStatus SensorPollLoop::tick() {
    uint32_t start = millis();
    uint32_t budget = (uint32_t)((uint64_t)config_.intervalMs * config_.tickBudgetPercent / 100);
    bool degraded = false;
    skippedLastTick_ = 0;

    for (uint8_t i = 0; i < channelCount_; i++) {
        uint32_t elapsed = millis() - start;
        if (elapsed >= budget) {
            skippedLastTick_ = channelCount_ - i;
            LOG_WARN(TAG, "tick budget %u ms spent after %u ms, skipping %u channel(s) from %s",
                     (unsigned)budget, (unsigned)elapsed, (unsigned)skippedLastTick_, channels_[i].id);
            degraded = true;
            break;
        }
        if (!pollChannel(i)) {
            degraded = true;
        }
    }

    StoreStatus status = store_->publish(state_);
    if (status != StoreStatus::OK) {
        // Keep the in-memory state, the next tick publishes it again
        if (!lastPublishFailed_) {
            LOG_ERROR(TAG, "fault state not published: %s", store_->getError());
        }
        lastPublishFailed_ = true;
        return TickStatus::DEGRADED;
    }
    if (lastPublishFailed_) {
        LOG_INFO(TAG, "fault state publishing again (seq %u)", (unsigned)state_.sequence);
        lastPublishFailed_ = false;
    }

    return degraded ? TickStatus::DEGRADED : TickStatus::OK;
}

bool SensorPollLoop::pollChannel(uint8_t index) {
    const ChannelConfig& channel = channels_[index];
    ChannelFault& entry = state_.channels[index];
    uint16_t raw[MAX_CHANNEL_REGISTERS];

    ModbusStatus status = link_->readRegisters(channel.unitAddress, channel.registerAddress,
                                               channel.registerCount, raw);
    if (status != ModbusStatus::OK) {
        recordFailure(index, status);
        return false;
    }

    uint64_t now = epochMillis();
    float value = channel.toPhysical(raw, channel.registerCount);
    FaultLevel previous = entry.level;
    FaultLevel level = analyzer_.classifyIndex(index, value, now);

    if (failures_[index] >= config_.commFaultThreshold) {
        LOG_INFO(TAG, "%s: communication restored after %u failed reads", channel.id,
                 (unsigned)failures_[index]);
    }
    failures_[index] = 0;

    entry.level = level;
    entry.value = value;
    entry.rawCount = channel.registerCount;
    memcpy(entry.raw, raw, sizeof(uint16_t) * channel.registerCount);
    entry.timestampMs = now;

    if (level != previous) {
        WindowStats stats = analyzer_.getWindowStats(index);
        LOG_INFO(TAG, "%s: %s -> %s at %.2f mm/s (window mean %.2f, peak %.2f, n=%u)",
                 channel.id, faultLevelToString(previous), faultLevelToString(level),
                 (double)value, (double)stats.mean, (double)stats.peak, (unsigned)stats.count);
    } else {
        LOG_DEBUG(TAG, "%s: %.2f mm/s %s", channel.id, (double)value, faultLevelToString(level));
    }
    return true;
}

void SensorPollLoop::recordFailure(uint8_t index, ModbusStatus status) {
    const ChannelConfig& channel = channels_[index];
    ChannelFault& entry = state_.channels[index];

    if (failures_[index] < 0xFF) {
        failures_[index]++;
    }

    if (status == ModbusStatus::EXCEPTION_RESPONSE) {
        LOG_WARN(TAG, "%s: unit %u register %u rejected with %s (%u consecutive)", channel.id,
                 (unsigned)channel.unitAddress, (unsigned)channel.registerAddress,
                 modbusExceptionToString(link_->getLastExceptionCode()), (unsigned)failures_[index]);
    } else {
        LOG_WARN(TAG, "%s: unit %u read failed: %s (%u consecutive)", channel.id,
                 (unsigned)channel.unitAddress, modbusStatusToString(status), (unsigned)failures_[index]);
    }

    if (failures_[index] >= config_.commFaultThreshold && entry.level != FaultLevel::COMM_FAULT) {
        LOG_ERROR(TAG, "%s: COMM_FAULT after %u failed reads (last level %s)", channel.id,
                  (unsigned)failures_[index], faultLevelToString(entry.level));
        entry.level = FaultLevel::COMM_FAULT;
        entry.timestampMs = epochMillis();
    }
}
