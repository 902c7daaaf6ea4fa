/**
 * @file sensor_poll_loop.h
 * @brief Sensor daemon tick: read every channel, classify, publish
 */

#ifndef SENSOR_POLL_LOOP_H
#define SENSOR_POLL_LOOP_H

#include <stdint.h>
#include <stdbool.h>
#include "config.h"
#include "fault_state_store.h"
#include "modbus_link.h"
#include "scheduler.h"
#include "threshold_analyzer.h"

struct PollConfig {
    uint32_t intervalMs;
    uint8_t commFaultThreshold;     // Consecutive failed reads before COMM_FAULT
    uint8_t tickBudgetPercent;      // Share of intervalMs one tick may spend reading

    void setDefaults();
};

/**
 * @brief One tick reads each channel once, in configuration order
 *
 * A failed read leaves the channel at its last classified level until
 * commFaultThreshold consecutive reads have failed; from then on the channel
 * is published as COMM_FAULT. The analyzer keeps its window and level, so
 * the first good read resumes at the last classified level. Once the tick
 * budget is spent the remaining channels keep their previous entries for
 * this tick. Channels reading more than MAX_CHANNEL_REGISTERS registers are
 * dropped at construction.
 */
class SensorPollLoop : public PeriodicTask {
public:
    // link and store are not owned and must outlive the loop
    SensorPollLoop(ModbusLink* link, FaultStateStore* store, const ChannelConfig* channels,
                   uint8_t channelCount, const PollConfig& config);

    TickStatus tick() override;
    const char* getName() const override { return "sensord"; }

    uint8_t getChannelCount() const { return channelCount_; }
    uint8_t getFailureCount(uint8_t channelIndex) const { return failures_[channelIndex]; }
    uint8_t getSkippedLastTick() const { return skippedLastTick_; }
    const FaultState& getState() const { return state_; }
    const ThresholdAnalyzer& getAnalyzer() const { return analyzer_; }

private:
    ModbusLink* link_;
    FaultStateStore* store_;
    ChannelConfig channels_[MAX_CHANNELS];
    uint8_t channelCount_;
    PollConfig config_;

    ThresholdAnalyzer analyzer_;
    FaultState state_;
    uint8_t failures_[MAX_CHANNELS];
    uint8_t skippedLastTick_;
    bool lastPublishFailed_;

    bool pollChannel(uint8_t index);
    void recordFailure(uint8_t index, ModbusStatus status);
};

#endif // SENSOR_POLL_LOOP_H
