/**
 * @file alarm_actuator.h
 * @brief Alarm daemon tick: read fault state, decide, write and verify outputs
 */

#ifndef ALARM_ACTUATOR_H
#define ALARM_ACTUATOR_H

#include <stdint.h>
#include <stdbool.h>
#include "config.h"
#include "alarm_engine.h"
#include "fault_state_store.h"
#include "modbus_link.h"
#include "scheduler.h"

// ============================================================================
// STATUS BLOCK
// ============================================================================

/**
 * @brief Level codes mirrored to the PLC
 *
 * Register layout from address: overall level (worst ordinary level, 0..3),
 * then one level code per channel (0..4, 4 = COMM_FAULT), in channel order.
 */
struct StatusBlockConfig {
    bool enabled;
    uint8_t unitAddress;
    uint16_t address;
    uint8_t channelCount;           // Codes written after the overall level
    char channels[MAX_CHANNELS][CHANNEL_ID_LENGTH];

    void setDefaults();
};

// ============================================================================
// ACTUATOR
// ============================================================================

class AlarmActuator : public PeriodicTask {
public:
    // All pointers are borrowed and must outlive the actuator
    AlarmActuator(ModbusLink* link, FaultStateStore* store, AlarmDecisionEngine* engine,
                  const StatusBlockConfig& status);

    /**
     * @brief One actuation cycle
     *
     * 1. Adopt output levels found on the device (until each output is read once)
     * 2. Release latched outputs the operator has cleared
     * 3. Read the fault state; STALE or READ_ERROR counts as COMM_FAULT
     * 4. Decide, then write changed and still-pending outputs (0x06)
     * 5. Verify each write by reading it back (0x03)
     * 6. Mirror the status block (0x10) when it changed
     */
    TickStatus tick() override;
    const char* getName() const override { return "alarmd"; }

    bool isWritePending(uint8_t outputIndex) const { return pending_[outputIndex]; }
    bool isSynced(uint8_t outputIndex) const { return synced_[outputIndex]; }
    StoreStatus getLastStoreStatus() const { return lastStoreStatus_; }
    const uint16_t* getStatusRegisters() const { return statusValues_; }
    uint8_t getStatusRegisterCount() const { return (uint8_t)(status_.channelCount + 1); }

private:
    ModbusLink* link_;
    FaultStateStore* store_;
    AlarmDecisionEngine* engine_;
    StatusBlockConfig status_;

    FaultState snapshot_;
    StoreStatus lastStoreStatus_;
    bool synced_[MAX_OUTPUTS];      // Device state read, or written since startup
    bool syncWarned_[MAX_OUTPUTS];
    bool pending_[MAX_OUTPUTS];
    uint16_t target_[MAX_OUTPUTS];

    uint16_t statusValues_[MAX_CHANNELS + 1];
    uint16_t statusWritten_[MAX_CHANNELS + 1];
    bool statusValid_;

    void syncOutputs();
    void checkLatches();
    bool writeOutput(uint8_t index);
    bool mirrorStatus(bool available);
};

#endif // ALARM_ACTUATOR_H
