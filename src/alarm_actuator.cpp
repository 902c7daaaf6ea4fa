/**
 * @file alarm_actuator.cpp
 * @brief Alarm actuator implementation
 */

#include "alarm_actuator.h"
#include "logger.h"

#include <string.h>

static const char* TAG = "actuate";

void StatusBlockConfig::setDefaults() {
    enabled = false;
    unitAddress = MODBUS_MIN_UNIT_ADDRESS;
    address = STATUS_BLOCK_ADDRESS_DEFAULT;
    channelCount = 0;
    for (uint8_t i = 0; i < MAX_CHANNELS; i++) {
        channels[i][0] = '\0';
    }
}

// ============================================================================
// ACTUATOR IMPLEMENTATION
// ============================================================================

AlarmActuator::AlarmActuator(ModbusLink* link, FaultStateStore* store, AlarmDecisionEngine* engine,
                             const StatusBlockConfig& status)
    : link_(link)
    , store_(store)
    , engine_(engine)
    , status_(status)
    , lastStoreStatus_(StoreStatus::OK)
    , statusValid_(false) {
    snapshot_.clear();
    if (status_.channelCount > MAX_CHANNELS) {
        status_.channelCount = MAX_CHANNELS;
    }
    for (uint8_t i = 0; i < MAX_OUTPUTS; i++) {
        synced_[i] = false;
        syncWarned_[i] = false;
        pending_[i] = false;
        target_[i] = 0;
    }
    memset(statusValues_, 0, sizeof(statusValues_));
    memset(statusWritten_, 0, sizeof(statusWritten_));
}

TickStatus AlarmActuator::tick() {
    bool degraded = false;

    syncOutputs();
    checkLatches();

    StoreStatus storeStatus = store_->read(snapshot_);
    bool available = (storeStatus == StoreStatus::OK);
    if (storeStatus != lastStoreStatus_) {
        if (available) {
            LOG_INFO(TAG, "fault state available again (seq %u)", (unsigned)snapshot_.sequence);
        } else {
            LOG_WARN(TAG, "fault state %s: %s, treating all channels as COMM_FAULT",
                     storeStatusToString(storeStatus), store_->getError());
        }
        lastStoreStatus_ = storeStatus;
    }
    if (!available) {
        degraded = true;
    }

    AlarmDecision decisions[MAX_OUTPUTS];
    uint8_t count = available ? engine_->decide(snapshot_, decisions)
                              : engine_->decideUnavailable(decisions);

    for (uint8_t i = 0; i < count; i++) {
        if (decisions[i].changed) {
            const OutputConfig& output = engine_->getOutput(i);
            target_[i] = decisions[i].asserted ? output.assertValue : output.clearValue;
            pending_[i] = true;
        }
    }

    for (uint8_t i = 0; i < count; i++) {
        if (pending_[i] && !writeOutput(i)) {
            degraded = true;
        }
    }

    if (status_.enabled && !mirrorStatus(available)) {
        degraded = true;
    }

    return degraded ? TickStatus::DEGRADED : TickStatus::OK;
}

// Retried every tick until each output's register has been read once
void AlarmActuator::syncOutputs() {
    for (uint8_t i = 0; i < engine_->getOutputCount(); i++) {
        if (synced_[i] || pending_[i]) {
            continue;
        }

        const OutputConfig& output = engine_->getOutput(i);
        uint16_t value = 0;
        ModbusStatus status = link_->readRegisters(output.unitAddress, output.registerAddress, 1, &value);
        if (status != ModbusStatus::OK) {
            if (!syncWarned_[i]) {
                LOG_WARN(TAG, "%s: cannot read initial state: %s, retrying next tick", output.name,
                         modbusStatusToString(status));
                syncWarned_[i] = true;
            } else {
                LOG_DEBUG(TAG, "%s: initial state read failed: %s", output.name, modbusStatusToString(status));
            }
            continue;
        }
        bool asserted = (value == output.assertValue);
        engine_->restoreState(i, asserted);
        synced_[i] = true;
        LOG_INFO(TAG, "%s: device reports %u (%s)", output.name, (unsigned)value,
                 asserted ? "asserted" : "clear");
    }
}

void AlarmActuator::checkLatches() {
    for (uint8_t i = 0; i < engine_->getOutputCount(); i++) {
        const OutputConfig& output = engine_->getOutput(i);
        if (!output.latching || !engine_->isAsserted(i) || pending_[i]) {
            continue;
        }

        uint16_t value = 0;
        ModbusStatus status = link_->readRegisters(output.unitAddress, output.registerAddress, 1, &value);
        if (status != ModbusStatus::OK) {
            LOG_DEBUG(TAG, "%s: latch read-back failed: %s", output.name, modbusStatusToString(status));
            continue;
        }
        if (value == output.clearValue && engine_->releaseLatch(i)) {
            LOG_INFO(TAG, "%s: cleared by operator (register %u = %u)", output.name,
                     (unsigned)output.registerAddress, (unsigned)value);
        }
    }
}

bool AlarmActuator::writeOutput(uint8_t index) {
    const OutputConfig& output = engine_->getOutput(index);
    uint16_t value = target_[index];

    ModbusStatus status = link_->writeRegister(output.unitAddress, output.registerAddress, value);
    if (status != ModbusStatus::OK) {
        LOG_WARN(TAG, "%s: write %u to unit %u register %u failed: %s, retrying next tick", output.name,
                 (unsigned)value, (unsigned)output.unitAddress, (unsigned)output.registerAddress,
                 modbusStatusToString(status));
        return false;
    }

    if (output.verify) {
        uint16_t readBack = 0;
        status = link_->readRegisters(output.unitAddress, output.registerAddress, 1, &readBack);
        if (status != ModbusStatus::OK) {
            LOG_WARN(TAG, "%s: read-back failed: %s, retrying next tick", output.name,
                     modbusStatusToString(status));
            return false;
        }
        if (readBack != value) {
            LOG_WARN(TAG, "%s: read-back %u, expected %u, retrying next tick", output.name,
                     (unsigned)readBack, (unsigned)value);
            return false;
        }
    }

    pending_[index] = false;
    synced_[index] = true;
    LOG_INFO(TAG, "%s: register %u = %u", output.name, (unsigned)output.registerAddress, (unsigned)value);
    return true;
}

bool AlarmActuator::mirrorStatus(bool available) {
    uint8_t count = getStatusRegisterCount();

    if (available) {
        statusValues_[0] = static_cast<uint16_t>(snapshot_.worstLevel(nullptr));
    } else {
        statusValues_[0] = statusValid_ ? statusWritten_[0] : 0;
    }
    for (uint8_t i = 0; i < status_.channelCount; i++) {
        int index = available ? snapshot_.findChannel(status_.channels[i]) : -1;
        FaultLevel level = index >= 0 ? snapshot_.channels[index].level : FaultLevel::COMM_FAULT;
        statusValues_[i + 1] = static_cast<uint16_t>(level);
    }

    if (statusValid_ && memcmp(statusValues_, statusWritten_, sizeof(uint16_t) * count) == 0) {
        return true;
    }

    ModbusStatus status = link_->writeRegisters(status_.unitAddress, status_.address, statusValues_, count);
    if (status != ModbusStatus::OK) {
        LOG_WARN(TAG, "status block write at %u failed: %s", (unsigned)status_.address,
                 modbusStatusToString(status));
        return false;
    }
    memcpy(statusWritten_, statusValues_, sizeof(uint16_t) * count);
    statusValid_ = true;
    LOG_DEBUG(TAG, "status block updated, overall level %u", (unsigned)statusValues_[0]);
    return true;
}
