/**
 * @file alarm_engine.cpp
 * @brief Alarm decision engine implementation
 */

#include "alarm_engine.h"
#include "logger.h"

#include <string.h>

static const char* TAG = "decide";

// ============================================================================
// OUTPUT CONFIG
// ============================================================================

void OutputConfig::setDefaults() {
    name[0] = '\0';
    unitAddress = MODBUS_MIN_UNIT_ADDRESS;
    registerAddress = 0;
    assertValue = 1;
    clearValue = 0;
    channel[0] = '\0';
    assertLevels = faultLevelBit(FaultLevel::ALARM) | faultLevelBit(FaultLevel::CRITICAL);
    latching = false;
    verify = true;
}

const char* alarmActionToString(AlarmAction action) {
    switch (action) {
        case AlarmAction::HOLD: return "HOLD";
        case AlarmAction::ASSERT: return "ASSERT";
        case AlarmAction::CLEAR: return "CLEAR";
        default: return "UNKNOWN";
    }
}

const char* outputStateToString(OutputState state) {
    switch (state) {
        case OutputState::IDLE: return "IDLE";
        case OutputState::PENDING_ASSERT: return "PENDING_ASSERT";
        case OutputState::ASSERTED: return "ASSERTED";
        case OutputState::PENDING_CLEAR: return "PENDING_CLEAR";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// ENGINE IMPLEMENTATION
// ============================================================================

AlarmDecisionEngine::AlarmDecisionEngine(const OutputConfig* outputs, uint8_t outputCount, uint8_t debounce)
    : outputCount_(outputCount > MAX_OUTPUTS ? MAX_OUTPUTS : outputCount)
    , debounce_(debounce == 0 ? 1 : debounce) {
    for (uint8_t i = 0; i < outputCount_; i++) {
        outputs_[i] = outputs[i];
        states_[i].state = OutputState::IDLE;
        states_[i].count = 0;
    }
}

uint8_t AlarmDecisionEngine::decide(const FaultState& snapshot, AlarmDecision* decisions) {
    for (uint8_t i = 0; i < outputCount_; i++) {
        step(i, desiredAction(outputs_[i], &snapshot), decisions[i]);
    }
    return outputCount_;
}

uint8_t AlarmDecisionEngine::decideUnavailable(AlarmDecision* decisions) {
    for (uint8_t i = 0; i < outputCount_; i++) {
        step(i, desiredAction(outputs_[i], nullptr), decisions[i]);
    }
    return outputCount_;
}

AlarmAction AlarmDecisionEngine::desiredAction(const OutputConfig& output, const FaultState* snapshot) const {
    FaultLevel level = FaultLevel::COMM_FAULT;
    bool commFault = true;

    if (snapshot != nullptr) {
        if (output.isAggregate()) {
            level = snapshot->worstLevel(&commFault);
        } else {
            int index = snapshot->findChannel(output.channel);
            if (index >= 0) {
                level = snapshot->channels[index].level;
                commFault = (level == FaultLevel::COMM_FAULT);
            }
        }
    }

    if (commFault && output.assertsOn(FaultLevel::COMM_FAULT)) {
        return AlarmAction::ASSERT;
    }
    if (level != FaultLevel::COMM_FAULT && output.assertsOn(level)) {
        return AlarmAction::ASSERT;
    }
    return commFault ? AlarmAction::HOLD : AlarmAction::CLEAR;
}

void AlarmDecisionEngine::step(uint8_t index, AlarmAction action, AlarmDecision& decision) {
    OutputDebounce& d = states_[index];
    const OutputConfig& output = outputs_[index];
    bool changed = false;

    switch (d.state) {
        case OutputState::IDLE:
            if (action == AlarmAction::ASSERT) {
                if (debounce_ <= 1) {
                    d.state = OutputState::ASSERTED;
                    d.count = 0;
                    changed = true;
                } else {
                    d.state = OutputState::PENDING_ASSERT;
                    d.count = 1;
                }
            }
            break;

        case OutputState::PENDING_ASSERT:
            if (action == AlarmAction::ASSERT) {
                if (++d.count >= debounce_) {
                    d.state = OutputState::ASSERTED;
                    d.count = 0;
                    changed = true;
                }
            } else if (action == AlarmAction::CLEAR) {
                d.state = OutputState::IDLE;
                d.count = 0;
            }
            break;

        case OutputState::ASSERTED:
            if (action == AlarmAction::CLEAR && !output.latching) {
                if (debounce_ <= 1) {
                    d.state = OutputState::IDLE;
                    d.count = 0;
                    changed = true;
                } else {
                    d.state = OutputState::PENDING_CLEAR;
                    d.count = 1;
                }
            }
            break;

        case OutputState::PENDING_CLEAR:
            if (action == AlarmAction::CLEAR) {
                if (++d.count >= debounce_) {
                    d.state = OutputState::IDLE;
                    d.count = 0;
                    changed = true;
                }
            } else if (action == AlarmAction::ASSERT) {
                d.state = OutputState::ASSERTED;
                d.count = 0;
            }
            break;
    }

    if (changed) {
        LOG_INFO(TAG, "%s -> %s", output.name,
                 d.state == OutputState::ASSERTED ? "ASSERT" : "CLEAR");
    }

    decision.outputIndex = index;
    decision.action = action;
    decision.changed = changed;
    decision.asserted = isAsserted(index);
    decision.state = d.state;
    decision.debounceCount = d.count;
}

bool AlarmDecisionEngine::isAsserted(uint8_t index) const {
    OutputState state = states_[index].state;
    return state == OutputState::ASSERTED || state == OutputState::PENDING_CLEAR;
}

bool AlarmDecisionEngine::releaseLatch(uint8_t outputIndex) {
    if (outputIndex >= outputCount_ || !outputs_[outputIndex].latching) {
        return false;
    }
    OutputDebounce& d = states_[outputIndex];
    if (d.state != OutputState::ASSERTED && d.state != OutputState::PENDING_CLEAR) {
        return false;
    }
    d.state = OutputState::IDLE;
    d.count = 0;
    LOG_INFO(TAG, "%s latch released", outputs_[outputIndex].name);
    return true;
}

void AlarmDecisionEngine::restoreState(uint8_t outputIndex, bool asserted) {
    if (outputIndex >= outputCount_) {
        return;
    }
    states_[outputIndex].state = asserted ? OutputState::ASSERTED : OutputState::IDLE;
    states_[outputIndex].count = 0;
}
