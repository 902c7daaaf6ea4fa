/**
 * @file alarm_engine.h
 * @brief Maps fault state snapshots to alarm output actions with debounce
 *
 * Every output carries its own debounce state machine:
 *
 *   IDLE ---assert---> PENDING_ASSERT ---N agreeing---> ASSERTED
 *     ^                     |                              |
 *     +------clear----------+                            clear
 *     |                                                    v
 *     +-------N agreeing------------------------------ PENDING_CLEAR
 *                                                          |
 *                                ASSERTED <----assert------+
 *
 * A change is reported only on entry to ASSERTED from PENDING_ASSERT and on
 * entry to IDLE from PENDING_CLEAR. With debounce 1 the pending states are
 * skipped. COMM_FAULT asserts the outputs that list it and holds every other
 * output in its current state: a lost sensor never clears an alarm.
 */

#ifndef ALARM_ENGINE_H
#define ALARM_ENGINE_H

#include <stdint.h>
#include <stdbool.h>
#include "config.h"
#include "fault_level.h"
#include "fault_state_store.h"

// ============================================================================
// OUTPUT CONFIGURATION
// ============================================================================

struct OutputConfig {
    char name[OUTPUT_NAME_LENGTH];      // e.g. "siren", "stop"
    uint8_t unitAddress;
    uint16_t registerAddress;
    uint16_t assertValue;
    uint16_t clearValue;

    // Channel id driving this output; empty means all channels, worst wins
    char channel[CHANNEL_ID_LENGTH];

    // Levels that assert the output (faultLevelBit set)
    uint8_t assertLevels;

    bool latching;      // Once asserted, only an operator clears it
    bool verify;        // Read back after every write

    void setDefaults();
    bool assertsOn(FaultLevel level) const { return (assertLevels & faultLevelBit(level)) != 0; }
    bool isAggregate() const { return channel[0] == '\0'; }
};

// ============================================================================
// DECISIONS
// ============================================================================

enum class AlarmAction : uint8_t {
    HOLD = 0,
    ASSERT,
    CLEAR
};

enum class OutputState : uint8_t {
    IDLE = 0,
    PENDING_ASSERT,
    ASSERTED,
    PENDING_CLEAR
};

const char* alarmActionToString(AlarmAction action);
const char* outputStateToString(OutputState state);

struct AlarmDecision {
    uint8_t outputIndex;
    AlarmAction action;         // What this snapshot demands
    bool changed;               // Output must be written now
    bool asserted;              // Output level after this call
    OutputState state;
    uint8_t debounceCount;
};

// ============================================================================
// DECISION ENGINE
// ============================================================================

class AlarmDecisionEngine {
public:
    AlarmDecisionEngine(const OutputConfig* outputs, uint8_t outputCount, uint8_t debounce);

    /**
     * @brief Advance every output by one snapshot
     * @param decisions Array of at least getOutputCount() entries
     * @return Number of decisions written
     */
    uint8_t decide(const FaultState& snapshot, AlarmDecision* decisions);

    // Same as decide() with every channel in COMM_FAULT (missing or stale record)
    uint8_t decideUnavailable(AlarmDecision* decisions);

    /**
     * @brief Release a latched output after an operator cleared it
     * @return true if the output was latched and is now IDLE
     */
    bool releaseLatch(uint8_t outputIndex);

    // Adopt the output level found on the device at startup
    void restoreState(uint8_t outputIndex, bool asserted);

    uint8_t getOutputCount() const { return outputCount_; }
    const OutputConfig& getOutput(uint8_t index) const { return outputs_[index]; }
    OutputState getState(uint8_t index) const { return states_[index].state; }
    bool isAsserted(uint8_t index) const;
    uint8_t getDebounce() const { return debounce_; }

private:
    struct OutputDebounce {
        OutputState state;
        uint8_t count;
    };

    OutputConfig outputs_[MAX_OUTPUTS];
    OutputDebounce states_[MAX_OUTPUTS];
    uint8_t outputCount_;
    uint8_t debounce_;

    AlarmAction desiredAction(const OutputConfig& output, const FaultState* snapshot) const;
    void step(uint8_t index, AlarmAction action, AlarmDecision& decision);
};

#endif // ALARM_ENGINE_H
