/**
 * @file test_alarm_engine.cpp
 * @brief Google Test unit tests for the alarm decision engine
 */

#include <gtest/gtest.h>
#include <string.h>
#include "../src/alarm_engine.h"
#include "../src/fault_state_store.h"

// ============================================================================
// HELPERS
// ============================================================================

static OutputConfig makeOutput(const char* name, const char* channel, uint8_t levels, bool latching = false) {
    OutputConfig output;
    output.setDefaults();
    strcpy(output.name, name);
    strcpy(output.channel, channel);
    output.assertLevels = levels;
    output.latching = latching;
    return output;
}

class AlarmEngineTest : public ::testing::Test {
protected:
    FaultState snapshot;
    AlarmDecision decisions[MAX_OUTPUTS];

    void SetUp() override {
        snapshot.clear();
        snapshot.addChannel("crank_left");
        snapshot.addChannel("crank_right");
    }

    void setLevels(FaultLevel left, FaultLevel right) {
        snapshot.channels[0].level = left;
        snapshot.channels[1].level = right;
    }
};

// ============================================================================
// LEVEL MAPPING
// ============================================================================

TEST(OutputConfigTest, Defaults) {
    OutputConfig output;
    output.setDefaults();

    EXPECT_TRUE(output.isAggregate());
    EXPECT_TRUE(output.assertsOn(FaultLevel::ALARM));
    EXPECT_TRUE(output.assertsOn(FaultLevel::CRITICAL));
    EXPECT_FALSE(output.assertsOn(FaultLevel::WARNING));
    EXPECT_FALSE(output.assertsOn(FaultLevel::COMM_FAULT));
    EXPECT_TRUE(output.verify);
    EXPECT_FALSE(output.latching);
}

TEST_F(AlarmEngineTest, WorstWinsAfterDebounce) {
    OutputConfig outputs[] = { makeOutput("indicator", "", faultLevelBit(FaultLevel::WARNING)) };
    AlarmDecisionEngine engine(outputs, 1, 2);

    setLevels(FaultLevel::NORMAL, FaultLevel::WARNING);

    ASSERT_EQ(engine.decide(snapshot, decisions), 1);
    EXPECT_EQ(decisions[0].action, AlarmAction::ASSERT);
    EXPECT_FALSE(decisions[0].changed);
    EXPECT_EQ(decisions[0].state, OutputState::PENDING_ASSERT);

    engine.decide(snapshot, decisions);
    EXPECT_TRUE(decisions[0].changed);
    EXPECT_TRUE(decisions[0].asserted);
    EXPECT_EQ(engine.getState(0), OutputState::ASSERTED);
}

TEST_F(AlarmEngineTest, RepeatedSnapshotIsIdempotent) {
    OutputConfig outputs[] = { makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)) };
    AlarmDecisionEngine engine(outputs, 1, 2);

    setLevels(FaultLevel::ALARM, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    engine.decide(snapshot, decisions);
    ASSERT_TRUE(decisions[0].changed);

    for (int i = 0; i < 5; i++) {
        engine.decide(snapshot, decisions);
        EXPECT_FALSE(decisions[0].changed);
        EXPECT_TRUE(decisions[0].asserted);
    }
}

TEST_F(AlarmEngineTest, FlappingInputNeverChanges) {
    OutputConfig outputs[] = { makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)) };
    AlarmDecisionEngine engine(outputs, 1, 2);

    for (int i = 0; i < 6; i++) {
        setLevels(i % 2 ? FaultLevel::ALARM : FaultLevel::NORMAL, FaultLevel::NORMAL);
        engine.decide(snapshot, decisions);
        EXPECT_FALSE(decisions[0].changed);
    }
    EXPECT_FALSE(engine.isAsserted(0));
}

TEST_F(AlarmEngineTest, ClearAlsoDebounced) {
    OutputConfig outputs[] = { makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)) };
    AlarmDecisionEngine engine(outputs, 1, 3);
    engine.restoreState(0, true);

    setLevels(FaultLevel::NORMAL, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    EXPECT_EQ(decisions[0].state, OutputState::PENDING_CLEAR);
    EXPECT_TRUE(decisions[0].asserted);

    // Contradiction returns to ASSERTED without a write
    setLevels(FaultLevel::ALARM, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    EXPECT_EQ(decisions[0].state, OutputState::ASSERTED);
    EXPECT_FALSE(decisions[0].changed);

    setLevels(FaultLevel::NORMAL, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    engine.decide(snapshot, decisions);
    EXPECT_FALSE(decisions[0].changed);
    engine.decide(snapshot, decisions);
    EXPECT_TRUE(decisions[0].changed);
    EXPECT_FALSE(decisions[0].asserted);
    EXPECT_EQ(engine.getState(0), OutputState::IDLE);
}

TEST_F(AlarmEngineTest, DebounceOfOneActsImmediately) {
    OutputConfig outputs[] = { makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)) };
    AlarmDecisionEngine engine(outputs, 1, 1);

    setLevels(FaultLevel::ALARM, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    EXPECT_TRUE(decisions[0].changed);
    EXPECT_TRUE(decisions[0].asserted);

    setLevels(FaultLevel::NORMAL, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    EXPECT_TRUE(decisions[0].changed);
    EXPECT_FALSE(decisions[0].asserted);
}

TEST_F(AlarmEngineTest, ChannelBoundOutputIgnoresOthers) {
    OutputConfig outputs[] = { makeOutput("left_lamp", "crank_left", faultLevelBit(FaultLevel::WARNING)) };
    AlarmDecisionEngine engine(outputs, 1, 1);

    setLevels(FaultLevel::NORMAL, FaultLevel::WARNING);
    engine.decide(snapshot, decisions);
    EXPECT_EQ(decisions[0].action, AlarmAction::CLEAR);
    EXPECT_FALSE(decisions[0].asserted);

    setLevels(FaultLevel::WARNING, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    EXPECT_TRUE(decisions[0].asserted);
}

// ============================================================================
// COMMUNICATION FAULTS
// ============================================================================

TEST_F(AlarmEngineTest, CommFaultHoldsAssertedAlarm) {
    OutputConfig outputs[] = { makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)) };
    AlarmDecisionEngine engine(outputs, 1, 1);

    setLevels(FaultLevel::ALARM, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    ASSERT_TRUE(decisions[0].asserted);

    setLevels(FaultLevel::COMM_FAULT, FaultLevel::NORMAL);
    for (int i = 0; i < 4; i++) {
        engine.decide(snapshot, decisions);
        EXPECT_EQ(decisions[0].action, AlarmAction::HOLD);
        EXPECT_TRUE(decisions[0].asserted);
        EXPECT_FALSE(decisions[0].changed);
    }
}

TEST_F(AlarmEngineTest, CommFaultAssertsSensorFaultOutput) {
    OutputConfig outputs[] = {
        makeOutput("sensor_fault", "", faultLevelBit(FaultLevel::COMM_FAULT)),
        makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM))
    };
    AlarmDecisionEngine engine(outputs, 2, 1);

    setLevels(FaultLevel::NORMAL, FaultLevel::COMM_FAULT);
    engine.decide(snapshot, decisions);
    EXPECT_TRUE(decisions[0].changed);
    EXPECT_TRUE(decisions[0].asserted);
    EXPECT_FALSE(decisions[1].asserted);
    EXPECT_EQ(decisions[1].action, AlarmAction::HOLD);
}

TEST_F(AlarmEngineTest, OrdinaryLevelStillAssertsDuringCommFault) {
    OutputConfig outputs[] = { makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)) };
    AlarmDecisionEngine engine(outputs, 1, 1);

    setLevels(FaultLevel::ALARM, FaultLevel::COMM_FAULT);
    engine.decide(snapshot, decisions);
    EXPECT_EQ(decisions[0].action, AlarmAction::ASSERT);
    EXPECT_TRUE(decisions[0].asserted);
}

TEST_F(AlarmEngineTest, MissingBoundChannelIsCommFault) {
    OutputConfig outputs[] = {
        makeOutput("gearbox_fault", "gearbox", faultLevelBit(FaultLevel::COMM_FAULT))
    };
    AlarmDecisionEngine engine(outputs, 1, 1);

    engine.decide(snapshot, decisions);
    EXPECT_TRUE(decisions[0].asserted);
}

TEST_F(AlarmEngineTest, UnavailableStoreActsAsCommFault) {
    OutputConfig outputs[] = {
        makeOutput("sensor_fault", "", faultLevelBit(FaultLevel::COMM_FAULT)),
        makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM))
    };
    AlarmDecisionEngine engine(outputs, 2, 1);
    engine.restoreState(1, true);

    ASSERT_EQ(engine.decideUnavailable(decisions), 2);
    EXPECT_TRUE(decisions[0].asserted);
    EXPECT_EQ(decisions[1].action, AlarmAction::HOLD);
    EXPECT_TRUE(decisions[1].asserted);
}

// ============================================================================
// LATCHING
// ============================================================================

TEST_F(AlarmEngineTest, LatchedOutputIgnoresClear) {
    OutputConfig outputs[] = { makeOutput("stop", "", faultLevelBit(FaultLevel::CRITICAL), true) };
    AlarmDecisionEngine engine(outputs, 1, 1);

    setLevels(FaultLevel::CRITICAL, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    ASSERT_TRUE(decisions[0].asserted);

    setLevels(FaultLevel::NORMAL, FaultLevel::NORMAL);
    for (int i = 0; i < 5; i++) {
        engine.decide(snapshot, decisions);
        EXPECT_TRUE(decisions[0].asserted);
        EXPECT_FALSE(decisions[0].changed);
    }

    EXPECT_TRUE(engine.releaseLatch(0));
    EXPECT_EQ(engine.getState(0), OutputState::IDLE);
    engine.decide(snapshot, decisions);
    EXPECT_FALSE(decisions[0].asserted);
    EXPECT_FALSE(decisions[0].changed);
}

TEST_F(AlarmEngineTest, ReleaseLatchOnlyForLatchingOutputs) {
    OutputConfig outputs[] = {
        makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)),
        makeOutput("stop", "", faultLevelBit(FaultLevel::CRITICAL), true)
    };
    AlarmDecisionEngine engine(outputs, 2, 1);

    engine.restoreState(0, true);
    EXPECT_FALSE(engine.releaseLatch(0));
    EXPECT_FALSE(engine.releaseLatch(1));      // Not asserted
    EXPECT_FALSE(engine.releaseLatch(7));
}

TEST_F(AlarmEngineTest, RestoreStateAdoptsDeviceLevel) {
    OutputConfig outputs[] = { makeOutput("siren", "", faultLevelBit(FaultLevel::ALARM)) };
    AlarmDecisionEngine engine(outputs, 1, 2);

    engine.restoreState(0, true);
    EXPECT_TRUE(engine.isAsserted(0));

    setLevels(FaultLevel::ALARM, FaultLevel::NORMAL);
    engine.decide(snapshot, decisions);
    EXPECT_FALSE(decisions[0].changed);
}

TEST(AlarmEngineStringsTest, Names) {
    EXPECT_STREQ(alarmActionToString(AlarmAction::HOLD), "HOLD");
    EXPECT_STREQ(outputStateToString(OutputState::PENDING_CLEAR), "PENDING_CLEAR");
}
