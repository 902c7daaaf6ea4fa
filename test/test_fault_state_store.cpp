/**
 * @file test_fault_state_store.cpp
 * @brief Google Test unit tests for the fault state handoff file
 */

#include <gtest/gtest.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <string>
#include "../src/fault_state_store.h"
#include "../src/sys_clock.h"

static const char* STATE_PATH = "test_fault_state.json";
static const uint64_t START_EPOCH = 1700000000000ULL;

// ============================================================================
// FAULT STATE TESTS
// ============================================================================

TEST(FaultStateTest, AddAndFindChannels) {
    FaultState state;
    state.clear();

    EXPECT_EQ(state.addChannel("crank_left"), 0);
    EXPECT_EQ(state.addChannel("crank_right"), 1);
    EXPECT_EQ(state.findChannel("crank_right"), 1);
    EXPECT_EQ(state.findChannel("tail_bearing"), -1);
    EXPECT_EQ(state.channels[0].level, FaultLevel::NORMAL);
}

TEST(FaultStateTest, WorstLevelSkipsCommFault) {
    FaultState state;
    state.clear();
    state.addChannel("a");
    state.addChannel("b");
    state.addChannel("c");
    state.channels[0].level = FaultLevel::WARNING;
    state.channels[1].level = FaultLevel::COMM_FAULT;
    state.channels[2].level = FaultLevel::ALARM;

    bool commFault = false;
    EXPECT_EQ(state.worstLevel(&commFault), FaultLevel::ALARM);
    EXPECT_TRUE(commFault);

    state.channels[1].level = FaultLevel::NORMAL;
    EXPECT_EQ(state.worstLevel(&commFault), FaultLevel::ALARM);
    EXPECT_FALSE(commFault);
}

// ============================================================================
// JSON ENCODING TESTS
// ============================================================================

TEST(FaultStateJsonTest, SerializedLayout) {
    FaultState state;
    state.clear();
    state.sequence = 7;
    state.timestampMs = START_EPOCH;
    state.producerPid = 1234;
    int index = state.addChannel("crank_left");
    state.channels[index].level = FaultLevel::WARNING;
    state.channels[index].value = 6.25f;
    state.channels[index].raw[0] = 62;
    state.channels[index].raw[1] = 10;
    state.channels[index].raw[2] = 3;
    state.channels[index].rawCount = 3;
    state.channels[index].timestampMs = START_EPOCH - 10;
    state.channels[index].sequence = 5;

    std::string json;
    ASSERT_TRUE(FaultStateStore::serialize(state, json));
    EXPECT_NE(json.find("\"schema\":\"vibmon.fault_state\""), std::string::npos);
    EXPECT_NE(json.find("\"version\":1"), std::string::npos);
    EXPECT_NE(json.find("\"sequence\":7"), std::string::npos);
    EXPECT_NE(json.find("\"timestamp_ms\":1700000000000"), std::string::npos);
    EXPECT_NE(json.find("\"producer_pid\":1234"), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"WARNING\""), std::string::npos);
    EXPECT_NE(json.find("\"raw\":[62,10,3]"), std::string::npos);

    FaultState parsed;
    char error[96];
    ASSERT_TRUE(FaultStateStore::deserialize(json.c_str(), json.size(), parsed, error, sizeof(error)));
    ASSERT_EQ(parsed.channelCount, 1);
    EXPECT_STREQ(parsed.channels[0].id, "crank_left");
    EXPECT_EQ(parsed.channels[0].level, FaultLevel::WARNING);
    EXPECT_FLOAT_EQ(parsed.channels[0].value, 6.25f);
    EXPECT_EQ(parsed.channels[0].rawCount, 3);
    EXPECT_EQ(parsed.channels[0].timestampMs, START_EPOCH - 10);
    EXPECT_EQ(parsed.channels[0].sequence, 5u);
    EXPECT_EQ(parsed.producerPid, 1234);
}

TEST(FaultStateJsonTest, RejectsOtherSchema) {
    const char* json = "{\"schema\":\"other\",\"version\":1,\"sequence\":1,\"timestamp_ms\":1,\"channels\":[]}";
    FaultState state;
    char error[96];
    EXPECT_FALSE(FaultStateStore::deserialize(json, strlen(json), state, error, sizeof(error)));
    EXPECT_STRNE(error, "");
}

TEST(FaultStateJsonTest, RejectsNewerVersion) {
    const char* json = "{\"schema\":\"vibmon.fault_state\",\"version\":2,\"sequence\":1,"
                       "\"timestamp_ms\":1,\"channels\":[]}";
    FaultState state;
    char error[96];
    EXPECT_FALSE(FaultStateStore::deserialize(json, strlen(json), state, error, sizeof(error)));
    EXPECT_NE(strstr(error, "version"), nullptr);
}

TEST(FaultStateJsonTest, RejectsUnknownLevel) {
    const char* json = "{\"schema\":\"vibmon.fault_state\",\"version\":1,\"sequence\":1,\"timestamp_ms\":1,"
                       "\"channels\":[{\"id\":\"crank_left\",\"level\":\"SEVERE\"}]}";
    FaultState state;
    char error[96];
    EXPECT_FALSE(FaultStateStore::deserialize(json, strlen(json), state, error, sizeof(error)));
}

TEST(FaultStateJsonTest, RejectsMissingChannels) {
    const char* json = "{\"schema\":\"vibmon.fault_state\",\"version\":1,\"sequence\":1,\"timestamp_ms\":1}";
    FaultState state;
    char error[96];
    EXPECT_FALSE(FaultStateStore::deserialize(json, strlen(json), state, error, sizeof(error)));
}

// ============================================================================
// STORE TESTS
// ============================================================================

class FaultStateStoreTest : public ::testing::Test {
protected:
    StoreConfig config;
    FaultState state;

    void SetUp() override {
        enableMockClock(true);
        setMockMillis(0);
        setMockEpochMillis(START_EPOCH);
        remove(STATE_PATH);

        config.setDefaults();
        strcpy(config.path, STATE_PATH);
        config.maxAgeMs = 3000;

        state.clear();
        state.addChannel("crank_left");
        state.addChannel("crank_right");
    }

    void TearDown() override {
        remove(STATE_PATH);
        enableMockClock(false);
    }

    void writeFile(const char* content) {
        FILE* f = fopen(STATE_PATH, "w");
        ASSERT_NE(f, nullptr);
        fputs(content, f);
        fclose(f);
    }
};

TEST_F(FaultStateStoreTest, PublishThenRead) {
    FaultStateStore store(config);
    state.channels[0].level = FaultLevel::ALARM;
    state.channels[0].value = 12.5f;
    state.channels[1].level = FaultLevel::COMM_FAULT;

    ASSERT_EQ(store.publish(state), StoreStatus::OK);
    EXPECT_EQ(state.sequence, 1u);
    EXPECT_EQ(state.timestampMs, START_EPOCH);
    EXPECT_EQ(state.producerPid, (int32_t)getpid());

    FaultState snapshot;
    FaultStateStore reader(config);
    ASSERT_EQ(reader.read(snapshot), StoreStatus::OK);
    ASSERT_EQ(snapshot.channelCount, 2);
    EXPECT_EQ(snapshot.sequence, 1u);
    EXPECT_EQ(snapshot.channels[0].level, FaultLevel::ALARM);
    EXPECT_FLOAT_EQ(snapshot.channels[0].value, 12.5f);
    EXPECT_EQ(snapshot.channels[1].level, FaultLevel::COMM_FAULT);
    EXPECT_EQ(snapshot.channels[1].timestampMs, START_EPOCH);
}

TEST_F(FaultStateStoreTest, SequencesIncreasePerPublish) {
    FaultStateStore store(config);

    ASSERT_EQ(store.publish(state), StoreStatus::OK);
    advanceMockMillis(1000);
    state.channels[0].timestampMs = epochMillis();
    ASSERT_EQ(store.publish(state), StoreStatus::OK);

    EXPECT_EQ(state.sequence, 2u);
    EXPECT_EQ(state.channels[0].sequence, 2u);
    EXPECT_EQ(state.channels[1].sequence, 2u);
    EXPECT_EQ(state.timestampMs, START_EPOCH + 1000);
}

TEST_F(FaultStateStoreTest, SequenceContinuesAcrossRestart) {
    {
        FaultStateStore first(config);
        ASSERT_EQ(first.publish(state), StoreStatus::OK);
        ASSERT_EQ(first.publish(state), StoreStatus::OK);
    }

    advanceMockMillis(500);
    FaultStateStore second(config);
    FaultState fresh;
    fresh.clear();
    fresh.addChannel("crank_left");
    fresh.addChannel("tail_bearing");
    ASSERT_EQ(second.publish(fresh), StoreStatus::OK);

    EXPECT_EQ(fresh.sequence, 3u);
    EXPECT_EQ(fresh.channels[0].sequence, 3u);
    EXPECT_EQ(fresh.channels[1].sequence, 1u);     // New channel starts its own count
}

TEST_F(FaultStateStoreTest, ClockStepBackHoldsRecordTime) {
    FaultStateStore store(config);
    ASSERT_EQ(store.publish(state), StoreStatus::OK);

    setMockEpochMillis(START_EPOCH - 5000);
    state.channels[0].timestampMs = START_EPOCH - 5000;
    ASSERT_EQ(store.publish(state), StoreStatus::OK);

    EXPECT_EQ(state.timestampMs, START_EPOCH);
    EXPECT_EQ(state.channels[0].timestampMs, START_EPOCH);
}

TEST_F(FaultStateStoreTest, OldRecordIsStale) {
    FaultStateStore store(config);
    state.channels[0].level = FaultLevel::CRITICAL;
    ASSERT_EQ(store.publish(state), StoreStatus::OK);

    FaultState snapshot;
    advanceMockMillis(3000);
    EXPECT_EQ(store.read(snapshot), StoreStatus::OK);

    advanceMockMillis(1);
    EXPECT_EQ(store.read(snapshot), StoreStatus::STALE);
    EXPECT_EQ(snapshot.channels[0].level, FaultLevel::CRITICAL);
    EXPECT_STRNE(store.getError(), "");
}

TEST_F(FaultStateStoreTest, ZeroMaxAgeNeverStale) {
    config.maxAgeMs = 0;
    FaultStateStore store(config);
    ASSERT_EQ(store.publish(state), StoreStatus::OK);

    advanceMockMillis(3600000);
    FaultState snapshot;
    EXPECT_EQ(store.read(snapshot), StoreStatus::OK);
}

TEST_F(FaultStateStoreTest, MissingFileIsReadError) {
    FaultStateStore store(config);
    FaultState snapshot;
    EXPECT_EQ(store.read(snapshot), StoreStatus::READ_ERROR);
}

TEST_F(FaultStateStoreTest, TruncatedFileIsReadError) {
    writeFile("{\"schema\":\"vibmon.fault_state\",\"version\":1,\"seq");
    FaultStateStore store(config);
    FaultState snapshot;
    EXPECT_EQ(store.read(snapshot), StoreStatus::READ_ERROR);
}

TEST_F(FaultStateStoreTest, CorruptRecordDoesNotBlockPublish) {
    writeFile("not json at all");
    FaultStateStore store(config);

    ASSERT_EQ(store.publish(state), StoreStatus::OK);
    EXPECT_EQ(state.sequence, 1u);

    FaultState snapshot;
    EXPECT_EQ(store.read(snapshot), StoreStatus::OK);
}

TEST_F(FaultStateStoreTest, NoTemporaryFileLeftBehind) {
    FaultStateStore store(config);
    ASSERT_EQ(store.publish(state), StoreStatus::OK);

    std::string tmp = std::string(STATE_PATH) + ".tmp";
    EXPECT_NE(access(tmp.c_str(), F_OK), 0);
}

TEST_F(FaultStateStoreTest, UnwritableDirectoryIsWriteError) {
    strcpy(config.path, "no_such_directory/fault_state.json");
    FaultStateStore store(config);

    EXPECT_EQ(store.publish(state), StoreStatus::WRITE_ERROR);
    EXPECT_STRNE(store.getError(), "");
}

TEST_F(FaultStateStoreTest, FailedPublishKeepsSequence) {
    FaultStateStore good(config);
    ASSERT_EQ(good.publish(state), StoreStatus::OK);

    StoreConfig badConfig = config;
    strcpy(badConfig.path, "no_such_directory/fault_state.json");
    FaultStateStore bad(badConfig);
    EXPECT_EQ(bad.publish(state), StoreStatus::WRITE_ERROR);

    // The earlier record is still the one on disk
    FaultState snapshot;
    ASSERT_EQ(good.read(snapshot), StoreStatus::OK);
    EXPECT_EQ(snapshot.sequence, 1u);
}
