/**
 * @file test_modbus_link.cpp
 * @brief Google Test unit tests for the Modbus link retry policy
 */

#include <gtest/gtest.h>
#include "mock_transport.h"
#include "../src/modbus_link.h"
#include "../src/sys_clock.h"

class ModbusLinkTest : public ::testing::Test {
protected:
    MockTransport* transport;
    ModbusLink* link;
    ModbusLinkConfig config;

    void SetUp() override {
        enableMockClock(true);
        setMockMillis(0);
        setMockEpochMillis(1700000000000ULL);

        config.setDefaults();
        transport = new MockTransport();
        link = new ModbusLink(transport, config);
        ASSERT_EQ(link->connect(), ModbusStatus::OK);
    }

    void TearDown() override {
        delete link;
        delete transport;
        enableMockClock(false);
    }

    void recreate() {
        delete link;
        link = new ModbusLink(transport, config);
    }
};

// ============================================================================
// NORMAL TRANSACTIONS
// ============================================================================

TEST_F(ModbusLinkTest, ReadThreeAxes) {
    transport->setRegister(1, 1, 62);
    transport->setRegister(1, 2, 10);
    transport->setRegister(1, 3, 3);

    uint16_t values[3] = { 0 };
    EXPECT_EQ(link->readRegisters(1, 1, 3, values), ModbusStatus::OK);
    EXPECT_EQ(values[0], 62);
    EXPECT_EQ(values[1], 10);
    EXPECT_EQ(values[2], 3);
    EXPECT_EQ(link->getLastAttempts(), 1);
    EXPECT_EQ(transport->getRequestCount(), 1u);
}

TEST_F(ModbusLinkTest, WriteSingleRegister) {
    EXPECT_EQ(link->writeRegister(1, 101, 82), ModbusStatus::OK);
    EXPECT_EQ(transport->getRegister(1, 101), 82);
    EXPECT_EQ(transport->getLastRequest()[1], MODBUS_FC_WRITE_SINGLE_REGISTER);
}

TEST_F(ModbusLinkTest, WriteRegisterBlock) {
    const uint16_t values[] = { 2, 0, 2, 4 };
    EXPECT_EQ(link->writeRegisters(1, 3502, values, 4), ModbusStatus::OK);
    EXPECT_EQ(transport->getLastRequest()[1], MODBUS_FC_WRITE_MULTIPLE_REGISTERS);
    EXPECT_EQ(transport->getRegister(1, 3502), 2);
    EXPECT_EQ(transport->getRegister(1, 3505), 4);
}

TEST_F(ModbusLinkTest, SingleValueBlockUsesWriteSingle) {
    const uint16_t value = 7;
    EXPECT_EQ(link->writeRegisters(1, 200, &value, 1), ModbusStatus::OK);
    EXPECT_EQ(transport->getLastRequest()[1], MODBUS_FC_WRITE_SINGLE_REGISTER);
}

TEST_F(ModbusLinkTest, InvalidArgumentsAreNeverSent) {
    uint16_t values[2];
    EXPECT_EQ(link->readRegisters(0, 1, 1, values), ModbusStatus::INVALID_ARGUMENT);
    EXPECT_EQ(link->readRegisters(248, 1, 1, values), ModbusStatus::INVALID_ARGUMENT);
    EXPECT_EQ(link->readRegisters(1, 1, 0, values), ModbusStatus::INVALID_ARGUMENT);
    EXPECT_EQ(link->readRegisters(1, 1, 126, values), ModbusStatus::INVALID_ARGUMENT);
    EXPECT_EQ(transport->getRequestCount(), 0u);
}

// ============================================================================
// RETRY POLICY
// ============================================================================

TEST_F(ModbusLinkTest, TimeoutRetriedThenSucceeds) {
    transport->setRegister(2, 1, 55);
    transport->queueFailure(ModbusStatus::TIMEOUT, 2);

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(2, 1, 1, &value), ModbusStatus::OK);
    EXPECT_EQ(value, 55);
    EXPECT_EQ(link->getLastAttempts(), 3);
    EXPECT_EQ(link->getStats().retries, 2u);
    EXPECT_EQ(link->getStats().timeouts, 2u);
}

TEST_F(ModbusLinkTest, GivesUpAfterMaxRetries) {
    transport->queueFailure(ModbusStatus::TIMEOUT, 5);

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 1, 1, &value), ModbusStatus::TIMEOUT);
    EXPECT_EQ(link->getLastAttempts(), config.maxRetries + 1);
    EXPECT_EQ(transport->getRequestCount(), (size_t)(config.maxRetries + 1));
}

TEST_F(ModbusLinkTest, BackoffDoublesUpToCap) {
    EXPECT_EQ(link->backoffDelayMs(0), 50u);
    EXPECT_EQ(link->backoffDelayMs(1), 100u);
    EXPECT_EQ(link->backoffDelayMs(2), 200u);
    EXPECT_EQ(link->backoffDelayMs(3), 400u);
    EXPECT_EQ(link->backoffDelayMs(7), 400u);
}

TEST_F(ModbusLinkTest, FailedRequestSpendsTimeoutsPlusBackoff) {
    transport->queueFailure(ModbusStatus::TIMEOUT, 3);

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 1, 1, &value), ModbusStatus::TIMEOUT);

    // 3 x 500 ms timeouts, then 50 + 100 ms of backoff between them
    EXPECT_EQ(millis(), 1650u);
}

TEST_F(ModbusLinkTest, NoRetriesConfigured) {
    config.maxRetries = 0;
    recreate();
    transport->queueFailure(ModbusStatus::TIMEOUT);

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 1, 1, &value), ModbusStatus::TIMEOUT);
    EXPECT_EQ(transport->getRequestCount(), 1u);
}

TEST_F(ModbusLinkTest, ExceptionIsNotRetried) {
    transport->queueException(1, MODBUS_FC_READ_HOLDING_REGISTERS, 0x02);

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 9999, 1, &value), ModbusStatus::EXCEPTION_RESPONSE);
    EXPECT_EQ(link->getLastExceptionCode(), 0x02);
    EXPECT_EQ(link->getLastAttempts(), 1);
    EXPECT_EQ(transport->getRequestCount(), 1u);
    EXPECT_EQ(link->getStats().exceptions, 1u);
}

TEST_F(ModbusLinkTest, CorruptedResponseRetried) {
    transport->setRegister(1, 1, 40);
    uint8_t pdu[] = { 0x03, 0x02, 0x00, 0x28 };
    std::vector<uint8_t> frame = MockTransport::rtuFrame(1, pdu, sizeof(pdu));
    frame[4] ^= 0xFF;
    transport->queueBytes(frame);

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 1, 1, &value), ModbusStatus::OK);
    EXPECT_EQ(value, 40);
    EXPECT_EQ(link->getStats().crcErrors, 1u);
    EXPECT_EQ(link->getLastAttempts(), 2);
}

TEST_F(ModbusLinkTest, ResponseFromWrongUnitRetried) {
    transport->setRegister(3, 1, 12);
    uint8_t pdu[] = { 0x03, 0x02, 0x00, 0x01 };
    transport->queueBytes(MockTransport::rtuFrame(4, pdu, sizeof(pdu)));

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(3, 1, 1, &value), ModbusStatus::OK);
    EXPECT_EQ(value, 12);
    EXPECT_EQ(link->getStats().frameErrors, 1u);
}

TEST_F(ModbusLinkTest, ReopensAfterConnectionError) {
    transport->setRegister(1, 1, 9);
    transport->queueFailure(ModbusStatus::CONNECTION_ERROR);
    transport->failOpen(1);

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 1, 1, &value), ModbusStatus::OK);
    EXPECT_EQ(value, 9);
    EXPECT_TRUE(link->isConnected());
    // connect() in SetUp, one refused reopen, one successful reopen
    EXPECT_EQ(transport->getOpenCount(), 3);
}

TEST_F(ModbusLinkTest, ConnectFailureReported) {
    link->close();
    transport->failOpen(1);
    EXPECT_EQ(link->connect(), ModbusStatus::CONNECTION_ERROR);
    EXPECT_FALSE(link->isConnected());
}

// ============================================================================
// TCP FRAMING THROUGH THE LINK
// ============================================================================

TEST_F(ModbusLinkTest, TcpReadUsesMbap) {
    config.mode = ModbusMode::TCP;
    recreate();

    // Transaction id 1 is the first request of a new link
    const uint8_t response[] = { 0x00, 0x01, 0x00, 0x00, 0x00, 0x05, 0x01, 0x03, 0x02, 0x00, 0x3E };
    transport->queueBytes(std::vector<uint8_t>(response, response + sizeof(response)));

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 0, 1, &value), ModbusStatus::OK);
    EXPECT_EQ(value, 0x3E);

    const std::vector<uint8_t>& request = transport->getLastRequest();
    ASSERT_EQ(request.size(), 12u);
    EXPECT_EQ(request[5], 0x06);
    EXPECT_EQ(request[6], 0x01);
    EXPECT_EQ(request[7], MODBUS_FC_READ_HOLDING_REGISTERS);
}

TEST_F(ModbusLinkTest, TcpStaleTransactionIdRetried) {
    config.mode = ModbusMode::TCP;
    recreate();

    const uint8_t stale[] = { 0x00, 0x09, 0x00, 0x00, 0x00, 0x05, 0x01, 0x03, 0x02, 0x00, 0x01 };
    const uint8_t fresh[] = { 0x00, 0x02, 0x00, 0x00, 0x00, 0x05, 0x01, 0x03, 0x02, 0x00, 0x02 };
    transport->queueBytes(std::vector<uint8_t>(stale, stale + sizeof(stale)));
    transport->queueBytes(std::vector<uint8_t>(fresh, fresh + sizeof(fresh)));

    uint16_t value = 0;
    EXPECT_EQ(link->readRegisters(1, 0, 1, &value), ModbusStatus::OK);
    EXPECT_EQ(value, 2);
    EXPECT_EQ(link->getLastAttempts(), 2);
}
