/**
 * @file modbus_link.h
 * @brief Modbus master link over serial RTU or TCP with retry and backoff
 *
 * One connection is opened once and reused for every poll. Requests are
 * strictly sequential: a single request is in flight at any time, which
 * matches the half-duplex RS-485 bus and keeps TCP behaviour deterministic.
 *
 * Retry policy lives here and nowhere else. Timeouts, CRC and framing
 * errors are retried up to maxRetries times with a doubling delay capped at
 * backoffCapMs. Exception responses are the device's answer and are
 * returned immediately.
 */

#ifndef MODBUS_LINK_H
#define MODBUS_LINK_H

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>
#include "config.h"
#include "modbus_frame.h"

// ============================================================================
// LINK CONFIGURATION
// ============================================================================

struct ModbusLinkConfig {
    ModbusMode mode;

    // Serial (RTU)
    char port[PATH_LENGTH];
    uint32_t baudRate;
    uint8_t dataBits;
    char parity;            // 'N', 'E' or 'O'
    uint8_t stopBits;

    // TCP
    char host[64];
    uint16_t tcpPort;

    // Transaction policy
    uint32_t timeoutMs;
    uint8_t maxRetries;
    uint32_t backoffBaseMs;
    uint32_t backoffCapMs;

    void setDefaults();
};

// ============================================================================
// TRANSPORT INTERFACE
// ============================================================================

/**
 * @brief Byte pipe underneath the link (serial port, socket, or a test double)
 */
class ModbusTransport {
public:
    virtual ~ModbusTransport() = default;

    virtual ModbusStatus open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual ModbusStatus send(const uint8_t* data, size_t length) = 0;

    /**
     * @brief Read exactly length bytes
     * @return OK, TIMEOUT if they did not all arrive in time, or CONNECTION_ERROR
     */
    virtual ModbusStatus receive(uint8_t* buffer, size_t length, uint32_t timeoutMs) = 0;

    // Drop any unread bytes left over from an earlier exchange
    virtual void discardInput() {}

    virtual const char* getName() const = 0;
};

/**
 * @brief RS-485/RS-232 serial port, opened exclusively
 *
 * A port already held by another process (flock) fails to open with
 * CONNECTION_ERROR instead of waiting.
 */
class SerialTransport : public ModbusTransport {
public:
    SerialTransport(const char* device, uint32_t baudRate, uint8_t dataBits,
                    char parity, uint8_t stopBits, uint32_t timeoutMs);
    ~SerialTransport() override;

    ModbusStatus open() override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }
    ModbusStatus send(const uint8_t* data, size_t length) override;
    ModbusStatus receive(uint8_t* buffer, size_t length, uint32_t timeoutMs) override;
    void discardInput() override;
    const char* getName() const override { return device_; }

private:
    char device_[PATH_LENGTH];
    uint32_t baudRate_;
    uint8_t dataBits_;
    char parity_;
    uint8_t stopBits_;
    uint32_t timeoutMs_;            // Longest wait for the output buffer to drain
    int fd_;

    bool configurePort();
};

/**
 * @brief Modbus TCP client socket
 */
class TcpTransport : public ModbusTransport {
public:
    TcpTransport(const char* host, uint16_t port, uint32_t timeoutMs);
    ~TcpTransport() override;

    ModbusStatus open() override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }
    ModbusStatus send(const uint8_t* data, size_t length) override;
    ModbusStatus receive(uint8_t* buffer, size_t length, uint32_t timeoutMs) override;
    void discardInput() override;
    const char* getName() const override { return name_; }

private:
    char host_[64];
    uint16_t port_;
    uint32_t timeoutMs_;            // Connect and send timeout
    char name_[80];
    int fd_;
};

// Builds the transport described by config. Caller owns the result.
ModbusTransport* createTransport(const ModbusLinkConfig& config);

// ============================================================================
// MODBUS LINK
// ============================================================================

struct ModbusLinkStats {
    uint32_t requests;
    uint32_t retries;
    uint32_t timeouts;
    uint32_t crcErrors;
    uint32_t frameErrors;
    uint32_t exceptions;
    uint32_t connectionErrors;
};

class ModbusLink {
public:
    // transport is not owned and must outlive the link
    ModbusLink(ModbusTransport* transport, const ModbusLinkConfig& config);
    ~ModbusLink();

    // Open the underlying transport. CONNECTION_ERROR if it cannot be opened.
    ModbusStatus connect();
    void close();
    bool isConnected() const;

    // Function 0x03
    ModbusStatus readRegisters(uint8_t unitAddress, uint16_t startAddress, uint16_t count,
                               uint16_t* values);

    // Function 0x06
    ModbusStatus writeRegister(uint8_t unitAddress, uint16_t address, uint16_t value);

    // Function 0x10 (or 0x06 when count is 1)
    ModbusStatus writeRegisters(uint8_t unitAddress, uint16_t startAddress,
                                const uint16_t* values, uint16_t count);

    // Exception code of the last EXCEPTION_RESPONSE
    uint8_t getLastExceptionCode() const { return lastExceptionCode_; }

    // Attempts used by the last request (1 = no retry)
    uint8_t getLastAttempts() const { return lastAttempts_; }

    const ModbusLinkStats& getStats() const { return stats_; }
    const ModbusLinkConfig& getConfig() const { return config_; }

    // Delay before retry number retryIndex (0-based)
    uint32_t backoffDelayMs(uint8_t retryIndex) const;

private:
    struct Request {
        uint8_t unitAddress;
        uint8_t function;
        uint16_t address;
        uint16_t count;
        uint16_t value;
        uint16_t* readValues;
        uint8_t pdu[MODBUS_MAX_PDU_LENGTH];
        size_t pduLength;
    };

    ModbusTransport* transport_;
    ModbusLinkConfig config_;
    ModbusLinkStats stats_;
    uint16_t transactionId_;
    uint8_t lastExceptionCode_;
    uint8_t lastAttempts_;

    ModbusStatus execute(Request& request);
    ModbusStatus attempt(Request& request);
    ModbusStatus receiveRtu(const Request& request, uint8_t* response, size_t& pduOffset, size_t& pduLength);
    ModbusStatus receiveTcp(const Request& request, uint8_t* response, size_t& pduOffset, size_t& pduLength);
    ModbusStatus validate(Request& request, const uint8_t* pdu, size_t pduLength);
    void countFailure(ModbusStatus status);
};

#endif // MODBUS_LINK_H
