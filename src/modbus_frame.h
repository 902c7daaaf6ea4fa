/**
 * @file modbus_frame.h
 * @brief Modbus PDU/ADU encoding and decoding for RTU and TCP framing
 *
 * Only the function codes the monitor needs are covered:
 * - 0x03 Read Holding Registers (sensor polling, read-back)
 * - 0x06 Write Single Register (alarm outputs)
 * - 0x10 Write Multiple Registers (status block)
 *
 * All multi-byte fields are big-endian except the RTU CRC, which is sent
 * low byte first.
 */

#ifndef MODBUS_FRAME_H
#define MODBUS_FRAME_H

#include <stdint.h>
#include <stddef.h>

// ============================================================================
// PROTOCOL CONSTANTS
// ============================================================================

#define MODBUS_FC_READ_HOLDING_REGISTERS   0x03
#define MODBUS_FC_WRITE_SINGLE_REGISTER    0x06
#define MODBUS_FC_WRITE_MULTIPLE_REGISTERS 0x10
#define MODBUS_EXCEPTION_FLAG              0x80

#define MODBUS_MAX_PDU_LENGTH   253
#define MODBUS_RTU_MAX_ADU      256     // unit + PDU + CRC
#define MODBUS_TCP_MAX_ADU      260     // MBAP + PDU
#define MODBUS_MBAP_LENGTH      7       // tid(2) pid(2) len(2) unit(1)
#define MODBUS_RTU_HEADER_PEEK  3       // unit, function, byte count / code

// ============================================================================
// STATUS CODES
// ============================================================================

enum class ModbusStatus : uint8_t {
    OK = 0,
    TIMEOUT,              // No complete response within the transaction timeout
    CRC_ERROR,            // RTU checksum mismatch
    FRAME_ERROR,          // Malformed or mismatched response (unit, tid, length)
    EXCEPTION_RESPONSE,   // Device rejected a well-formed request
    CONNECTION_ERROR,     // Port or socket unavailable
    INVALID_ARGUMENT      // Request outside protocol limits, never sent
};

enum class ModbusMode : uint8_t {
    RTU = 0,
    TCP
};

const char* modbusStatusToString(ModbusStatus status);
const char* modbusExceptionToString(uint8_t code);

// Transport-level failures worth another attempt
bool isRetryableStatus(ModbusStatus status);

// ============================================================================
// CODEC
// ============================================================================

class ModbusCodec {
public:
    // CRC-16/MODBUS (poly 0xA001 reflected, init 0xFFFF)
    static uint16_t crc16(const uint8_t* data, size_t length);

    // Request PDU builders. Return the PDU length, or 0 for invalid arguments.
    static size_t buildReadHoldingRegisters(uint8_t* pdu, uint16_t startAddress, uint16_t count);
    static size_t buildWriteSingleRegister(uint8_t* pdu, uint16_t address, uint16_t value);
    static size_t buildWriteMultipleRegisters(uint8_t* pdu, uint16_t startAddress,
                                              const uint16_t* values, uint16_t count);

    // ADU wrapping. Return the ADU length.
    static size_t wrapRtu(uint8_t* adu, uint8_t unitAddress, const uint8_t* pdu, size_t pduLength);
    static size_t wrapTcp(uint8_t* adu, uint16_t transactionId, uint8_t unitAddress,
                          const uint8_t* pdu, size_t pduLength);

    /**
     * @brief Validate an RTU response frame and locate its PDU
     * @return OK, CRC_ERROR or FRAME_ERROR
     */
    static ModbusStatus unwrapRtu(const uint8_t* adu, size_t length, uint8_t expectedUnit,
                                  size_t& pduOffset, size_t& pduLength);

    /**
     * @brief Validate a TCP response frame (MBAP) and locate its PDU
     * @return OK or FRAME_ERROR
     */
    static ModbusStatus unwrapTcp(const uint8_t* adu, size_t length, uint16_t expectedTransactionId,
                                  uint8_t expectedUnit, size_t& pduOffset, size_t& pduLength);

    /**
     * @brief Total RTU response length implied by the first three bytes
     * @return Frame length including CRC, or 0 for an unsupported function code
     */
    static size_t rtuResponseLength(const uint8_t* head);

    // Number of bytes following the 6-byte MBAP prefix (unit id + PDU)
    static uint16_t tcpFollowingLength(const uint8_t* mbap);

    // Response PDU parsers. EXCEPTION_RESPONSE sets exceptionCode.
    static ModbusStatus parseReadHoldingRegisters(const uint8_t* pdu, size_t length, uint16_t count,
                                                  uint16_t* values, uint8_t& exceptionCode);
    static ModbusStatus parseWriteSingleRegister(const uint8_t* pdu, size_t length, uint16_t address,
                                                 uint16_t value, uint8_t& exceptionCode);
    static ModbusStatus parseWriteMultipleRegisters(const uint8_t* pdu, size_t length,
                                                    uint16_t startAddress, uint16_t count,
                                                    uint8_t& exceptionCode);

private:
    static ModbusStatus checkFunction(const uint8_t* pdu, size_t length, uint8_t function,
                                      uint8_t& exceptionCode);
    static void writeU16(uint8_t* dst, uint16_t value);
    static uint16_t readU16(const uint8_t* src);
};

#endif // MODBUS_FRAME_H
