/**
 * @file modbus_frame.cpp
 * @brief Modbus framing implementation
 */

#include "modbus_frame.h"
#include "config.h"

#include <string.h>

// ============================================================================
// STATUS HELPERS
// ============================================================================

const char* modbusStatusToString(ModbusStatus status) {
    switch (status) {
        case ModbusStatus::OK: return "OK";
        case ModbusStatus::TIMEOUT: return "TIMEOUT";
        case ModbusStatus::CRC_ERROR: return "CRC_ERROR";
        case ModbusStatus::FRAME_ERROR: return "FRAME_ERROR";
        case ModbusStatus::EXCEPTION_RESPONSE: return "EXCEPTION_RESPONSE";
        case ModbusStatus::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case ModbusStatus::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        default: return "UNKNOWN";
    }
}

const char* modbusExceptionToString(uint8_t code) {
    switch (code) {
        case 0x01: return "ILLEGAL_FUNCTION";
        case 0x02: return "ILLEGAL_DATA_ADDRESS";
        case 0x03: return "ILLEGAL_DATA_VALUE";
        case 0x04: return "SLAVE_DEVICE_FAILURE";
        case 0x05: return "ACKNOWLEDGE";
        case 0x06: return "SLAVE_DEVICE_BUSY";
        case 0x08: return "MEMORY_PARITY_ERROR";
        case 0x0A: return "GATEWAY_PATH_UNAVAILABLE";
        case 0x0B: return "GATEWAY_TARGET_NO_RESPONSE";
        default: return "UNKNOWN_EXCEPTION";
    }
}

bool isRetryableStatus(ModbusStatus status) {
    return status == ModbusStatus::TIMEOUT ||
           status == ModbusStatus::CRC_ERROR ||
           status == ModbusStatus::FRAME_ERROR ||
           status == ModbusStatus::CONNECTION_ERROR;
}

// ============================================================================
// CODEC IMPLEMENTATION
// ============================================================================

uint16_t ModbusCodec::crc16(const uint8_t* data, size_t length) {
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < length; i++) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; bit++) {
            if (crc & 0x0001) {
                crc = (crc >> 1) ^ 0xA001;
            } else {
                crc >>= 1;
            }
        }
    }
    return crc;
}

void ModbusCodec::writeU16(uint8_t* dst, uint16_t value) {
    dst[0] = (uint8_t)(value >> 8);
    dst[1] = (uint8_t)(value & 0xFF);
}

uint16_t ModbusCodec::readU16(const uint8_t* src) {
    return (uint16_t)((src[0] << 8) | src[1]);
}

size_t ModbusCodec::buildReadHoldingRegisters(uint8_t* pdu, uint16_t startAddress, uint16_t count) {
    if (count == 0 || count > MODBUS_MAX_READ_COUNT) {
        return 0;
    }
    if ((uint32_t)startAddress + count > 0x10000UL) {
        return 0;
    }
    pdu[0] = MODBUS_FC_READ_HOLDING_REGISTERS;
    writeU16(pdu + 1, startAddress);
    writeU16(pdu + 3, count);
    return 5;
}

size_t ModbusCodec::buildWriteSingleRegister(uint8_t* pdu, uint16_t address, uint16_t value) {
    pdu[0] = MODBUS_FC_WRITE_SINGLE_REGISTER;
    writeU16(pdu + 1, address);
    writeU16(pdu + 3, value);
    return 5;
}

size_t ModbusCodec::buildWriteMultipleRegisters(uint8_t* pdu, uint16_t startAddress,
                                                const uint16_t* values, uint16_t count) {
    if (values == nullptr || count == 0 || count > MODBUS_MAX_WRITE_COUNT) {
        return 0;
    }
    if ((uint32_t)startAddress + count > 0x10000UL) {
        return 0;
    }
    pdu[0] = MODBUS_FC_WRITE_MULTIPLE_REGISTERS;
    writeU16(pdu + 1, startAddress);
    writeU16(pdu + 3, count);
    pdu[5] = (uint8_t)(count * 2);
    for (uint16_t i = 0; i < count; i++) {
        writeU16(pdu + 6 + i * 2, values[i]);
    }
    return 6 + (size_t)count * 2;
}

size_t ModbusCodec::wrapRtu(uint8_t* adu, uint8_t unitAddress, const uint8_t* pdu, size_t pduLength) {
    adu[0] = unitAddress;
    memcpy(adu + 1, pdu, pduLength);
    uint16_t crc = crc16(adu, pduLength + 1);
    adu[pduLength + 1] = (uint8_t)(crc & 0xFF);
    adu[pduLength + 2] = (uint8_t)(crc >> 8);
    return pduLength + 3;
}

size_t ModbusCodec::wrapTcp(uint8_t* adu, uint16_t transactionId, uint8_t unitAddress,
                            const uint8_t* pdu, size_t pduLength) {
    writeU16(adu, transactionId);
    writeU16(adu + 2, 0);                          // protocol id
    writeU16(adu + 4, (uint16_t)(pduLength + 1));  // unit id + PDU
    adu[6] = unitAddress;
    memcpy(adu + MODBUS_MBAP_LENGTH, pdu, pduLength);
    return MODBUS_MBAP_LENGTH + pduLength;
}

ModbusStatus ModbusCodec::unwrapRtu(const uint8_t* adu, size_t length, uint8_t expectedUnit,
                                    size_t& pduOffset, size_t& pduLength) {
    // Smallest valid frame is an exception: unit, function, code, crc(2)
    if (length < 5) {
        return ModbusStatus::FRAME_ERROR;
    }
    uint16_t received = (uint16_t)(adu[length - 2] | (adu[length - 1] << 8));
    if (crc16(adu, length - 2) != received) {
        return ModbusStatus::CRC_ERROR;
    }
    if (adu[0] != expectedUnit) {
        return ModbusStatus::FRAME_ERROR;
    }
    pduOffset = 1;
    pduLength = length - 3;
    return ModbusStatus::OK;
}

ModbusStatus ModbusCodec::unwrapTcp(const uint8_t* adu, size_t length, uint16_t expectedTransactionId,
                                    uint8_t expectedUnit, size_t& pduOffset, size_t& pduLength) {
    if (length < MODBUS_MBAP_LENGTH + 2) {
        return ModbusStatus::FRAME_ERROR;
    }
    if (readU16(adu) != expectedTransactionId || readU16(adu + 2) != 0) {
        return ModbusStatus::FRAME_ERROR;
    }
    uint16_t following = readU16(adu + 4);
    if ((size_t)following + 6 != length) {
        return ModbusStatus::FRAME_ERROR;
    }
    if (adu[6] != expectedUnit) {
        return ModbusStatus::FRAME_ERROR;
    }
    pduOffset = MODBUS_MBAP_LENGTH;
    pduLength = length - MODBUS_MBAP_LENGTH;
    return ModbusStatus::OK;
}

size_t ModbusCodec::rtuResponseLength(const uint8_t* head) {
    uint8_t function = head[1];
    if (function & MODBUS_EXCEPTION_FLAG) {
        return 5;
    }
    switch (function) {
        case MODBUS_FC_READ_HOLDING_REGISTERS:
            return 3 + (size_t)head[2] + 2;
        case MODBUS_FC_WRITE_SINGLE_REGISTER:
        case MODBUS_FC_WRITE_MULTIPLE_REGISTERS:
            return 8;
        default:
            return 0;
    }
}

uint16_t ModbusCodec::tcpFollowingLength(const uint8_t* mbap) {
    return readU16(mbap + 4);
}

ModbusStatus ModbusCodec::checkFunction(const uint8_t* pdu, size_t length, uint8_t function,
                                        uint8_t& exceptionCode) {
    if (length < 2) {
        return ModbusStatus::FRAME_ERROR;
    }
    if (pdu[0] == (uint8_t)(function | MODBUS_EXCEPTION_FLAG)) {
        exceptionCode = pdu[1];
        return ModbusStatus::EXCEPTION_RESPONSE;
    }
    if (pdu[0] != function) {
        return ModbusStatus::FRAME_ERROR;
    }
    return ModbusStatus::OK;
}

ModbusStatus ModbusCodec::parseReadHoldingRegisters(const uint8_t* pdu, size_t length, uint16_t count,
                                                    uint16_t* values, uint8_t& exceptionCode) {
    ModbusStatus status = checkFunction(pdu, length, MODBUS_FC_READ_HOLDING_REGISTERS, exceptionCode);
    if (status != ModbusStatus::OK) {
        return status;
    }
    size_t byteCount = pdu[1];
    if (byteCount != (size_t)count * 2 || length != 2 + byteCount) {
        return ModbusStatus::FRAME_ERROR;
    }
    for (uint16_t i = 0; i < count; i++) {
        values[i] = readU16(pdu + 2 + i * 2);
    }
    return ModbusStatus::OK;
}

ModbusStatus ModbusCodec::parseWriteSingleRegister(const uint8_t* pdu, size_t length, uint16_t address,
                                                   uint16_t value, uint8_t& exceptionCode) {
    ModbusStatus status = checkFunction(pdu, length, MODBUS_FC_WRITE_SINGLE_REGISTER, exceptionCode);
    if (status != ModbusStatus::OK) {
        return status;
    }
    // Normal response echoes the request
    if (length != 5 || readU16(pdu + 1) != address || readU16(pdu + 3) != value) {
        return ModbusStatus::FRAME_ERROR;
    }
    return ModbusStatus::OK;
}

ModbusStatus ModbusCodec::parseWriteMultipleRegisters(const uint8_t* pdu, size_t length,
                                                      uint16_t startAddress, uint16_t count,
                                                      uint8_t& exceptionCode) {
    ModbusStatus status = checkFunction(pdu, length, MODBUS_FC_WRITE_MULTIPLE_REGISTERS, exceptionCode);
    if (status != ModbusStatus::OK) {
        return status;
    }
    if (length != 5 || readU16(pdu + 1) != startAddress || readU16(pdu + 3) != count) {
        return ModbusStatus::FRAME_ERROR;
    }
    return ModbusStatus::OK;
}
