/**
 * @file fault_level.h
 * @brief Ordered fault severity shared by the sensor and alarm daemons
 */

#ifndef FAULT_LEVEL_H
#define FAULT_LEVEL_H

#include <stdint.h>
#include <stdbool.h>

// Ordinary levels are ordered by severity. COMM_FAULT is reported by the
// poll loop when a channel cannot be read and never comes out of the analyzer.
enum class FaultLevel : uint8_t {
    NORMAL = 0,
    WARNING,
    ALARM,
    CRITICAL,
    COMM_FAULT
};

#define FAULT_LEVEL_COUNT       5
#define ORDINARY_LEVEL_COUNT    4

// Bit for a level in a level set (OutputConfig::assertLevels)
inline uint8_t faultLevelBit(FaultLevel level) {
    return (uint8_t)(1u << static_cast<uint8_t>(level));
}

// Upper-case names used in the fault state file: "NORMAL", "WARNING", ...
const char* faultLevelToString(FaultLevel level);

// Case-insensitive; returns false for unknown names
bool faultLevelFromString(const char* name, FaultLevel& level);

/**
 * @brief Parse a comma separated list of level names into a bit set
 * @return false if any entry is unknown
 */
bool parseFaultLevelSet(const char* list, uint8_t& levels);

#endif // FAULT_LEVEL_H
