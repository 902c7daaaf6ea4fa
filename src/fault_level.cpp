/**
 * @file fault_level.cpp
 * @brief Fault level names
 */

#include "fault_level.h"

#include <ctype.h>
#include <string.h>
#include <strings.h>

static const char* const LEVEL_NAMES[FAULT_LEVEL_COUNT] = {
    "NORMAL", "WARNING", "ALARM", "CRITICAL", "COMM_FAULT"
};

const char* faultLevelToString(FaultLevel level) {
    uint8_t index = static_cast<uint8_t>(level);
    if (index >= FAULT_LEVEL_COUNT) {
        return "UNKNOWN";
    }
    return LEVEL_NAMES[index];
}

bool faultLevelFromString(const char* name, FaultLevel& level) {
    if (name == nullptr) {
        return false;
    }
    for (uint8_t i = 0; i < FAULT_LEVEL_COUNT; i++) {
        if (strcasecmp(name, LEVEL_NAMES[i]) == 0) {
            level = static_cast<FaultLevel>(i);
            return true;
        }
    }
    return false;
}

bool parseFaultLevelSet(const char* list, uint8_t& levels) {
    levels = 0;
    if (list == nullptr) {
        return false;
    }

    char token[16];
    const char* p = list;
    while (*p) {
        while (*p == ',' || isspace((unsigned char)*p)) p++;
        if (*p == '\0') break;

        size_t len = 0;
        while (p[len] && p[len] != ',' && !isspace((unsigned char)p[len])) len++;
        if (len >= sizeof(token)) {
            return false;
        }
        memcpy(token, p, len);
        token[len] = '\0';
        p += len;

        FaultLevel level;
        if (!faultLevelFromString(token, level)) {
            return false;
        }
        levels |= faultLevelBit(level);
    }
    return levels != 0;
}
