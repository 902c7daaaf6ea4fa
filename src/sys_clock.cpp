/**
 * @file sys_clock.cpp
 * @brief Clock implementation backed by std::chrono, or by mock counters
 */

#include "sys_clock.h"

#include <chrono>
#include <thread>

static bool mockEnabled = false;
static uint32_t mockMillisValue = 0;
static uint64_t mockEpochValue = 0;

uint32_t millis() {
    if (mockEnabled) {
        return mockMillisValue;
    }
    static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

uint64_t epochMillis() {
    if (mockEnabled) {
        return mockEpochValue;
    }
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void sleepMillis(uint32_t ms) {
    if (mockEnabled) {
        advanceMockMillis(ms);
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void enableMockClock(bool enable) {
    mockEnabled = enable;
}

bool isMockClock() {
    return mockEnabled;
}

void setMockMillis(uint32_t ms) {
    mockMillisValue = ms;
}

void advanceMockMillis(uint32_t ms) {
    mockMillisValue += ms;
    mockEpochValue += ms;
}

void setMockEpochMillis(uint64_t ms) {
    mockEpochValue = ms;
}
