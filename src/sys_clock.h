/**
 * @file sys_clock.h
 * @brief Monotonic and wall clock access with a mock mode for native testing
 */

#ifndef SYS_CLOCK_H
#define SYS_CLOCK_H

#include <stdint.h>

// Monotonic milliseconds since an arbitrary start point
uint32_t millis();

// Wall clock milliseconds since the Unix epoch
uint64_t epochMillis();

// Block for ms milliseconds (advances the mock clock instead when mocked)
void sleepMillis(uint32_t ms);

// Mock clock for tests: time only moves when advanced
void enableMockClock(bool enable);
bool isMockClock();
void setMockMillis(uint32_t ms);
void advanceMockMillis(uint32_t ms);
void setMockEpochMillis(uint64_t ms);

#endif // SYS_CLOCK_H
