/**
 * @file config.h
 * @brief Compile-time limits and defaults for the vibration fault monitor
 */

#ifndef CONFIG_H
#define CONFIG_H

// ============================================================================
// CAPACITY LIMITS
// ============================================================================

#define MAX_CHANNELS              16      // Monitored sensor channels
#define MAX_OUTPUTS               16      // Alarm output registers
#define MAX_CHANNEL_REGISTERS     4       // Consecutive registers per channel (axes)
#define MAX_WINDOW_SIZE           64      // Sliding window capacity per channel
#define CHANNEL_ID_LENGTH         32
#define OUTPUT_NAME_LENGTH        32
#define PATH_LENGTH               128

// ============================================================================
// MODBUS LINK DEFAULTS
// ============================================================================

// Serial (RTU)
#define MODBUS_DEFAULT_PORT           "/dev/ttyS2"
#define MODBUS_DEFAULT_BAUD           9600
#define MODBUS_DEFAULT_DATA_BITS      8
#define MODBUS_DEFAULT_PARITY         'N'
#define MODBUS_DEFAULT_STOP_BITS      1

// TCP
#define MODBUS_DEFAULT_TCP_PORT       502

// Transaction timing
#define MODBUS_DEFAULT_TIMEOUT_MS     500     // Per request/response
#define MODBUS_DEFAULT_MAX_RETRIES    2       // Extra attempts after the first
#define MODBUS_DEFAULT_BACKOFF_MS     50      // First retry delay, doubles per retry
#define MODBUS_DEFAULT_BACKOFF_CAP_MS 400

// Protocol limits (Modbus application protocol v1.1b3)
#define MODBUS_MIN_UNIT_ADDRESS       1
#define MODBUS_MAX_UNIT_ADDRESS       247
#define MODBUS_MAX_READ_COUNT         125
#define MODBUS_MAX_WRITE_COUNT        123

// ============================================================================
// CLASSIFIER DEFAULTS
// ============================================================================

// Vibration speed in mm/s
#define THRESHOLD_NORMAL_DEFAULT      0.0f
#define THRESHOLD_WARNING_DEFAULT     5.0f
#define THRESHOLD_ALARM_DEFAULT       10.0f
#define THRESHOLD_CRITICAL_DEFAULT    20.0f
#define HYSTERESIS_DEFAULT            1.0f
#define WINDOW_SIZE_DEFAULT           10
#define ESCALATE_RUN_DEFAULT          3
#define DEESCALATE_RUN_DEFAULT        3

// Raw register to mm/s
#define REGISTER_SCALE_DEFAULT        0.1f

// Reference deployment: one 3-axis sensor per unit, Vx/Vy/Vz from register 1
#define DEFAULT_CHANNEL_COUNT         4
#define DEFAULT_CHANNEL_REGISTER      1
#define DEFAULT_CHANNEL_AXES          3

// ============================================================================
// TIMING PARAMETERS
// ============================================================================

#define POLL_INTERVAL_MS_DEFAULT      1000    // Sensor daemon tick
#define ALARM_INTERVAL_MS_DEFAULT     1000    // Alarm daemon tick
#define TICK_BUDGET_PERCENT           80      // Share of the interval a tick may use
#define STALE_INTERVAL_MULTIPLE       3       // Max record age = 3 publish intervals

// ============================================================================
// FAULT HANDLING
// ============================================================================

#define COMM_FAULT_THRESHOLD_DEFAULT  3       // Consecutive failed reads before CommFault
#define ALARM_DEBOUNCE_DEFAULT        2       // Agreeing decide() calls before an output changes

// ============================================================================
// PLC REGISTERS
// ============================================================================

#define STOP_OUTPUT_REGISTER_DEFAULT  101
#define STOP_OUTPUT_ASSERT_DEFAULT    82      // Stop request, latched
#define STOP_OUTPUT_CLEAR_DEFAULT     81      // Written by the operator to release
#define STATUS_BLOCK_ADDRESS_DEFAULT  3502    // Overall level, then per-channel levels

// ============================================================================
// FILES
// ============================================================================

#define FAULT_STATE_PATH_DEFAULT      "/tmp/vibmon_fault_state.json"
#define CONFIG_PATH_DEFAULT           "/etc/vibmon/vibmon.yaml"
#define CONFIG_PATH_ENV               "VIBMON_CONFIG"

#endif // CONFIG_H
