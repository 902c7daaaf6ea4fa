/**
 * @file yaml_config.h
 * @brief Simple YAML configuration parser for the monitor daemons
 *
 * Parses a subset of YAML: top-level sections holding "key: value" pairs,
 * addressed as "section.key" (e.g. "channel_1.warning"). Values are read as
 * float, int, bool or string. Both daemons read the same file.
 */

#ifndef YAML_CONFIG_H
#define YAML_CONFIG_H

#include <stdint.h>
#include <stdbool.h>
#include "config.h"
#include "alarm_actuator.h"
#include "alarm_engine.h"
#include "fault_state_store.h"
#include "logger.h"
#include "modbus_link.h"
#include "sensor_poll_loop.h"
#include "threshold_analyzer.h"

// Maximum configuration values
#define MAX_CONFIG_KEYS 512
#define MAX_KEY_LENGTH 48
#define MAX_VALUE_LENGTH 128
#define MAX_LINE_LENGTH 256
#define CONFIG_ERROR_LENGTH 96

// ============================================================================
// RUNTIME CONFIGURATION STRUCTURE
// ============================================================================

/**
 * @brief Fully resolved settings for both daemons
 *
 * Defaults describe the reference deployment: four 3-axis sensors on units
 * 1-4 of /dev/ttyS2 and a latching stop output on register 101.
 */
struct MonitorConfig {
    // Links
    ModbusLinkConfig sensorLink;        // "link" section
    ModbusLinkConfig alarmLink;         // "alarm_link", falls back to "link"

    // Sensor daemon
    PollConfig polling;
    ChannelConfig channels[MAX_CHANNELS];
    uint8_t channelCount;

    // Handoff file
    StoreConfig store;

    // Alarm daemon
    uint32_t alarmIntervalMs;
    uint8_t alarmDebounce;
    OutputConfig outputs[MAX_OUTPUTS];
    uint8_t outputCount;
    StatusBlockConfig status;

    // Logging
    LogLevel logLevel;

    // Load status
    bool loaded;
    char loadError[CONFIG_ERROR_LENGTH];

    // Initialize with defaults
    void setDefaults();
};

// ============================================================================
// YAML PARSER CLASS
// ============================================================================

class YamlConfigParser {
public:
    YamlConfigParser();

    /**
     * @brief Load configuration from a file
     * @param filename Path to YAML file
     * @param config Output configuration structure, defaults where keys are absent
     * @return true if the file was read and every value could be interpreted
     */
    bool load(const char* filename, MonitorConfig& config);

    /**
     * @brief Get last error message
     */
    const char* getError() const { return errorMsg_; }

    /**
     * @brief Check if a specific key was found in the file
     */
    bool hasKey(const char* key) const;

    /**
     * @brief Get a float value by key path (e.g., "channel_1.warning")
     */
    float getFloat(const char* key, float defaultValue = 0.0f) const;

    /**
     * @brief Get an integer value by key path
     */
    int32_t getInt(const char* key, int32_t defaultValue = 0) const;

    /**
     * @brief Get a boolean value by key path
     */
    bool getBool(const char* key, bool defaultValue = false) const;

    /**
     * @brief Get a string value by key path
     */
    const char* getString(const char* key, const char* defaultValue = "") const;

    int getEntryCount() const { return entryCount_; }

private:
    // Key-value storage
    struct KeyValue {
        char key[MAX_KEY_LENGTH];
        char value[MAX_VALUE_LENGTH];
    };

    KeyValue entries_[MAX_CONFIG_KEYS];
    int entryCount_;
    char errorMsg_[CONFIG_ERROR_LENGTH];
    char currentSection_[MAX_KEY_LENGTH];

    // Parsing helpers
    bool parseLine(const char* line);
    void trimWhitespace(char* str);
    bool isComment(const char* line);
    bool isSectionHeader(const char* line);
    bool isKeyValue(const char* line);
    char* buildFullKey(const char* section, const char* key, char* fullKey);
    int findKey(const char* key) const;

    // Range-checked integer reads; an absent key leaves value unchanged
    bool readUnsigned(const char* key, uint32_t maxValue, uint32_t& value);
    bool readU8(const char* key, uint8_t& value);
    bool readU16(const char* key, uint16_t& value);
    bool readU32(const char* key, uint32_t& value);

    // Section readers
    bool applyLink(const char* section, ModbusLinkConfig& link);
    bool applyChannels(MonitorConfig& config);
    bool applyOutputs(MonitorConfig& config);
    void copyString(const char* key, char* dst, size_t size);
};

// ============================================================================
// CONFIGURATION LOADER
// ============================================================================

/**
 * @brief High-level configuration loader used by both daemons at startup
 */
class ConfigLoader {
public:
    /**
     * @brief Configuration path: argv[1], else $VIBMON_CONFIG, else the default
     */
    static const char* resolvePath(int argc, char** argv);

    /**
     * @brief Load and validate a configuration file
     * @param config Output configuration; loadError describes any failure
     * @return true if the file loaded and passed validation
     */
    static bool load(const char* path, MonitorConfig& config);

    /**
     * @brief Log the effective configuration
     */
    static void printConfig(const MonitorConfig& config);

    /**
     * @brief Validate configuration values
     * @param errorMsg Buffer of CONFIG_ERROR_LENGTH bytes
     * @return true if all values are within reasonable ranges
     */
    static bool validateConfig(const MonitorConfig& config, char* errorMsg);
};

#endif // YAML_CONFIG_H
