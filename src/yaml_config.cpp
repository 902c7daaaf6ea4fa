/**
 * @file yaml_config.cpp
 * @brief YAML configuration parser implementation
 */

#include "yaml_config.h"
#include "config.h"
#include <string.h>
#include <strings.h>
#include <stdlib.h>
#include <stdio.h>
#include <ctype.h>

static const char* TAG = "config";

// Reference deployment locations, units 1-4
static const char* const DEFAULT_CHANNEL_IDS[DEFAULT_CHANNEL_COUNT] = {
    "crank_left", "crank_right", "tail_bearing", "mid_bearing"
};

static void copyBounded(char* dst, const char* src, size_t size) {
    strncpy(dst, src, size - 1);
    dst[size - 1] = '\0';
}

static void fillStatusChannels(MonitorConfig& config) {
    config.status.channelCount = config.channelCount;
    for (uint8_t i = 0; i < config.channelCount; i++) {
        copyBounded(config.status.channels[i], config.channels[i].id, CHANNEL_ID_LENGTH);
    }
}

// ============================================================================
// MONITOR CONFIG DEFAULTS
// ============================================================================

void MonitorConfig::setDefaults() {
    // Links
    sensorLink.setDefaults();
    alarmLink.setDefaults();

    // Sensors
    polling.setDefaults();
    channelCount = DEFAULT_CHANNEL_COUNT;
    for (uint8_t i = 0; i < MAX_CHANNELS; i++) {
        channels[i].setDefaults();
    }
    for (uint8_t i = 0; i < DEFAULT_CHANNEL_COUNT; i++) {
        copyBounded(channels[i].id, DEFAULT_CHANNEL_IDS[i], CHANNEL_ID_LENGTH);
        channels[i].unitAddress = (uint8_t)(i + 1);
        channels[i].registerAddress = DEFAULT_CHANNEL_REGISTER;
        channels[i].registerCount = DEFAULT_CHANNEL_AXES;
    }

    // Handoff
    store.setDefaults();

    // Alarm outputs: latching stop request on critical vibration
    alarmIntervalMs = ALARM_INTERVAL_MS_DEFAULT;
    alarmDebounce = ALARM_DEBOUNCE_DEFAULT;
    outputCount = 1;
    for (uint8_t i = 0; i < MAX_OUTPUTS; i++) {
        outputs[i].setDefaults();
    }
    copyBounded(outputs[0].name, "stop", OUTPUT_NAME_LENGTH);
    outputs[0].registerAddress = STOP_OUTPUT_REGISTER_DEFAULT;
    outputs[0].assertValue = STOP_OUTPUT_ASSERT_DEFAULT;
    outputs[0].clearValue = STOP_OUTPUT_CLEAR_DEFAULT;
    outputs[0].assertLevels = faultLevelBit(FaultLevel::CRITICAL);
    outputs[0].latching = true;

    status.setDefaults();
    fillStatusChannels(*this);

    // Logging
    logLevel = LogLevel::INFO;

    // Status
    loaded = false;
    loadError[0] = '\0';
}

// ============================================================================
// YAML PARSER IMPLEMENTATION
// ============================================================================

YamlConfigParser::YamlConfigParser() {
    entryCount_ = 0;
    errorMsg_[0] = '\0';
    currentSection_[0] = '\0';
}

bool YamlConfigParser::load(const char* filename, MonitorConfig& config) {
    // Start with defaults
    config.setDefaults();
    entryCount_ = 0;
    errorMsg_[0] = '\0';
    currentSection_[0] = '\0';

    FILE* file = fopen(filename, "r");
    if (!file) {
        snprintf(errorMsg_, sizeof(errorMsg_), "Failed to open config file %s", filename);
        copyBounded(config.loadError, errorMsg_, sizeof(config.loadError));
        return false;
    }

    char line[MAX_LINE_LENGTH];
    int lineNum = 0;
    bool ok = true;

    while (fgets(line, sizeof(line), file)) {
        lineNum++;

        trimWhitespace(line);
        if (line[0] == '\0' || isComment(line)) {
            continue;
        }

        if (entryCount_ >= MAX_CONFIG_KEYS) {
            snprintf(errorMsg_, sizeof(errorMsg_), "Too many keys at line %d (max %d)", lineNum, MAX_CONFIG_KEYS);
            ok = false;
            break;
        }
        if (!parseLine(line)) {
            snprintf(errorMsg_, sizeof(errorMsg_), "Parse error line %d", lineNum);
            ok = false;
        }
    }

    fclose(file);

    // Apply parsed values to config
    // Links
    ok = applyLink("link", config.sensorLink) && ok;
    config.alarmLink = config.sensorLink;
    ok = applyLink("alarm_link", config.alarmLink) && ok;

    // Polling
    ok = readU32("polling.interval_ms", config.polling.intervalMs) && ok;
    ok = readU8("polling.comm_fault_threshold", config.polling.commFaultThreshold) && ok;
    ok = readU8("polling.tick_budget_percent", config.polling.tickBudgetPercent) && ok;

    // Store
    copyString("store.path", config.store.path, sizeof(config.store.path));
    config.store.maxAgeMs = config.polling.intervalMs * STALE_INTERVAL_MULTIPLE;
    ok = readU32("store.max_age_ms", config.store.maxAgeMs) && ok;

    // Alarm
    ok = readU32("alarm.interval_ms", config.alarmIntervalMs) && ok;
    ok = readU8("alarm.debounce", config.alarmDebounce) && ok;

    // Logging
    if (hasKey("logging.level") && !Logger::parseLevel(getString("logging.level"), config.logLevel)) {
        snprintf(errorMsg_, sizeof(errorMsg_), "Unknown logging.level '%s'", getString("logging.level"));
        ok = false;
    }

    // Channels and outputs
    ok = applyChannels(config) && ok;
    ok = applyOutputs(config) && ok;

    // Status block
    config.status.enabled = getBool("status.enabled", config.status.enabled);
    ok = readU8("status.unit", config.status.unitAddress) && ok;
    ok = readU16("status.address", config.status.address) && ok;
    fillStatusChannels(config);

    if (!ok) {
        copyBounded(config.loadError, errorMsg_, sizeof(config.loadError));
        return false;
    }

    config.loaded = true;
    return true;
}

bool YamlConfigParser::applyLink(const char* section, ModbusLinkConfig& link) {
    char key[MAX_KEY_LENGTH];
    bool ok = true;

    if (hasKey(buildFullKey(section, "mode", key))) {
        const char* mode = getString(key);
        if (strcasecmp(mode, "rtu") == 0) {
            link.mode = ModbusMode::RTU;
        } else if (strcasecmp(mode, "tcp") == 0) {
            link.mode = ModbusMode::TCP;
        } else {
            snprintf(errorMsg_, sizeof(errorMsg_), "%s must be rtu or tcp", key);
            ok = false;
        }
    }

    copyString(buildFullKey(section, "port", key), link.port, sizeof(link.port));
    ok = readU32(buildFullKey(section, "baud", key), link.baudRate) && ok;
    ok = readU8(buildFullKey(section, "data_bits", key), link.dataBits) && ok;
    if (hasKey(buildFullKey(section, "parity", key))) {
        link.parity = (char)toupper((unsigned char)getString(key)[0]);
    }
    ok = readU8(buildFullKey(section, "stop_bits", key), link.stopBits) && ok;

    copyString(buildFullKey(section, "host", key), link.host, sizeof(link.host));
    ok = readU16(buildFullKey(section, "tcp_port", key), link.tcpPort) && ok;

    ok = readU32(buildFullKey(section, "timeout_ms", key), link.timeoutMs) && ok;
    ok = readU8(buildFullKey(section, "retries", key), link.maxRetries) && ok;
    ok = readU32(buildFullKey(section, "backoff_ms", key), link.backoffBaseMs) && ok;
    ok = readU32(buildFullKey(section, "backoff_cap_ms", key), link.backoffCapMs) && ok;

    return ok;
}

bool YamlConfigParser::applyChannels(MonitorConfig& config) {
    char key[MAX_KEY_LENGTH];
    char section[MAX_KEY_LENGTH];
    ChannelConfig parsed[MAX_CHANNELS];
    uint8_t count = 0;
    bool ok = true;

    for (int n = 1; n <= MAX_CHANNELS; n++) {
        snprintf(section, sizeof(section), "channel_%d", n);
        if (!hasKey(buildFullKey(section, "id", key))) {
            continue;
        }

        ChannelConfig& ch = parsed[count++];
        ch.setDefaults();
        copyString(key, ch.id, sizeof(ch.id));

        ok = readU8(buildFullKey(section, "unit", key), ch.unitAddress) && ok;
        ok = readU16(buildFullKey(section, "register", key), ch.registerAddress) && ok;
        ok = readU8(buildFullKey(section, "count", key), ch.registerCount) && ok;
        ch.scale = getFloat(buildFullKey(section, "scale", key), ch.scale);
        ch.offset = getFloat(buildFullKey(section, "offset", key), ch.offset);
        ch.signedValues = getBool(buildFullKey(section, "signed", key), ch.signedValues);

        ch.thresholds[static_cast<uint8_t>(FaultLevel::NORMAL)] =
            getFloat(buildFullKey(section, "normal", key), ch.thresholds[static_cast<uint8_t>(FaultLevel::NORMAL)]);
        ch.thresholds[static_cast<uint8_t>(FaultLevel::WARNING)] =
            getFloat(buildFullKey(section, "warning", key), ch.thresholds[static_cast<uint8_t>(FaultLevel::WARNING)]);
        ch.thresholds[static_cast<uint8_t>(FaultLevel::ALARM)] =
            getFloat(buildFullKey(section, "alarm", key), ch.thresholds[static_cast<uint8_t>(FaultLevel::ALARM)]);
        ch.thresholds[static_cast<uint8_t>(FaultLevel::CRITICAL)] =
            getFloat(buildFullKey(section, "critical", key), ch.thresholds[static_cast<uint8_t>(FaultLevel::CRITICAL)]);
        ch.hysteresis = getFloat(buildFullKey(section, "hysteresis", key), ch.hysteresis);

        ok = readU8(buildFullKey(section, "window", key), ch.windowSize) && ok;
        ok = readU8(buildFullKey(section, "escalate_run", key), ch.escalateRun) && ok;
        ok = readU8(buildFullKey(section, "deescalate_run", key), ch.deescalateRun) && ok;
        ch.escalateInclusive = getBool(buildFullKey(section, "escalate_inclusive", key), ch.escalateInclusive);
        ch.deescalateInclusive = getBool(buildFullKey(section, "deescalate_inclusive", key), ch.deescalateInclusive);
    }

    // Channels in the file replace the reference deployment
    if (count > 0) {
        for (uint8_t i = 0; i < count; i++) {
            config.channels[i] = parsed[i];
        }
        config.channelCount = count;
    }
    return ok;
}

bool YamlConfigParser::applyOutputs(MonitorConfig& config) {
    char key[MAX_KEY_LENGTH];
    char section[MAX_KEY_LENGTH];
    OutputConfig parsed[MAX_OUTPUTS];
    uint8_t count = 0;
    bool ok = true;

    for (int n = 1; n <= MAX_OUTPUTS; n++) {
        snprintf(section, sizeof(section), "output_%d", n);
        if (!hasKey(buildFullKey(section, "name", key))) {
            continue;
        }

        OutputConfig& out = parsed[count++];
        out.setDefaults();
        copyString(key, out.name, sizeof(out.name));

        ok = readU8(buildFullKey(section, "unit", key), out.unitAddress) && ok;
        ok = readU16(buildFullKey(section, "register", key), out.registerAddress) && ok;
        ok = readU16(buildFullKey(section, "assert_value", key), out.assertValue) && ok;
        ok = readU16(buildFullKey(section, "clear_value", key), out.clearValue) && ok;
        out.latching = getBool(buildFullKey(section, "latching", key), out.latching);
        out.verify = getBool(buildFullKey(section, "verify", key), out.verify);

        const char* channel = getString(buildFullKey(section, "channel", key), "all");
        if (strcasecmp(channel, "all") == 0) {
            out.channel[0] = '\0';
        } else {
            copyBounded(out.channel, channel, sizeof(out.channel));
        }

        if (hasKey(buildFullKey(section, "assert_on", key)) && !parseFaultLevelSet(getString(key), out.assertLevels)) {
            snprintf(errorMsg_, sizeof(errorMsg_), "%s: unknown level in '%s'", key, getString(key));
            ok = false;
        }
    }

    // Outputs in the file replace the default stop output
    if (count > 0) {
        for (uint8_t i = 0; i < count; i++) {
            config.outputs[i] = parsed[i];
        }
        config.outputCount = count;
    }
    return ok;
}

void YamlConfigParser::copyString(const char* key, char* dst, size_t size) {
    if (hasKey(key)) {
        copyBounded(dst, getString(key), size);
    }
}

bool YamlConfigParser::parseLine(const char* line) {
    // Check for section header (e.g., "channel_1:")
    if (isSectionHeader(line)) {
        // Extract section name
        char temp[MAX_KEY_LENGTH];
        strncpy(temp, line, sizeof(temp) - 1);
        temp[sizeof(temp) - 1] = '\0';

        // Remove trailing colon
        char* colon = strchr(temp, ':');
        if (colon) *colon = '\0';

        trimWhitespace(temp);
        strncpy(currentSection_, temp, sizeof(currentSection_) - 1);
        currentSection_[sizeof(currentSection_) - 1] = '\0';
        return true;
    }

    // Check for key-value pair
    if (isKeyValue(line)) {
        const char* colonPos = strchr(line, ':');
        if (!colonPos) return false;

        // Split into key and value
        char key[MAX_KEY_LENGTH];
        char value[MAX_VALUE_LENGTH];

        int keyLen = colonPos - line;
        if (keyLen >= MAX_KEY_LENGTH) keyLen = MAX_KEY_LENGTH - 1;
        strncpy(key, line, keyLen);
        key[keyLen] = '\0';
        trimWhitespace(key);

        strncpy(value, colonPos + 1, MAX_VALUE_LENGTH - 1);
        value[MAX_VALUE_LENGTH - 1] = '\0';
        trimWhitespace(value);

        // Remove inline comments
        char* commentPos = strchr(value, '#');
        if (commentPos) {
            *commentPos = '\0';
            trimWhitespace(value);
        }

        // Build full key with section prefix
        char fullKey[MAX_KEY_LENGTH];
        buildFullKey(currentSection_, key, fullKey);

        // Store entry, a repeated key overrides the earlier one
        int idx = findKey(fullKey);
        if (idx < 0) {
            if (entryCount_ >= MAX_CONFIG_KEYS) return false;
            idx = entryCount_++;
            copyBounded(entries_[idx].key, fullKey, MAX_KEY_LENGTH);
        }
        copyBounded(entries_[idx].value, value, MAX_VALUE_LENGTH);

        return true;
    }

    return false;
}

void YamlConfigParser::trimWhitespace(char* str) {
    if (!str || !*str) return;

    // Trim leading
    char* start = str;
    while (*start && isspace((unsigned char)*start)) start++;

    // Trim trailing
    char* end = start + strlen(start) - 1;
    while (end > start && isspace((unsigned char)*end)) end--;
    *(end + 1) = '\0';

    // Move to beginning
    if (start != str) {
        memmove(str, start, strlen(start) + 1);
    }
}

bool YamlConfigParser::isComment(const char* line) {
    const char* p = line;
    while (*p && isspace((unsigned char)*p)) p++;
    return *p == '#';
}

bool YamlConfigParser::isSectionHeader(const char* line) {
    // Section header: "word:" with no value after colon (or only whitespace)
    const char* colon = strchr(line, ':');
    if (!colon) return false;

    // Check if there's anything meaningful after the colon
    const char* afterColon = colon + 1;
    while (*afterColon && isspace((unsigned char)*afterColon)) afterColon++;

    // If nothing after colon (or just comment), it's a section header
    return *afterColon == '\0' || *afterColon == '#';
}

bool YamlConfigParser::isKeyValue(const char* line) {
    const char* colon = strchr(line, ':');
    if (!colon) return false;

    // Check if there's a value after the colon
    const char* afterColon = colon + 1;
    while (*afterColon && isspace((unsigned char)*afterColon)) afterColon++;

    return *afterColon != '\0' && *afterColon != '#';
}

char* YamlConfigParser::buildFullKey(const char* section, const char* key, char* fullKey) {
    if (section && section[0] != '\0') {
        snprintf(fullKey, MAX_KEY_LENGTH, "%s.%s", section, key);
    } else {
        strncpy(fullKey, key, MAX_KEY_LENGTH - 1);
        fullKey[MAX_KEY_LENGTH - 1] = '\0';
    }
    return fullKey;
}

int YamlConfigParser::findKey(const char* key) const {
    for (int i = 0; i < entryCount_; i++) {
        if (strcmp(entries_[i].key, key) == 0) {
            return i;
        }
    }
    return -1;
}

bool YamlConfigParser::hasKey(const char* key) const {
    return findKey(key) >= 0;
}

float YamlConfigParser::getFloat(const char* key, float defaultValue) const {
    int idx = findKey(key);
    if (idx < 0) return defaultValue;

    return (float)atof(entries_[idx].value);
}

int32_t YamlConfigParser::getInt(const char* key, int32_t defaultValue) const {
    int idx = findKey(key);
    if (idx < 0) return defaultValue;

    // Accepts decimal and 0x-prefixed register addresses
    return (int32_t)strtol(entries_[idx].value, nullptr, 0);
}

bool YamlConfigParser::readUnsigned(const char* key, uint32_t maxValue, uint32_t& value) {
    int idx = findKey(key);
    if (idx < 0) return true;

    char* end = nullptr;
    long long parsed = strtoll(entries_[idx].value, &end, 0);
    if (end == entries_[idx].value || *end != '\0' || parsed < 0 || parsed > (long long)maxValue) {
        snprintf(errorMsg_, sizeof(errorMsg_), "%s '%s' out of range (0-%u)", key, entries_[idx].value,
                 (unsigned)maxValue);
        return false;
    }
    value = (uint32_t)parsed;
    return true;
}

bool YamlConfigParser::readU8(const char* key, uint8_t& value) {
    uint32_t parsed = value;
    if (!readUnsigned(key, UINT8_MAX, parsed)) return false;
    value = (uint8_t)parsed;
    return true;
}

bool YamlConfigParser::readU16(const char* key, uint16_t& value) {
    uint32_t parsed = value;
    if (!readUnsigned(key, UINT16_MAX, parsed)) return false;
    value = (uint16_t)parsed;
    return true;
}

bool YamlConfigParser::readU32(const char* key, uint32_t& value) {
    return readUnsigned(key, UINT32_MAX, value);
}

bool YamlConfigParser::getBool(const char* key, bool defaultValue) const {
    int idx = findKey(key);
    if (idx < 0) return defaultValue;

    const char* val = entries_[idx].value;
    return (strcmp(val, "true") == 0 ||
            strcmp(val, "True") == 0 ||
            strcmp(val, "TRUE") == 0 ||
            strcmp(val, "yes") == 0 ||
            strcmp(val, "Yes") == 0 ||
            strcmp(val, "1") == 0);
}

const char* YamlConfigParser::getString(const char* key, const char* defaultValue) const {
    int idx = findKey(key);
    if (idx < 0) return defaultValue;

    // Remove quotes if present
    static char unquoted[MAX_VALUE_LENGTH];
    const char* val = entries_[idx].value;

    if ((val[0] == '"' || val[0] == '\'') && strlen(val) >= 2) {
        strncpy(unquoted, val + 1, MAX_VALUE_LENGTH - 1);
        unquoted[MAX_VALUE_LENGTH - 1] = '\0';
        size_t len = strlen(unquoted);
        if (len > 0 && (unquoted[len-1] == '"' || unquoted[len-1] == '\'')) {
            unquoted[len-1] = '\0';
        }
        return unquoted;
    }

    return val;
}

// ============================================================================
// CONFIG LOADER IMPLEMENTATION
// ============================================================================

const char* ConfigLoader::resolvePath(int argc, char** argv) {
    if (argc > 1 && argv[1] != nullptr && argv[1][0] != '\0') {
        return argv[1];
    }
    const char* env = getenv(CONFIG_PATH_ENV);
    if (env != nullptr && env[0] != '\0') {
        return env;
    }
    return CONFIG_PATH_DEFAULT;
}

bool ConfigLoader::load(const char* path, MonitorConfig& config) {
    YamlConfigParser* parser = new YamlConfigParser();
    bool success = parser->load(path, config);
    if (!success) {
        copyBounded(config.loadError, parser->getError(), sizeof(config.loadError));
    }
    delete parser;

    if (!success) {
        return false;
    }

    // Validate loaded config
    char validationError[CONFIG_ERROR_LENGTH];
    if (!validateConfig(config, validationError)) {
        copyBounded(config.loadError, validationError, sizeof(config.loadError));
        return false;
    }

    return true;
}

void ConfigLoader::printConfig(const MonitorConfig& config) {
    const ModbusLinkConfig& link = config.sensorLink;
    if (link.mode == ModbusMode::TCP) {
        LOG_INFO(TAG, "sensor link: tcp %s:%u", link.host, (unsigned)link.tcpPort);
    } else {
        LOG_INFO(TAG, "sensor link: rtu %s %u %u%c%u", link.port, (unsigned)link.baudRate,
                 (unsigned)link.dataBits, link.parity, (unsigned)link.stopBits);
    }
    LOG_INFO(TAG, "  timeout %u ms, %u retries, backoff %u..%u ms", (unsigned)link.timeoutMs,
             (unsigned)link.maxRetries, (unsigned)link.backoffBaseMs, (unsigned)link.backoffCapMs);

    LOG_INFO(TAG, "polling every %u ms, comm fault after %u failures, budget %u%%",
             (unsigned)config.polling.intervalMs, (unsigned)config.polling.commFaultThreshold,
             (unsigned)config.polling.tickBudgetPercent);

    for (uint8_t i = 0; i < config.channelCount; i++) {
        const ChannelConfig& ch = config.channels[i];
        LOG_INFO(TAG, "channel %s: unit %u reg %u x%u, thresholds %.1f/%.1f/%.1f hyst %.1f, window %u, runs %u/%u",
                 ch.id, (unsigned)ch.unitAddress, (unsigned)ch.registerAddress, (unsigned)ch.registerCount,
                 (double)ch.thresholds[1], (double)ch.thresholds[2], (double)ch.thresholds[3],
                 (double)ch.hysteresis, (unsigned)ch.windowSize, (unsigned)ch.escalateRun,
                 (unsigned)ch.deescalateRun);
    }

    LOG_INFO(TAG, "fault state: %s (stale after %u ms)", config.store.path, (unsigned)config.store.maxAgeMs);
    LOG_INFO(TAG, "alarm every %u ms, debounce %u", (unsigned)config.alarmIntervalMs,
             (unsigned)config.alarmDebounce);

    for (uint8_t i = 0; i < config.outputCount; i++) {
        const OutputConfig& out = config.outputs[i];
        LOG_INFO(TAG, "output %s: unit %u reg %u (%u/%u), channel %s, levels 0x%02X%s", out.name,
                 (unsigned)out.unitAddress, (unsigned)out.registerAddress, (unsigned)out.assertValue,
                 (unsigned)out.clearValue, out.isAggregate() ? "all" : out.channel,
                 (unsigned)out.assertLevels, out.latching ? ", latching" : "");
    }

    if (config.status.enabled) {
        LOG_INFO(TAG, "status block: unit %u at %u, %u channels", (unsigned)config.status.unitAddress,
                 (unsigned)config.status.address, (unsigned)config.status.channelCount);
    }

    if (config.loadError[0] != '\0') {
        LOG_WARN(TAG, "%s", config.loadError);
    }
}

static bool validateLink(const char* name, const ModbusLinkConfig& link, char* errorMsg) {
    if (link.mode == ModbusMode::TCP) {
        if (link.host[0] == '\0') {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: tcp mode needs a host", name);
            return false;
        }
        if (link.tcpPort == 0) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: tcp_port must be non-zero", name);
            return false;
        }
    } else {
        if (link.port[0] == '\0') {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: serial port not set", name);
            return false;
        }
        static const uint32_t rates[] = { 1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200 };
        bool supported = false;
        for (size_t i = 0; i < sizeof(rates) / sizeof(rates[0]); i++) {
            if (link.baudRate == rates[i]) supported = true;
        }
        if (!supported) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: unsupported baud rate %u", name, (unsigned)link.baudRate);
            return false;
        }
        if (link.dataBits != 7 && link.dataBits != 8) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: data_bits must be 7 or 8", name);
            return false;
        }
        if (link.parity != 'N' && link.parity != 'E' && link.parity != 'O') {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: parity must be N, E or O", name);
            return false;
        }
        if (link.stopBits != 1 && link.stopBits != 2) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: stop_bits must be 1 or 2", name);
            return false;
        }
    }

    if (link.timeoutMs < 10 || link.timeoutMs > 10000) {
        snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: timeout out of range (10-10000 ms)", name);
        return false;
    }
    if (link.maxRetries > 10) {
        snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: retries out of range (0-10)", name);
        return false;
    }
    if (link.backoffBaseMs > link.backoffCapMs) {
        snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: backoff_ms exceeds backoff_cap_ms", name);
        return false;
    }
    return true;
}

static bool validUnit(uint8_t unit) {
    return unit >= MODBUS_MIN_UNIT_ADDRESS && unit <= MODBUS_MAX_UNIT_ADDRESS;
}

bool ConfigLoader::validateConfig(const MonitorConfig& config, char* errorMsg) {
    // =========================================================================
    // LINK VALIDATION
    // =========================================================================

    if (!validateLink("link", config.sensorLink, errorMsg) ||
        !validateLink("alarm_link", config.alarmLink, errorMsg)) {
        return false;
    }

    // =========================================================================
    // TIMING VALIDATION
    // =========================================================================

    if (config.polling.intervalMs < 100 || config.polling.intervalMs > 60000) {
        strcpy(errorMsg, "Poll interval out of range (100-60000 ms)");
        return false;
    }
    if (config.alarmIntervalMs < 100 || config.alarmIntervalMs > 60000) {
        strcpy(errorMsg, "Alarm interval out of range (100-60000 ms)");
        return false;
    }
    if (config.polling.commFaultThreshold < 1) {
        strcpy(errorMsg, "Comm fault threshold must be at least 1");
        return false;
    }
    if (config.polling.tickBudgetPercent < 10 || config.polling.tickBudgetPercent > 100) {
        strcpy(errorMsg, "Tick budget out of range (10-100%)");
        return false;
    }
    if (config.alarmDebounce < 1 || config.alarmDebounce > 50) {
        strcpy(errorMsg, "Alarm debounce out of range (1-50)");
        return false;
    }

    // =========================================================================
    // STORE VALIDATION
    // =========================================================================

    if (config.store.path[0] == '\0') {
        strcpy(errorMsg, "Fault state path not set");
        return false;
    }
    if (config.store.maxAgeMs < config.polling.intervalMs) {
        strcpy(errorMsg, "Store max age shorter than the poll interval");
        return false;
    }

    // =========================================================================
    // CHANNEL VALIDATION
    // =========================================================================

    if (config.channelCount == 0) {
        strcpy(errorMsg, "No channels configured");
        return false;
    }

    for (uint8_t i = 0; i < config.channelCount; i++) {
        const ChannelConfig& ch = config.channels[i];
        if (ch.id[0] == '\0') {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "Channel %u has no id", (unsigned)(i + 1));
            return false;
        }
        for (uint8_t j = 0; j < i; j++) {
            if (strcmp(config.channels[j].id, ch.id) == 0) {
                snprintf(errorMsg, CONFIG_ERROR_LENGTH, "Duplicate channel id %s", ch.id);
                return false;
            }
        }
        if (!validUnit(ch.unitAddress)) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: unit out of range (1-247)", ch.id);
            return false;
        }
        if (ch.registerCount < 1 || ch.registerCount > MAX_CHANNEL_REGISTERS) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: count out of range (1-%d)", ch.id, MAX_CHANNEL_REGISTERS);
            return false;
        }
        if ((uint32_t)ch.registerAddress + ch.registerCount > 0x10000UL) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: register range past 65535", ch.id);
            return false;
        }
        if (ch.scale == 0.0f) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: scale must be non-zero", ch.id);
            return false;
        }
        if (!(ch.thresholds[0] <= ch.thresholds[1] &&
              ch.thresholds[1] < ch.thresholds[2] &&
              ch.thresholds[2] < ch.thresholds[3])) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: thresholds must increase normal<=warning<alarm<critical", ch.id);
            return false;
        }
        if (ch.hysteresis < 0.0f) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: hysteresis must not be negative", ch.id);
            return false;
        }
        if (ch.windowSize < 1 || ch.windowSize > MAX_WINDOW_SIZE) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: window out of range (1-%d)", ch.id, MAX_WINDOW_SIZE);
            return false;
        }
        if (ch.escalateRun < 1 || ch.deescalateRun < 1) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: escalate/deescalate runs must be at least 1", ch.id);
            return false;
        }
    }

    // =========================================================================
    // OUTPUT VALIDATION
    // =========================================================================

    for (uint8_t i = 0; i < config.outputCount; i++) {
        const OutputConfig& out = config.outputs[i];
        if (out.name[0] == '\0') {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "Output %u has no name", (unsigned)(i + 1));
            return false;
        }
        if (!validUnit(out.unitAddress)) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: unit out of range (1-247)", out.name);
            return false;
        }
        if (out.assertLevels == 0) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: assert_on lists no levels", out.name);
            return false;
        }
        if (out.assertValue == out.clearValue) {
            snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: assert and clear values are equal", out.name);
            return false;
        }
        if (!out.isAggregate()) {
            bool found = false;
            for (uint8_t c = 0; c < config.channelCount; c++) {
                if (strcmp(config.channels[c].id, out.channel) == 0) found = true;
            }
            if (!found) {
                snprintf(errorMsg, CONFIG_ERROR_LENGTH, "%s: unknown channel %s", out.name, out.channel);
                return false;
            }
        }
    }

    if (config.status.enabled && !validUnit(config.status.unitAddress)) {
        strcpy(errorMsg, "Status block unit out of range (1-247)");
        return false;
    }

    // All validations passed
    errorMsg[0] = '\0';
    return true;
}
