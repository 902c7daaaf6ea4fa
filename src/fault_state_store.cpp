/**
 * @file fault_state_store.cpp
 * @brief Fault state record serialization and atomic file replacement
 */

#include "fault_state_store.h"
#include "logger.h"
#include "sys_clock.h"

#include <ArduinoJson.h>

#include <errno.h>
#include <fcntl.h>
#include <libgen.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

static const char* TAG = "store";

// ============================================================================
// FAULT STATE
// ============================================================================

void FaultState::clear() {
    timestampMs = 0;
    sequence = 0;
    producerPid = 0;
    channelCount = 0;
}

int FaultState::findChannel(const char* channelId) const {
    for (uint8_t i = 0; i < channelCount; i++) {
        if (strcmp(channels[i].id, channelId) == 0) {
            return i;
        }
    }
    return -1;
}

int FaultState::addChannel(const char* channelId) {
    if (channelCount >= MAX_CHANNELS) {
        return -1;
    }
    ChannelFault& entry = channels[channelCount];
    strncpy(entry.id, channelId, sizeof(entry.id) - 1);
    entry.id[sizeof(entry.id) - 1] = '\0';
    entry.level = FaultLevel::NORMAL;
    entry.value = 0.0f;
    entry.rawCount = 0;
    entry.timestampMs = 0;
    entry.sequence = 0;
    return channelCount++;
}

FaultLevel FaultState::worstLevel(bool* commFault) const {
    FaultLevel worst = FaultLevel::NORMAL;
    bool anyCommFault = false;
    for (uint8_t i = 0; i < channelCount; i++) {
        FaultLevel level = channels[i].level;
        if (level == FaultLevel::COMM_FAULT) {
            anyCommFault = true;
        } else if (level > worst) {
            worst = level;
        }
    }
    if (commFault != nullptr) {
        *commFault = anyCommFault;
    }
    return worst;
}

const char* storeStatusToString(StoreStatus status) {
    switch (status) {
        case StoreStatus::OK: return "OK";
        case StoreStatus::STALE: return "STALE";
        case StoreStatus::WRITE_ERROR: return "WRITE_ERROR";
        case StoreStatus::READ_ERROR: return "READ_ERROR";
        default: return "UNKNOWN";
    }
}

void StoreConfig::setDefaults() {
    strncpy(path, FAULT_STATE_PATH_DEFAULT, sizeof(path) - 1);
    path[sizeof(path) - 1] = '\0';
    maxAgeMs = POLL_INTERVAL_MS_DEFAULT * STALE_INTERVAL_MULTIPLE;
}

// ============================================================================
// JSON ENCODING
// ============================================================================

bool FaultStateStore::serialize(const FaultState& state, std::string& json) {
    DynamicJsonDocument doc(FAULT_STATE_JSON_CAPACITY);

    doc["schema"] = FAULT_STATE_SCHEMA;
    doc["version"] = FAULT_STATE_VERSION;
    doc["sequence"] = state.sequence;
    doc["timestamp_ms"] = state.timestampMs;
    doc["producer_pid"] = state.producerPid;

    JsonArray channels = doc.createNestedArray("channels");
    for (uint8_t i = 0; i < state.channelCount; i++) {
        const ChannelFault& entry = state.channels[i];
        JsonObject item = channels.createNestedObject();
        item["id"] = (const char*)entry.id;
        item["level"] = faultLevelToString(entry.level);
        item["value"] = entry.value;
        JsonArray raw = item.createNestedArray("raw");
        for (uint8_t r = 0; r < entry.rawCount; r++) {
            raw.add(entry.raw[r]);
        }
        item["timestamp_ms"] = entry.timestampMs;
        item["sequence"] = entry.sequence;
    }

    if (doc.overflowed()) {
        return false;
    }

    json.clear();
    serializeJson(doc, json);
    return true;
}

bool FaultStateStore::deserialize(const char* json, size_t length, FaultState& state,
                                  char* errorMsg, size_t errorSize) {
    DynamicJsonDocument doc(FAULT_STATE_JSON_CAPACITY);
    DeserializationError err = deserializeJson(doc, json, length);
    if (err) {
        snprintf(errorMsg, errorSize, "corrupt record: %s", err.c_str());
        return false;
    }

    const char* schema = doc["schema"];
    if (schema == nullptr || strcmp(schema, FAULT_STATE_SCHEMA) != 0) {
        snprintf(errorMsg, errorSize, "unexpected schema");
        return false;
    }
    if (!doc["version"].is<int>()) {
        snprintf(errorMsg, errorSize, "missing version");
        return false;
    }
    int version = doc["version"].as<int>();
    if (version < 1 || version > FAULT_STATE_VERSION) {
        snprintf(errorMsg, errorSize, "unsupported version %d", version);
        return false;
    }

    JsonArrayConst channels = doc["channels"].as<JsonArrayConst>();
    if (channels.isNull() || !doc["timestamp_ms"].is<uint64_t>() || !doc["sequence"].is<uint32_t>()) {
        snprintf(errorMsg, errorSize, "missing record fields");
        return false;
    }

    state.clear();
    state.sequence = doc["sequence"].as<uint32_t>();
    state.timestampMs = doc["timestamp_ms"].as<uint64_t>();
    state.producerPid = doc["producer_pid"] | 0;

    for (JsonObjectConst item : channels) {
        const char* id = item["id"];
        const char* levelName = item["level"];
        FaultLevel level;
        if (id == nullptr || id[0] == '\0' || !faultLevelFromString(levelName, level)) {
            snprintf(errorMsg, errorSize, "bad channel entry");
            return false;
        }

        int index = state.addChannel(id);
        if (index < 0) {
            snprintf(errorMsg, errorSize, "more than %d channels", MAX_CHANNELS);
            return false;
        }

        ChannelFault& entry = state.channels[index];
        entry.level = level;
        entry.value = item["value"] | 0.0f;
        entry.timestampMs = item["timestamp_ms"] | (uint64_t)0;
        entry.sequence = item["sequence"] | (uint32_t)0;

        JsonArrayConst raw = item["raw"].as<JsonArrayConst>();
        entry.rawCount = 0;
        for (JsonVariantConst reg : raw) {
            if (entry.rawCount >= MAX_CHANNEL_REGISTERS) {
                break;
            }
            entry.raw[entry.rawCount++] = reg.as<uint16_t>();
        }
    }

    errorMsg[0] = '\0';
    return true;
}

// ============================================================================
// STORE IMPLEMENTATION
// ============================================================================

FaultStateStore::FaultStateStore(const StoreConfig& config)
    : config_(config)
    , seeded_(false)
    , recordSequence_(0)
    , recordTimestampMs_(0)
    , cursorCount_(0) {
    errorMsg_[0] = '\0';
}

StoreStatus FaultStateStore::publish(FaultState& state) {
    if (!seeded_) {
        seedFromDisk();
    }

    uint64_t now = epochMillis();
    if (now < recordTimestampMs_) {
        LOG_WARN(TAG, "wall clock stepped back %llu ms, holding record time",
                 (unsigned long long)(recordTimestampMs_ - now));
        now = recordTimestampMs_;
    }
    state.timestampMs = now;
    state.sequence = recordSequence_ + 1;
    state.producerPid = (int32_t)getpid();

    ChannelCursor next[MAX_CHANNELS];
    for (uint8_t i = 0; i < state.channelCount; i++) {
        ChannelFault& entry = state.channels[i];
        const ChannelCursor* previous = cursorFor(entry.id);

        if (entry.timestampMs == 0) {
            entry.timestampMs = now;
        }
        if (previous != nullptr) {
            entry.sequence = previous->sequence + 1;
            if (entry.timestampMs < previous->timestampMs) {
                entry.timestampMs = previous->timestampMs;
            }
        } else {
            entry.sequence = 1;
        }

        strncpy(next[i].id, entry.id, sizeof(next[i].id) - 1);
        next[i].id[sizeof(next[i].id) - 1] = '\0';
        next[i].sequence = entry.sequence;
        next[i].timestampMs = entry.timestampMs;
    }

    std::string json;
    if (!serialize(state, json)) {
        snprintf(errorMsg_, sizeof(errorMsg_), "record exceeds %d byte JSON pool", FAULT_STATE_JSON_CAPACITY);
        LOG_ERROR(TAG, "publish failed: %s", errorMsg_);
        return StoreStatus::WRITE_ERROR;
    }
    if (!writeAtomically(json)) {
        LOG_ERROR(TAG, "publish seq %u failed: %s", (unsigned)state.sequence, errorMsg_);
        return StoreStatus::WRITE_ERROR;
    }

    recordSequence_ = state.sequence;
    recordTimestampMs_ = state.timestampMs;
    memcpy(cursors_, next, sizeof(ChannelCursor) * state.channelCount);
    cursorCount_ = state.channelCount;
    errorMsg_[0] = '\0';
    return StoreStatus::OK;
}

StoreStatus FaultStateStore::read(FaultState& state) {
    StoreStatus status = readFile(state);
    if (status != StoreStatus::OK) {
        return status;
    }

    if (config_.maxAgeMs > 0) {
        uint64_t now = epochMillis();
        uint64_t age = now > state.timestampMs ? now - state.timestampMs : 0;
        if (age > config_.maxAgeMs) {
            snprintf(errorMsg_, sizeof(errorMsg_), "record seq %u is %llu ms old",
                     (unsigned)state.sequence, (unsigned long long)age);
            return StoreStatus::STALE;
        }
    }
    errorMsg_[0] = '\0';
    return StoreStatus::OK;
}

StoreStatus FaultStateStore::readFile(FaultState& state) {
    FILE* file = fopen(config_.path, "r");
    if (!file) {
        snprintf(errorMsg_, sizeof(errorMsg_), "open %s: %s", config_.path, strerror(errno));
        return StoreStatus::READ_ERROR;
    }

    std::string content;
    char chunk[1024];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        content.append(chunk, n);
        if (content.size() > FAULT_STATE_MAX_FILE_BYTES) {
            break;
        }
    }
    bool readFailed = ferror(file) != 0;
    fclose(file);

    if (readFailed) {
        snprintf(errorMsg_, sizeof(errorMsg_), "read %s failed", config_.path);
        return StoreStatus::READ_ERROR;
    }
    if (content.size() > FAULT_STATE_MAX_FILE_BYTES) {
        snprintf(errorMsg_, sizeof(errorMsg_), "%s larger than %d bytes", config_.path, FAULT_STATE_MAX_FILE_BYTES);
        return StoreStatus::READ_ERROR;
    }
    if (!deserialize(content.c_str(), content.size(), state, errorMsg_, sizeof(errorMsg_))) {
        return StoreStatus::READ_ERROR;
    }
    return StoreStatus::OK;
}

void FaultStateStore::seedFromDisk() {
    seeded_ = true;

    FaultState existing;
    if (access(config_.path, F_OK) != 0) {
        return;
    }
    if (readFile(existing) != StoreStatus::OK) {
        LOG_WARN(TAG, "ignoring previous record: %s", errorMsg_);
        return;
    }

    recordSequence_ = existing.sequence;
    recordTimestampMs_ = existing.timestampMs;
    cursorCount_ = existing.channelCount;
    for (uint8_t i = 0; i < existing.channelCount; i++) {
        strncpy(cursors_[i].id, existing.channels[i].id, sizeof(cursors_[i].id) - 1);
        cursors_[i].id[sizeof(cursors_[i].id) - 1] = '\0';
        cursors_[i].sequence = existing.channels[i].sequence;
        cursors_[i].timestampMs = existing.channels[i].timestampMs;
    }
    LOG_INFO(TAG, "continuing from record seq %u (%u channels)",
             (unsigned)recordSequence_, (unsigned)cursorCount_);
}

FaultStateStore::ChannelCursor* FaultStateStore::cursorFor(const char* channelId) {
    for (uint8_t i = 0; i < cursorCount_; i++) {
        if (strcmp(cursors_[i].id, channelId) == 0) {
            return &cursors_[i];
        }
    }
    return nullptr;
}

bool FaultStateStore::writeAtomically(const std::string& json) {
    char tmpPath[PATH_LENGTH + 8];
    snprintf(tmpPath, sizeof(tmpPath), "%s.tmp", config_.path);

    FILE* file = fopen(tmpPath, "w");
    if (!file) {
        snprintf(errorMsg_, sizeof(errorMsg_), "open %s: %s", tmpPath, strerror(errno));
        return false;
    }

    bool ok = fwrite(json.data(), 1, json.size(), file) == json.size();
    ok = ok && fflush(file) == 0;
    ok = ok && fsync(fileno(file)) == 0;
    int savedErrno = errno;
    if (fclose(file) != 0 && ok) {
        ok = false;
        savedErrno = errno;
    }
    if (!ok) {
        snprintf(errorMsg_, sizeof(errorMsg_), "write %s: %s", tmpPath, strerror(savedErrno));
        unlink(tmpPath);
        return false;
    }

    if (rename(tmpPath, config_.path) != 0) {
        snprintf(errorMsg_, sizeof(errorMsg_), "rename to %s: %s", config_.path, strerror(errno));
        unlink(tmpPath);
        return false;
    }

    // Persist the directory entry so the rename survives a power cut
    char dirBuffer[PATH_LENGTH];
    strncpy(dirBuffer, config_.path, sizeof(dirBuffer) - 1);
    dirBuffer[sizeof(dirBuffer) - 1] = '\0';
    int dirFd = open(dirname(dirBuffer), O_RDONLY | O_DIRECTORY);
    if (dirFd >= 0) {
        if (fsync(dirFd) != 0) {
            LOG_DEBUG(TAG, "directory fsync failed: %s", strerror(errno));
        }
        close(dirFd);
    }
    return true;
}
