/**
 * @file fault_state_store.h
 * @brief Versioned fault state record shared between the sensor and alarm daemons
 *
 * The record is a JSON file replaced atomically: publish() writes
 * "<path>.tmp", fsyncs it and renames it over "<path>". A reader therefore
 * sees either the previous complete record or the new one, never a mix,
 * and no lock is shared between the processes.
 *
 * Record layout (version 1):
 *   {"schema":"vibmon.fault_state","version":1,"sequence":N,
 *    "timestamp_ms":T,"producer_pid":P,
 *    "channels":[{"id":"crank_left","level":"WARNING","value":6.2,
 *                 "raw":[62,10,3],"timestamp_ms":T,"sequence":n}]}
 */

#ifndef FAULT_STATE_STORE_H
#define FAULT_STATE_STORE_H

#include <stdint.h>
#include <stdbool.h>
#include <string>
#include "config.h"
#include "fault_level.h"

#define FAULT_STATE_SCHEMA          "vibmon.fault_state"
#define FAULT_STATE_VERSION         1
#define FAULT_STATE_JSON_CAPACITY   16384   // ArduinoJson pool for MAX_CHANNELS entries
#define FAULT_STATE_MAX_FILE_BYTES  16384

// ============================================================================
// FAULT STATE
// ============================================================================

struct ChannelFault {
    char id[CHANNEL_ID_LENGTH];
    FaultLevel level;
    float value;                            // Physical value, mm/s
    uint16_t raw[MAX_CHANNEL_REGISTERS];
    uint8_t rawCount;
    uint64_t timestampMs;                   // Sample time
    uint32_t sequence;                      // Per channel, strictly increasing
};

struct FaultState {
    uint64_t timestampMs;                   // Record time
    uint32_t sequence;                      // Per record, strictly increasing
    int32_t producerPid;
    uint8_t channelCount;
    ChannelFault channels[MAX_CHANNELS];

    void clear();
    int findChannel(const char* channelId) const;

    // Adds a NORMAL entry for channelId; returns its index or -1 when full
    int addChannel(const char* channelId);

    // Worst ordinary level and whether any channel is in COMM_FAULT
    FaultLevel worstLevel(bool* commFault) const;
};

// ============================================================================
// STORE
// ============================================================================

enum class StoreStatus : uint8_t {
    OK = 0,
    STALE,          // Parsed, but older than maxAgeMs
    WRITE_ERROR,
    READ_ERROR      // Missing, corrupt or unsupported version
};

const char* storeStatusToString(StoreStatus status);

struct StoreConfig {
    char path[PATH_LENGTH];
    uint32_t maxAgeMs;

    void setDefaults();
};

class FaultStateStore {
public:
    explicit FaultStateStore(const StoreConfig& config);

    /**
     * @brief Atomically replace the record with state
     *
     * Stamps state in place before writing: record and per-channel sequence
     * numbers continue from the last record on disk (also across producer
     * restarts), timestamps never go backwards, and producerPid is set.
     * @return OK or WRITE_ERROR (the previous record is left intact)
     */
    StoreStatus publish(FaultState& state);

    /**
     * @brief Read the latest record
     * @return OK, STALE (state is still filled in) or READ_ERROR
     */
    StoreStatus read(FaultState& state);

    const char* getError() const { return errorMsg_; }
    const StoreConfig& getConfig() const { return config_; }

    // JSON encoding, exposed for tests
    static bool serialize(const FaultState& state, std::string& json);
    static bool deserialize(const char* json, size_t length, FaultState& state, char* errorMsg, size_t errorSize);

private:
    struct ChannelCursor {
        char id[CHANNEL_ID_LENGTH];
        uint32_t sequence;
        uint64_t timestampMs;
    };

    StoreConfig config_;
    bool seeded_;
    uint32_t recordSequence_;
    uint64_t recordTimestampMs_;
    ChannelCursor cursors_[MAX_CHANNELS];
    uint8_t cursorCount_;
    char errorMsg_[96];

    void seedFromDisk();
    ChannelCursor* cursorFor(const char* channelId);
    StoreStatus readFile(FaultState& state);
    bool writeAtomically(const std::string& json);
};

#endif // FAULT_STATE_STORE_H
