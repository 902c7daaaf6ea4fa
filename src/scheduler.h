/**
 * @file scheduler.h
 * @brief Fixed-interval tick loop shared by both daemons
 */

#ifndef SCHEDULER_H
#define SCHEDULER_H

#include <stdint.h>
#include <stdbool.h>

enum class TickStatus : uint8_t {
    OK = 0,
    DEGRADED,       // Tick completed with contained errors (reads, writes, store)
    FATAL           // Unrecoverable, the process exits
};

const char* tickStatusToString(TickStatus status);

// ============================================================================
// TASK INTERFACE
// ============================================================================

class PeriodicTask {
public:
    virtual ~PeriodicTask() = default;

    // One unit of work. Must return well within the tick interval.
    virtual TickStatus tick() = 0;
    virtual const char* getName() const = 0;
};

// ============================================================================
// RUNNER
// ============================================================================

/**
 * @brief Calls task->tick() every intervalMs until stopped
 *
 * Ticks are aligned to a fixed schedule. A tick that overruns skips the
 * missed slots instead of running them back to back.
 */
class PeriodicRunner {
public:
    PeriodicRunner(PeriodicTask* task, uint32_t intervalMs);

    /**
     * @brief Run until SIGINT/SIGTERM, a FATAL tick, or maxTicks ticks
     * @param maxTicks 0 runs without limit
     * @return Process exit code: 0 on a requested stop, 1 after a FATAL tick
     */
    int run(uint32_t maxTicks = 0);

    uint32_t getTickCount() const { return tickCount_; }
    uint32_t getSkippedTicks() const { return skippedTicks_; }
    uint32_t getDegradedTicks() const { return degradedTicks_; }

    // Route SIGINT and SIGTERM to requestStop()
    static bool installSignalHandlers();
    static void requestStop();
    static void clearStop();
    static bool stopRequested();

private:
    PeriodicTask* task_;
    uint32_t intervalMs_;
    uint32_t tickCount_;
    uint32_t skippedTicks_;
    uint32_t degradedTicks_;

    void sleepUntil(uint32_t deadline);
};

#endif // SCHEDULER_H
