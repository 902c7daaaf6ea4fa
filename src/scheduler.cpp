/**
 * @file scheduler.cpp
 * @brief Periodic runner implementation
 */

#include "scheduler.h"
#include "logger.h"
#include "sys_clock.h"

#include <signal.h>
#include <string.h>

static const char* TAG = "runner";

// Longest single sleep, so a stop request is noticed promptly
#define STOP_POLL_MS 100

static volatile sig_atomic_t stopFlag = 0;

static void handleStopSignal(int signum) {
    (void)signum;
    stopFlag = 1;
}

const char* tickStatusToString(TickStatus status) {
    switch (status) {
        case TickStatus::OK: return "OK";
        case TickStatus::DEGRADED: return "DEGRADED";
        case TickStatus::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// RUNNER IMPLEMENTATION
// ============================================================================

PeriodicRunner::PeriodicRunner(PeriodicTask* task, uint32_t intervalMs)
    : task_(task)
    , intervalMs_(intervalMs == 0 ? 1 : intervalMs)
    , tickCount_(0)
    , skippedTicks_(0)
    , degradedTicks_(0) {
}

int PeriodicRunner::run(uint32_t maxTicks) {
    LOG_INFO(TAG, "%s running every %u ms", task_->getName(), (unsigned)intervalMs_);
    uint32_t nextTick = millis();

    while (!stopRequested()) {
        TickStatus status = task_->tick();
        tickCount_++;

        if (status == TickStatus::FATAL) {
            LOG_ERROR(TAG, "%s: fatal error on tick %u, exiting", task_->getName(), (unsigned)tickCount_);
            return 1;
        }
        if (status == TickStatus::DEGRADED) {
            degradedTicks_++;
        }
        if (maxTicks != 0 && tickCount_ >= maxTicks) {
            break;
        }

        nextTick += intervalMs_;
        uint32_t now = millis();
        if ((int32_t)(now - nextTick) >= 0) {
            uint32_t late = now - nextTick;
            uint32_t missed = late / intervalMs_ + 1;
            skippedTicks_ += missed;
            nextTick += missed * intervalMs_;
            LOG_WARN(TAG, "%s: tick overran by %u ms, skipping %u tick(s)", task_->getName(),
                     (unsigned)late, (unsigned)missed);
        }
        sleepUntil(nextTick);
    }

    LOG_INFO(TAG, "%s stopped after %u ticks (%u degraded, %u skipped)", task_->getName(),
             (unsigned)tickCount_, (unsigned)degradedTicks_, (unsigned)skippedTicks_);
    return 0;
}

void PeriodicRunner::sleepUntil(uint32_t deadline) {
    while (!stopRequested()) {
        int32_t remaining = (int32_t)(deadline - millis());
        if (remaining <= 0) {
            return;
        }
        sleepMillis(remaining > STOP_POLL_MS ? STOP_POLL_MS : (uint32_t)remaining);
    }
}

bool PeriodicRunner::installSignalHandlers() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = handleStopSignal;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_ERROR(TAG, "cannot install signal handlers");
        return false;
    }
    return true;
}

void PeriodicRunner::requestStop() {
    stopFlag = 1;
}

void PeriodicRunner::clearStop() {
    stopFlag = 0;
}

bool PeriodicRunner::stopRequested() {
    return stopFlag != 0;
}
