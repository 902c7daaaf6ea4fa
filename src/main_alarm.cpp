/**
 * @file main_alarm.cpp
 * @brief Alarm daemon
 *
 * Reads the fault state file published by vibmon_sensord, debounces the
 * levels per output and drives the alarm registers on the PLC.
 *
 * Usage: vibmon_alarmd [config.yaml]
 */

#include "config.h"
#include "alarm_actuator.h"
#include "alarm_engine.h"
#include "fault_state_store.h"
#include "logger.h"
#include "modbus_link.h"
#include "scheduler.h"
#include "yaml_config.h"

static const char* TAG = "alarmd";

// The link and everything using it are released before the transport
static int runAlarmDaemon(const MonitorConfig& config, ModbusTransport* transport) {
    // =========================================================================
    // OPEN THE BUS
    // =========================================================================
    ModbusLink link(transport, config.alarmLink);

    ModbusStatus status = link.connect();
    if (status != ModbusStatus::OK) {
        LOG_ERROR(TAG, "cannot open %s: %s", transport->getName(), modbusStatusToString(status));
        return 1;
    }

    // =========================================================================
    // RUN
    // =========================================================================
    FaultStateStore store(config.store);
    AlarmDecisionEngine engine(config.outputs, config.outputCount, config.alarmDebounce);
    AlarmActuator actuator(&link, &store, &engine, config.status);

    if (!PeriodicRunner::installSignalHandlers()) {
        LOG_WARN(TAG, "signal handlers not installed, stop with SIGKILL only");
    }

    PeriodicRunner runner(&actuator, config.alarmIntervalMs);
    int exitCode = runner.run();

    LOG_INFO(TAG, "stopped after %u ticks (%u degraded)", (unsigned)runner.getTickCount(),
             (unsigned)runner.getDegradedTicks());
    for (uint8_t i = 0; i < engine.getOutputCount(); i++) {
        LOG_INFO(TAG, "%s left %s", engine.getOutput(i).name, outputStateToString(engine.getState(i)));
    }

    link.close();
    return exitCode;
}

int main(int argc, char** argv) {
    // =========================================================================
    // LOAD CONFIGURATION
    // =========================================================================
    const char* path = ConfigLoader::resolvePath(argc, argv);
    MonitorConfig* config = new MonitorConfig();

    if (!ConfigLoader::load(path, *config)) {
        LOG_ERROR(TAG, "configuration %s rejected: %s", path, config->loadError);
        delete config;
        return 1;
    }
    Logger::setLevel(config->logLevel);
    LOG_INFO(TAG, "configuration loaded from %s", path);
    ConfigLoader::printConfig(*config);

    if (config->outputCount == 0 && !config->status.enabled) {
        LOG_WARN(TAG, "no outputs and no status block configured, nothing to drive");
    }

    ModbusTransport* transport = createTransport(config->alarmLink);
    int exitCode = runAlarmDaemon(*config, transport);

    delete transport;
    delete config;
    return exitCode;
}
