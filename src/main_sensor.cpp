/**
 * @file main_sensor.cpp
 * @brief Vibration sensor daemon
 *
 * Polls every configured channel over Modbus, classifies the readings and
 * publishes the fault state file once per tick.
 *
 * Usage: vibmon_sensord [config.yaml]
 */

#include "config.h"
#include "fault_state_store.h"
#include "logger.h"
#include "modbus_link.h"
#include "scheduler.h"
#include "sensor_poll_loop.h"
#include "yaml_config.h"

static const char* TAG = "sensord";

// The link and everything using it are released before the transport
static int runSensorDaemon(const MonitorConfig& config, ModbusTransport* transport) {
    // =========================================================================
    // OPEN THE BUS
    // =========================================================================
    ModbusLink link(transport, config.sensorLink);

    ModbusStatus status = link.connect();
    if (status != ModbusStatus::OK) {
        LOG_ERROR(TAG, "cannot open %s: %s", transport->getName(), modbusStatusToString(status));
        return 1;
    }

    // =========================================================================
    // RUN
    // =========================================================================
    FaultStateStore store(config.store);
    SensorPollLoop loop(&link, &store, config.channels, config.channelCount, config.polling);
    if (loop.getChannelCount() != config.channelCount) {
        LOG_WARN(TAG, "%u of %u channels active", (unsigned)loop.getChannelCount(),
                 (unsigned)config.channelCount);
    }

    if (!PeriodicRunner::installSignalHandlers()) {
        LOG_WARN(TAG, "signal handlers not installed, stop with SIGKILL only");
    }

    PeriodicRunner runner(&loop, config.polling.intervalMs);
    int exitCode = runner.run();

    const ModbusLinkStats& stats = link.getStats();
    LOG_INFO(TAG, "stopped after %u ticks (%u degraded): %u requests, %u retries, %u timeouts",
             (unsigned)runner.getTickCount(), (unsigned)runner.getDegradedTicks(),
             (unsigned)stats.requests, (unsigned)stats.retries, (unsigned)stats.timeouts);

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

    ModbusTransport* transport = createTransport(config->sensorLink);
    int exitCode = runSensorDaemon(*config, transport);

    delete transport;
    delete config;
    return exitCode;
}
