/**
 * @file modbus_link.cpp
 * @brief Modbus link and POSIX transports
 */

#include "modbus_link.h"
#include "logger.h"
#include "sys_clock.h"

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

static const char* TAG = "modbus";

// ============================================================================
// LINK CONFIGURATION
// ============================================================================

void ModbusLinkConfig::setDefaults() {
    mode = ModbusMode::RTU;
    strncpy(port, MODBUS_DEFAULT_PORT, sizeof(port) - 1);
    port[sizeof(port) - 1] = '\0';
    baudRate = MODBUS_DEFAULT_BAUD;
    dataBits = MODBUS_DEFAULT_DATA_BITS;
    parity = MODBUS_DEFAULT_PARITY;
    stopBits = MODBUS_DEFAULT_STOP_BITS;
    host[0] = '\0';
    tcpPort = MODBUS_DEFAULT_TCP_PORT;
    timeoutMs = MODBUS_DEFAULT_TIMEOUT_MS;
    maxRetries = MODBUS_DEFAULT_MAX_RETRIES;
    backoffBaseMs = MODBUS_DEFAULT_BACKOFF_MS;
    backoffCapMs = MODBUS_DEFAULT_BACKOFF_CAP_MS;
}

// ============================================================================
// POSIX HELPERS
// ============================================================================

static ModbusStatus waitReadable(int fd, uint32_t timeoutMs) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int rv = poll(&pfd, 1, (int)timeoutMs);
    if (rv == 0) {
        return ModbusStatus::TIMEOUT;
    }
    if (rv < 0) {
        return errno == EINTR ? ModbusStatus::TIMEOUT : ModbusStatus::CONNECTION_ERROR;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        return ModbusStatus::CONNECTION_ERROR;
    }
    return ModbusStatus::OK;
}

static ModbusStatus readExactly(int fd, uint8_t* buffer, size_t length, uint32_t timeoutMs) {
    uint32_t start = millis();
    size_t got = 0;

    while (got < length) {
        uint32_t elapsed = millis() - start;
        if (elapsed >= timeoutMs) {
            return ModbusStatus::TIMEOUT;
        }
        ModbusStatus ready = waitReadable(fd, timeoutMs - elapsed);
        if (ready != ModbusStatus::OK) {
            return ready;
        }

        ssize_t n = ::read(fd, buffer + got, length - got);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return ModbusStatus::CONNECTION_ERROR;
        }
        if (n == 0) {
            // Peer closed (TCP) or hangup (serial)
            return ModbusStatus::CONNECTION_ERROR;
        }
        got += (size_t)n;
    }
    return ModbusStatus::OK;
}

// A full send buffer that does not drain within timeoutMs is a TIMEOUT
static ModbusStatus writeAll(int fd, const uint8_t* data, size_t length, uint32_t timeoutMs) {
    size_t written = 0;
    while (written < length) {
        ssize_t n = ::write(fd, data + written, length - written);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                if (poll(&pfd, 1, (int)timeoutMs) <= 0) {
                    return ModbusStatus::TIMEOUT;
                }
                continue;
            }
            return ModbusStatus::CONNECTION_ERROR;
        }
        written += (size_t)n;
    }
    return ModbusStatus::OK;
}

static speed_t mapBaud(uint32_t baud) {
    switch (baud) {
        case 1200: return B1200;
        case 2400: return B2400;
        case 4800: return B4800;
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        default: return 0;
    }
}

// ============================================================================
// SERIAL TRANSPORT
// ============================================================================

SerialTransport::SerialTransport(const char* device, uint32_t baudRate, uint8_t dataBits,
                                 char parity, uint8_t stopBits, uint32_t timeoutMs)
    : baudRate_(baudRate), dataBits_(dataBits), parity_(parity), stopBits_(stopBits),
      timeoutMs_(timeoutMs), fd_(-1) {
    strncpy(device_, device, sizeof(device_) - 1);
    device_[sizeof(device_) - 1] = '\0';
}

SerialTransport::~SerialTransport() {
    close();
}

ModbusStatus SerialTransport::open() {
    if (fd_ >= 0) {
        return ModbusStatus::OK;
    }

    fd_ = ::open(device_, O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        LOG_ERROR(TAG, "open %s failed: %s", device_, strerror(errno));
        return ModbusStatus::CONNECTION_ERROR;
    }

    // Exclusive ownership: fail fast if another process holds the port
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        LOG_ERROR(TAG, "%s is held by another process", device_);
        ::close(fd_);
        fd_ = -1;
        return ModbusStatus::CONNECTION_ERROR;
    }
    if (ioctl(fd_, TIOCEXCL) != 0) {
        LOG_WARN(TAG, "TIOCEXCL on %s failed: %s", device_, strerror(errno));
    }

    if (!configurePort()) {
        close();
        return ModbusStatus::CONNECTION_ERROR;
    }

    LOG_INFO(TAG, "opened %s %u %u%c%u", device_, (unsigned)baudRate_, (unsigned)dataBits_,
             parity_, (unsigned)stopBits_);
    return ModbusStatus::OK;
}

bool SerialTransport::configurePort() {
    struct termios tty;
    if (tcgetattr(fd_, &tty) != 0) {
        LOG_ERROR(TAG, "tcgetattr %s failed: %s", device_, strerror(errno));
        return false;
    }

    cfmakeraw(&tty);

    speed_t speed = mapBaud(baudRate_);
    if (speed == 0) {
        LOG_ERROR(TAG, "unsupported baud rate %u", (unsigned)baudRate_);
        return false;
    }
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= (dataBits_ == 7) ? CS7 : CS8;

    if (parity_ == 'E') {
        tty.c_cflag |= PARENB;
        tty.c_cflag &= ~PARODD;
    } else if (parity_ == 'O') {
        tty.c_cflag |= PARENB | PARODD;
    } else {
        tty.c_cflag &= ~PARENB;
    }

    if (stopBits_ == 2) {
        tty.c_cflag |= CSTOPB;
    } else {
        tty.c_cflag &= ~CSTOPB;
    }

    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;    // poll() drives timeouts

    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        LOG_ERROR(TAG, "tcsetattr %s failed: %s", device_, strerror(errno));
        return false;
    }
    tcflush(fd_, TCIOFLUSH);
    return true;
}

void SerialTransport::close() {
    if (fd_ >= 0) {
        ioctl(fd_, TIOCNXCL);
        flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

ModbusStatus SerialTransport::send(const uint8_t* data, size_t length) {
    if (fd_ < 0) {
        return ModbusStatus::CONNECTION_ERROR;
    }
    ModbusStatus status = writeAll(fd_, data, length, timeoutMs_);
    if (status == ModbusStatus::OK) {
        tcdrain(fd_);
    }
    return status;
}

ModbusStatus SerialTransport::receive(uint8_t* buffer, size_t length, uint32_t timeoutMs) {
    if (fd_ < 0) {
        return ModbusStatus::CONNECTION_ERROR;
    }
    return readExactly(fd_, buffer, length, timeoutMs);
}

void SerialTransport::discardInput() {
    if (fd_ >= 0) {
        tcflush(fd_, TCIFLUSH);
    }
}

// ============================================================================
// TCP TRANSPORT
// ============================================================================

TcpTransport::TcpTransport(const char* host, uint16_t port, uint32_t timeoutMs)
    : port_(port), timeoutMs_(timeoutMs), fd_(-1) {
    strncpy(host_, host, sizeof(host_) - 1);
    host_[sizeof(host_) - 1] = '\0';
    snprintf(name_, sizeof(name_), "%s:%u", host_, (unsigned)port_);
}

TcpTransport::~TcpTransport() {
    close();
}

ModbusStatus TcpTransport::open() {
    if (fd_ >= 0) {
        return ModbusStatus::OK;
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char service[8];
    snprintf(service, sizeof(service), "%u", (unsigned)port_);

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host_, service, &hints, &result);
    if (rc != 0) {
        LOG_ERROR(TAG, "resolve %s failed: %s", name_, gai_strerror(rc));
        return ModbusStatus::CONNECTION_ERROR;
    }

    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }

        bool connected = (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0);
        if (!connected && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            if (poll(&pfd, 1, (int)timeoutMs_) == 1) {
                int soError = 0;
                socklen_t len = sizeof(soError);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
                connected = (soError == 0);
            }
        }

        if (connected) {
            int one = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            fd_ = fd;
            break;
        }
        ::close(fd);
    }
    freeaddrinfo(result);

    if (fd_ < 0) {
        LOG_ERROR(TAG, "connect %s failed", name_);
        return ModbusStatus::CONNECTION_ERROR;
    }
    LOG_INFO(TAG, "connected to %s", name_);
    return ModbusStatus::OK;
}

void TcpTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

ModbusStatus TcpTransport::send(const uint8_t* data, size_t length) {
    if (fd_ < 0) {
        return ModbusStatus::CONNECTION_ERROR;
    }
    return writeAll(fd_, data, length, timeoutMs_);
}

ModbusStatus TcpTransport::receive(uint8_t* buffer, size_t length, uint32_t timeoutMs) {
    if (fd_ < 0) {
        return ModbusStatus::CONNECTION_ERROR;
    }
    return readExactly(fd_, buffer, length, timeoutMs);
}

void TcpTransport::discardInput() {
    if (fd_ < 0) {
        return;
    }
    uint8_t scratch[64];
    while (recv(fd_, scratch, sizeof(scratch), MSG_DONTWAIT) > 0) {
    }
}

ModbusTransport* createTransport(const ModbusLinkConfig& config) {
    if (config.mode == ModbusMode::TCP) {
        return new TcpTransport(config.host, config.tcpPort, config.timeoutMs);
    }
    return new SerialTransport(config.port, config.baudRate, config.dataBits,
                               config.parity, config.stopBits, config.timeoutMs);
}

// ============================================================================
// MODBUS LINK IMPLEMENTATION
// ============================================================================

ModbusLink::ModbusLink(ModbusTransport* transport, const ModbusLinkConfig& config)
    : transport_(transport)
    , config_(config)
    , transactionId_(0)
    , lastExceptionCode_(0)
    , lastAttempts_(0) {
    memset(&stats_, 0, sizeof(stats_));
}

ModbusLink::~ModbusLink() {
    close();
}

ModbusStatus ModbusLink::connect() {
    ModbusStatus status = transport_->open();
    if (status != ModbusStatus::OK) {
        stats_.connectionErrors++;
        return ModbusStatus::CONNECTION_ERROR;
    }
    return ModbusStatus::OK;
}

void ModbusLink::close() {
    if (transport_ != nullptr && transport_->isOpen()) {
        transport_->close();
    }
}

bool ModbusLink::isConnected() const {
    return transport_->isOpen();
}

uint32_t ModbusLink::backoffDelayMs(uint8_t retryIndex) const {
    uint32_t delay = config_.backoffBaseMs;
    for (uint8_t i = 0; i < retryIndex && delay < config_.backoffCapMs; i++) {
        delay *= 2;
    }
    return delay > config_.backoffCapMs ? config_.backoffCapMs : delay;
}

ModbusStatus ModbusLink::readRegisters(uint8_t unitAddress, uint16_t startAddress, uint16_t count,
                                       uint16_t* values) {
    Request request;
    request.unitAddress = unitAddress;
    request.function = MODBUS_FC_READ_HOLDING_REGISTERS;
    request.address = startAddress;
    request.count = count;
    request.value = 0;
    request.readValues = values;
    request.pduLength = ModbusCodec::buildReadHoldingRegisters(request.pdu, startAddress, count);
    if (request.pduLength == 0 || values == nullptr) {
        return ModbusStatus::INVALID_ARGUMENT;
    }
    return execute(request);
}

ModbusStatus ModbusLink::writeRegister(uint8_t unitAddress, uint16_t address, uint16_t value) {
    Request request;
    request.unitAddress = unitAddress;
    request.function = MODBUS_FC_WRITE_SINGLE_REGISTER;
    request.address = address;
    request.count = 1;
    request.value = value;
    request.readValues = nullptr;
    request.pduLength = ModbusCodec::buildWriteSingleRegister(request.pdu, address, value);
    return execute(request);
}

ModbusStatus ModbusLink::writeRegisters(uint8_t unitAddress, uint16_t startAddress,
                                        const uint16_t* values, uint16_t count) {
    if (values != nullptr && count == 1) {
        return writeRegister(unitAddress, startAddress, values[0]);
    }

    Request request;
    request.unitAddress = unitAddress;
    request.function = MODBUS_FC_WRITE_MULTIPLE_REGISTERS;
    request.address = startAddress;
    request.count = count;
    request.value = 0;
    request.readValues = nullptr;
    request.pduLength = ModbusCodec::buildWriteMultipleRegisters(request.pdu, startAddress, values, count);
    if (request.pduLength == 0) {
        return ModbusStatus::INVALID_ARGUMENT;
    }
    return execute(request);
}

ModbusStatus ModbusLink::execute(Request& request) {
    lastAttempts_ = 0;
    lastExceptionCode_ = 0;

    if (request.unitAddress < MODBUS_MIN_UNIT_ADDRESS || request.unitAddress > MODBUS_MAX_UNIT_ADDRESS) {
        return ModbusStatus::INVALID_ARGUMENT;
    }

    stats_.requests++;
    ModbusStatus status = ModbusStatus::TIMEOUT;

    for (uint8_t tryIndex = 0; tryIndex <= config_.maxRetries; tryIndex++) {
        if (tryIndex > 0) {
            uint32_t delay = backoffDelayMs(tryIndex - 1);
            stats_.retries++;
            LOG_DEBUG(TAG, "unit %u fc 0x%02X retry %u after %s, waiting %u ms",
                      (unsigned)request.unitAddress, (unsigned)request.function, (unsigned)tryIndex,
                      modbusStatusToString(status), (unsigned)delay);
            sleepMillis(delay);
        }
        lastAttempts_ = tryIndex + 1;

        if (!transport_->isOpen() && transport_->open() != ModbusStatus::OK) {
            status = ModbusStatus::CONNECTION_ERROR;
            countFailure(status);
            continue;
        }

        status = attempt(request);
        if (status == ModbusStatus::OK) {
            return status;
        }
        countFailure(status);

        if (status == ModbusStatus::EXCEPTION_RESPONSE) {
            LOG_WARN(TAG, "unit %u fc 0x%02X addr %u rejected: %s (0x%02X)",
                     (unsigned)request.unitAddress, (unsigned)request.function,
                     (unsigned)request.address, modbusExceptionToString(lastExceptionCode_),
                     (unsigned)lastExceptionCode_);
            return status;
        }
        if (status == ModbusStatus::CONNECTION_ERROR ||
            (config_.mode == ModbusMode::TCP && status != ModbusStatus::CRC_ERROR)) {
            // Resynchronise the stream on the next attempt
            transport_->close();
        }
    }

    LOG_DEBUG(TAG, "unit %u fc 0x%02X addr %u failed after %u attempts: %s",
              (unsigned)request.unitAddress, (unsigned)request.function, (unsigned)request.address,
              (unsigned)lastAttempts_, modbusStatusToString(status));
    return status;
}

ModbusStatus ModbusLink::attempt(Request& request) {
    uint8_t adu[MODBUS_TCP_MAX_ADU];
    size_t aduLength;

    if (config_.mode == ModbusMode::TCP) {
        transactionId_++;
        aduLength = ModbusCodec::wrapTcp(adu, transactionId_, request.unitAddress,
                                         request.pdu, request.pduLength);
    } else {
        aduLength = ModbusCodec::wrapRtu(adu, request.unitAddress, request.pdu, request.pduLength);
    }

    transport_->discardInput();
    ModbusStatus status = transport_->send(adu, aduLength);
    if (status != ModbusStatus::OK) {
        return status;
    }

    uint8_t response[MODBUS_TCP_MAX_ADU];
    size_t pduOffset = 0;
    size_t pduLength = 0;
    if (config_.mode == ModbusMode::TCP) {
        status = receiveTcp(request, response, pduOffset, pduLength);
    } else {
        status = receiveRtu(request, response, pduOffset, pduLength);
    }
    if (status != ModbusStatus::OK) {
        return status;
    }
    return validate(request, response + pduOffset, pduLength);
}

ModbusStatus ModbusLink::receiveRtu(const Request& request, uint8_t* response,
                                    size_t& pduOffset, size_t& pduLength) {
    uint32_t start = millis();
    ModbusStatus status = transport_->receive(response, MODBUS_RTU_HEADER_PEEK, config_.timeoutMs);
    if (status != ModbusStatus::OK) {
        return status;
    }

    size_t total = ModbusCodec::rtuResponseLength(response);
    if (total < MODBUS_RTU_HEADER_PEEK || total > MODBUS_RTU_MAX_ADU) {
        return ModbusStatus::FRAME_ERROR;
    }

    uint32_t elapsed = millis() - start;
    if (elapsed >= config_.timeoutMs) {
        return ModbusStatus::TIMEOUT;
    }
    if (total > MODBUS_RTU_HEADER_PEEK) {
        status = transport_->receive(response + MODBUS_RTU_HEADER_PEEK, total - MODBUS_RTU_HEADER_PEEK,
                                     config_.timeoutMs - elapsed);
        if (status != ModbusStatus::OK) {
            return status;
        }
    }
    return ModbusCodec::unwrapRtu(response, total, request.unitAddress, pduOffset, pduLength);
}

ModbusStatus ModbusLink::receiveTcp(const Request& request, uint8_t* response,
                                    size_t& pduOffset, size_t& pduLength) {
    uint32_t start = millis();
    ModbusStatus status = transport_->receive(response, MODBUS_MBAP_LENGTH, config_.timeoutMs);
    if (status != ModbusStatus::OK) {
        return status;
    }

    uint16_t following = ModbusCodec::tcpFollowingLength(response);
    if (following < 3 || following > MODBUS_MAX_PDU_LENGTH + 1) {
        return ModbusStatus::FRAME_ERROR;
    }

    uint32_t elapsed = millis() - start;
    if (elapsed >= config_.timeoutMs) {
        return ModbusStatus::TIMEOUT;
    }
    status = transport_->receive(response + MODBUS_MBAP_LENGTH, following - 1, config_.timeoutMs - elapsed);
    if (status != ModbusStatus::OK) {
        return status;
    }
    return ModbusCodec::unwrapTcp(response, (size_t)following + 6, transactionId_, request.unitAddress,
                                  pduOffset, pduLength);
}

ModbusStatus ModbusLink::validate(Request& request, const uint8_t* pdu, size_t pduLength) {
    switch (request.function) {
        case MODBUS_FC_READ_HOLDING_REGISTERS:
            return ModbusCodec::parseReadHoldingRegisters(pdu, pduLength, request.count,
                                                          request.readValues, lastExceptionCode_);
        case MODBUS_FC_WRITE_SINGLE_REGISTER:
            return ModbusCodec::parseWriteSingleRegister(pdu, pduLength, request.address,
                                                         request.value, lastExceptionCode_);
        case MODBUS_FC_WRITE_MULTIPLE_REGISTERS:
            return ModbusCodec::parseWriteMultipleRegisters(pdu, pduLength, request.address,
                                                            request.count, lastExceptionCode_);
        default:
            return ModbusStatus::INVALID_ARGUMENT;
    }
}

void ModbusLink::countFailure(ModbusStatus status) {
    switch (status) {
        case ModbusStatus::TIMEOUT: stats_.timeouts++; break;
        case ModbusStatus::CRC_ERROR: stats_.crcErrors++; break;
        case ModbusStatus::FRAME_ERROR: stats_.frameErrors++; break;
        case ModbusStatus::EXCEPTION_RESPONSE: stats_.exceptions++; break;
        case ModbusStatus::CONNECTION_ERROR: stats_.connectionErrors++; break;
        default: break;
    }
}
