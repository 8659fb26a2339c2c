#include "libmodbus_transport.hpp"
#include "inverter_errors.hpp"
#include <cerrno>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace {

// Maps a libmodbus errno value onto the transport error taxonomy
TransportError translateError(int error, const std::string& operation, uint16_t address, uint16_t count) {
    std::string message = operation + " at " + std::to_string(address) + " (" + std::to_string(count) +
                          " registers) failed: " + modbus_strerror(error);

    if (error == ETIMEDOUT) {
        return TransportError(TransportErrorKind::Timeout, message, address, count);
    }
    if (error == ECONNREFUSED || error == ECONNRESET || error == EPIPE || error == ENOTCONN || error == EBADF) {
        return TransportError(TransportErrorKind::Refused, message, address, count);
    }
    if (error == EMBXSBUSY) {
        return TransportError(TransportErrorKind::DeviceBusy, message, address, count, 1,
                              MODBUS_EXCEPTION_SLAVE_OR_SERVER_BUSY);
    }
    if (error > MODBUS_ENOBASE && error < MODBUS_ENOBASE + MODBUS_EXCEPTION_MAX) {
        return TransportError(TransportErrorKind::ProtocolError, message, address, count, 1,
                              error - MODBUS_ENOBASE);
    }
    return TransportError(TransportErrorKind::ProtocolError, message, address, count);
}

// libmodbus reports exception codes outside the standard set as EMBBADEXC.
// Huawei inverters answer writes without permission with the vendor code 0x80.
void throwWriteError(int error, uint16_t address, uint16_t count) {
    if (error == EMBBADEXC) {
        throw PermissionDenied("Write at " + std::to_string(address) + " (" + std::to_string(count) +
                                   " registers) refused: permission denied",
                               address, count);
    }
    throw translateError(error, "Write", address, count);
}

} // namespace

LibmodbusTransport::LibmodbusTransport(modbus_t* context) : ctx(context) {}

LibmodbusTransport::~LibmodbusTransport() {
    close();
}

void LibmodbusTransport::selectUnit(int unit_id, uint16_t address, uint16_t count) {
    if (ctx == nullptr) {
        throw TransportError(TransportErrorKind::Refused, "Connection is closed", address, count);
    }
    if (modbus_set_slave(ctx, unit_id) == -1) {
        throw translateError(errno, "Selecting unit " + std::to_string(unit_id), address, count);
    }
}

std::vector<uint16_t> LibmodbusTransport::readRegisters(int unit_id, uint16_t address, uint16_t count) {
    selectUnit(unit_id, address, count);

    std::vector<uint16_t> dest(count);
    int rc = modbus_read_registers(ctx, address, count, dest.data());
    if (rc == -1) {
        throw translateError(errno, "Read", address, count);
    }
    if (rc != count) {
        throw TransportError(TransportErrorKind::ProtocolError,
                             "Read at " + std::to_string(address) + " returned " + std::to_string(rc) +
                                 " registers instead of " + std::to_string(count),
                             address, count);
    }
    return dest;
}

bool LibmodbusTransport::writeRegister(int unit_id, uint16_t address, uint16_t value) {
    selectUnit(unit_id, address, 1);

    int rc = modbus_write_register(ctx, address, value);
    if (rc == -1) {
        throwWriteError(errno, address, 1);
    }
    return rc == 1;
}

bool LibmodbusTransport::writeRegisters(int unit_id, uint16_t address, const std::vector<uint16_t>& values) {
    const uint16_t count = static_cast<uint16_t>(values.size());
    selectUnit(unit_id, address, count);

    int rc = modbus_write_registers(ctx, address, count, values.data());
    if (rc == -1) {
        throwWriteError(errno, address, count);
    }
    return rc == count;
}

void LibmodbusTransport::setResponseTimeout(std::chrono::milliseconds timeout) {
    if (ctx == nullptr) return;
    const auto total_ms = timeout.count() > 0 ? timeout.count() : 1;
    modbus_set_response_timeout(ctx, static_cast<uint32_t>(total_ms / 1000),
                                static_cast<uint32_t>((total_ms % 1000) * 1000));
}

void LibmodbusTransport::close() {
    if (ctx) {
        modbus_close(ctx);
        modbus_free(ctx);
        ctx = nullptr;
    }
}

LibmodbusTransportFactory::LibmodbusTransportFactory(Endpoint target) : endpoint(std::move(target)) {}

std::unique_ptr<ModbusTransport> LibmodbusTransportFactory::connect(std::chrono::milliseconds timeout) {
    modbus_t* ctx = nullptr;
    std::string description;

    if (const auto* tcp = std::get_if<TcpEndpoint>(&endpoint)) {
        description = tcp->host + ":" + std::to_string(tcp->port);
        ctx = modbus_new_tcp(tcp->host.c_str(), tcp->port);
    } else {
        const auto& serial = std::get<SerialEndpoint>(endpoint);
        description = serial.device;
        ctx = modbus_new_rtu(serial.device.c_str(), serial.baud, serial.parity, serial.data_bits, serial.stop_bits);
    }
    if (ctx == nullptr) {
        throw ConnectionError("Failed to create modbus context for " + description + ": " + modbus_strerror(errno));
    }

    auto transport = std::make_unique<LibmodbusTransport>(ctx);
    transport->setResponseTimeout(timeout);
    modbus_set_error_recovery(ctx, MODBUS_ERROR_RECOVERY_PROTOCOL);

    if (modbus_connect(ctx) == -1) {
        throw ConnectionError("Unable to connect to " + description + ": " + modbus_strerror(errno));
    }
    std::cout << "Connected to inverter at " << description << std::endl;
    return transport;
}
