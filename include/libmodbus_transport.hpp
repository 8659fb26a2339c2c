#ifndef LIBMODBUS_TRANSPORT_H
#define LIBMODBUS_TRANSPORT_H

#include "session_config.hpp"
#include "transport.hpp"
#include <modbus/modbus.h>

/**
 * @class LibmodbusTransport
 * @brief ModbusTransport backed by a connected libmodbus context.
 *
 * Takes ownership of the context and closes and frees it on destruction.
 * Errors reported through errno are translated into TransportError kinds.
 */
class LibmodbusTransport : public ModbusTransport {
public:
    explicit LibmodbusTransport(modbus_t* ctx);
    ~LibmodbusTransport() override;

    LibmodbusTransport(const LibmodbusTransport&) = delete;
    LibmodbusTransport& operator=(const LibmodbusTransport&) = delete;

    std::vector<uint16_t> readRegisters(int unit_id, uint16_t address, uint16_t count) override;
    bool writeRegister(int unit_id, uint16_t address, uint16_t value) override;
    bool writeRegisters(int unit_id, uint16_t address, const std::vector<uint16_t>& values) override;
    bool supportsMultiWrite() const override { return true; }
    void setResponseTimeout(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    void selectUnit(int unit_id, uint16_t address, uint16_t count);

    modbus_t* ctx;
};

/**
 * @class LibmodbusTransportFactory
 * @brief Opens libmodbus TCP or RTU connections to one endpoint.
 */
class LibmodbusTransportFactory : public TransportFactory {
public:
    explicit LibmodbusTransportFactory(Endpoint endpoint);

    std::unique_ptr<ModbusTransport> connect(std::chrono::milliseconds timeout) override;

private:
    Endpoint endpoint;
};

#endif // LIBMODBUS_TRANSPORT_H
