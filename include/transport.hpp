#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

/**
 * @class ModbusTransport
 * @brief One open connection able to read and write holding registers.
 *
 * Implementations report failures by throwing TransportError. A transport is
 * not thread-safe; the transaction engine serializes every call.
 */
class ModbusTransport {
public:
    virtual ~ModbusTransport() = default;

    /**
     * @brief Reads @p count holding registers starting at @p address.
     * @return Exactly @p count words.
     */
    virtual std::vector<uint16_t> readRegisters(int unit_id, uint16_t address, uint16_t count) = 0;

    /// @brief Single register write. Returns true when the device acknowledged it.
    virtual bool writeRegister(int unit_id, uint16_t address, uint16_t value) = 0;

    /// @brief Multi-register write in one request. Returns true when acknowledged.
    virtual bool writeRegisters(int unit_id, uint16_t address, const std::vector<uint16_t>& values) = 0;

    /// @brief Whether writeRegisters() is available as one atomic request.
    virtual bool supportsMultiWrite() const = 0;

    /// @brief Bounds how long the next calls wait for a response.
    virtual void setResponseTimeout(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @class TransportFactory
 * @brief Opens fresh connections to a fixed endpoint.
 */
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    /**
     * @brief Opens a new connection.
     * @param timeout Bound on the connect and on responses to later requests.
     * @throw ConnectionError if the endpoint cannot be reached.
     */
    virtual std::unique_ptr<ModbusTransport> connect(std::chrono::milliseconds timeout) = 0;
};

#endif // TRANSPORT_H
