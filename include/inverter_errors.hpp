#ifndef INVERTER_ERRORS_H
#define INVERTER_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @class InverterError
 * @brief Base class for every error raised by the register access layer.
 */
class InverterError : public std::runtime_error {
public:
    explicit InverterError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief A register name that is not in the register table.
class UnknownRegister : public InverterError {
public:
    explicit UnknownRegister(const std::string& name);
    const std::string& registerName() const { return name; }

private:
    std::string name;
};

/// @brief Raw register content that does not fit the descriptor's type.
class DecodeError : public InverterError {
public:
    DecodeError(const std::string& register_name, const std::string& reason);
    const std::string& registerName() const { return name; }

private:
    std::string name;
};

/// @brief A value that cannot be represented by the descriptor.
class EncodeError : public InverterError {
public:
    EncodeError(const std::string& register_name, const std::string& reason);
    const std::string& registerName() const { return name; }

private:
    std::string name;
};

/// @brief Write attempted on a read-only register.
class NotWritable : public EncodeError {
public:
    explicit NotWritable(const std::string& register_name);
};

/// @brief The static register table is inconsistent.
class RegisterTableError : public InverterError {
public:
    explicit RegisterTableError(const std::string& message) : InverterError(message) {}
};

/// @brief The configuration file or one of its options is invalid.
class ConfigError : public InverterError {
public:
    explicit ConfigError(const std::string& message) : InverterError(message) {}
};

enum class TransportErrorKind {
    Timeout,
    Refused,
    ProtocolError,
    DeviceBusy
};

const char* toString(TransportErrorKind kind);

/**
 * @class TransportError
 * @brief A failed request on the wire.
 *
 * Carries the requested range, how many attempts were made and, when the
 * device answered with a Modbus exception, its exception code.
 */
class TransportError : public InverterError {
public:
    TransportError(TransportErrorKind kind, const std::string& message,
                   uint16_t address = 0, uint16_t count = 0,
                   int attempts = 1, int exception_code = -1);

    TransportErrorKind kind() const { return error_kind; }
    uint16_t address() const { return start_address; }
    uint16_t count() const { return register_count; }
    int attempts() const { return attempt_count; }
    int exceptionCode() const { return modbus_exception_code; }

private:
    TransportErrorKind error_kind;
    uint16_t start_address;
    uint16_t register_count;
    int attempt_count;
    int modbus_exception_code;
};

/**
 * @class PermissionDenied
 * @brief The device refused a write with the vendor exception 0x80.
 *
 * The request reached the device and was answered, so it is neither retried
 * nor does it affect the health of the connection.
 */
class PermissionDenied : public InverterError {
public:
    PermissionDenied(const std::string& message, uint16_t address, uint16_t count);

    uint16_t address() const { return start_address; }
    uint16_t count() const { return register_count; }

    /// Exception code Huawei inverters answer with when the session lacks write permission.
    static constexpr int kExceptionCode = 0x80;

private:
    uint16_t start_address;
    uint16_t register_count;
};

/// @brief Opening a connection to the inverter failed.
class ConnectionError : public InverterError {
public:
    explicit ConnectionError(const std::string& message) : InverterError(message) {}
};

/**
 * @class ConnectionUnavailable
 * @brief The session is unhealthy or closed; no request was sent.
 */
class ConnectionUnavailable : public InverterError {
public:
    explicit ConnectionUnavailable(const std::string& message) : InverterError(message) {}
};

/**
 * @class PartialWriteFailure
 * @brief A non-atomic multi-register write stopped partway.
 *
 * The registers in confirmedAddresses() hold the new value, those in
 * unconfirmedAddresses() may not.
 */
class PartialWriteFailure : public InverterError {
public:
    PartialWriteFailure(const std::string& register_name,
                        std::vector<uint16_t> confirmed,
                        std::vector<uint16_t> unconfirmed,
                        const std::string& cause);

    const std::string& registerName() const { return name; }
    const std::vector<uint16_t>& confirmedAddresses() const { return confirmed; }
    const std::vector<uint16_t>& unconfirmedAddresses() const { return unconfirmed; }

private:
    std::string name;
    std::vector<uint16_t> confirmed;
    std::vector<uint16_t> unconfirmed;
};

#endif // INVERTER_ERRORS_H
