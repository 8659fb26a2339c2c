#include "inverter_errors.hpp"
#include <sstream>
#include <utility>

namespace {

std::string joinAddresses(const std::vector<uint16_t>& addresses) {
    std::ostringstream out;
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (i > 0) out << ",";
        out << addresses[i];
    }
    return out.str();
}

} // namespace

UnknownRegister::UnknownRegister(const std::string& register_name)
    : InverterError("Unknown register: " + register_name), name(register_name) {}

DecodeError::DecodeError(const std::string& register_name, const std::string& reason)
    : InverterError("Cannot decode register " + register_name + ": " + reason), name(register_name) {}

EncodeError::EncodeError(const std::string& register_name, const std::string& reason)
    : InverterError("Cannot encode register " + register_name + ": " + reason), name(register_name) {}

NotWritable::NotWritable(const std::string& register_name)
    : EncodeError(register_name, "register is read-only") {}

const char* toString(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::Timeout: return "timeout";
        case TransportErrorKind::Refused: return "refused";
        case TransportErrorKind::ProtocolError: return "protocol error";
        case TransportErrorKind::DeviceBusy: return "device busy";
    }
    return "unknown";
}

TransportError::TransportError(TransportErrorKind kind, const std::string& message,
                               uint16_t address, uint16_t count,
                               int attempts, int exception_code)
    : InverterError(message),
      error_kind(kind),
      start_address(address),
      register_count(count),
      attempt_count(attempts),
      modbus_exception_code(exception_code) {}

PermissionDenied::PermissionDenied(const std::string& message, uint16_t address, uint16_t count)
    : InverterError(message), start_address(address), register_count(count) {}

PartialWriteFailure::PartialWriteFailure(const std::string& register_name,
                                         std::vector<uint16_t> confirmed_addresses,
                                         std::vector<uint16_t> unconfirmed_addresses,
                                         const std::string& cause)
    : InverterError("Write to " + register_name + " partially applied (confirmed: " +
                    joinAddresses(confirmed_addresses) + "; unconfirmed: " +
                    joinAddresses(unconfirmed_addresses) + "): " + cause),
      name(register_name),
      confirmed(std::move(confirmed_addresses)),
      unconfirmed(std::move(unconfirmed_addresses)) {}
