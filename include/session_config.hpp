#ifndef SESSION_CONFIG_H
#define SESSION_CONFIG_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

/// @brief Modbus TCP endpoint.
struct TcpEndpoint {
    std::string host;
    int port = 502;
};

/// @brief Modbus RTU endpoint on a serial line.
struct SerialEndpoint {
    std::string device;
    int baud = 9600;
    char parity = 'N';
    int data_bits = 8;
    int stop_bits = 1;
};

using Endpoint = std::variant<TcpEndpoint, SerialEndpoint>;

/**
 * @struct SessionConfig
 * @brief Connection, batching and retry settings of a session.
 *
 * Every field has a usable default; only the endpoint needs to be set.
 */
struct SessionConfig {
    Endpoint endpoint = TcpEndpoint{};
    int unit_id = 0;
    std::chrono::milliseconds connect_timeout{5000};
    /// Total wait-plus-execute budget of an operation that does not set its own.
    std::optional<std::chrono::milliseconds> default_timeout;

    size_t max_registers_per_request = 125;
    size_t coalesce_gap_threshold = 0;

    int retry_attempts = 5;
    std::chrono::milliseconds retry_base_delay{500};
    std::chrono::milliseconds retry_max_delay{8000};
    /// Pause after every transaction, still holding the connection.
    std::chrono::milliseconds cooldown{50};

    bool atomic_multi_write = true;
    bool reconnect_on_demand = false;

    std::optional<std::string> time_zone_register;
    std::optional<uint16_t> heartbeat_register;
};

#endif // SESSION_CONFIG_H
