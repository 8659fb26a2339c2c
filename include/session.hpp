#ifndef SESSION_H
#define SESSION_H

#include "read_planner.hpp"
#include "register_table.hpp"
#include "register_types.hpp"
#include "session_config.hpp"
#include "transaction_engine.hpp"
#include "transport.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/// @brief Per-call overrides of the session defaults.
struct RequestOptions {
    /// Bound on waiting for the connection plus executing the request.
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<int> unit_id;
};

/// @brief Confirmation of an accepted write.
struct WriteAck {
    std::string name;
    uint16_t address;
    uint16_t count;
};

/**
 * @class Session
 * @brief Typed access to the registers of one inverter over one connection.
 *
 * A session is created by connect() and owns its connection until close() or
 * destruction. All methods may be called from several threads; requests are
 * executed one at a time in arrival order.
 */
class Session {
public:
    /**
     * @brief Opens a session through the given transport factory.
     * @param registers The register table of the device.
     * @param config Connection, batching and retry settings.
     * @param factory Opens the connection; called again on reconnect.
     * @param sleeper Pause function for backoff and cooldown, mainly for tests.
     * @throw ConfigError if the settings are invalid.
     * @throw ConnectionError if the first connection cannot be opened.
     */
    static std::unique_ptr<Session> connect(std::shared_ptr<const RegisterTable> registers,
                                            const SessionConfig& config,
                                            std::shared_ptr<TransportFactory> factory,
                                            TransactionEngine::Sleeper sleeper = TransactionEngine::Sleeper());

    /**
     * @brief Opens a session over libmodbus to the configured endpoint.
     */
    static std::unique_ptr<Session> connect(std::shared_ptr<const RegisterTable> registers,
                                            const SessionConfig& config);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Reads and decodes one register.
     * @throw UnknownRegister, DecodeError, TransportError, ConnectionUnavailable
     */
    TypedValue get(const std::string& name, const RequestOptions& options = RequestOptions());

    /**
     * @brief Reads several registers as one consistent snapshot.
     *
     * The registers are coalesced into as few requests as the limits allow and
     * all of them run under a single lock acquisition. Either every value is
     * returned or an error is thrown.
     * @return Values keyed by register name; empty for an empty request.
     */
    std::map<std::string, TypedValue> getMultiple(const std::vector<std::string>& names,
                                                  const RequestOptions& options = RequestOptions());

    /**
     * @brief Encodes and writes a value.
     * @throw UnknownRegister, NotWritable, EncodeError, TransportError,
     *        PartialWriteFailure, PermissionDenied, ConnectionUnavailable
     */
    WriteAck set(const std::string& name, const WriteValue& value, const RequestOptions& options = RequestOptions());

    /**
     * @brief Reads a register back and compares it with the encoding of @p value.
     * @return True if the device holds exactly the encoded words.
     */
    bool verifyWrite(const std::string& name, const WriteValue& value, const RequestOptions& options = RequestOptions());

    /**
     * @brief Writes 1 to the heartbeat register to keep the device session alive.
     * @return False if no heartbeat register is configured or the write failed.
     */
    bool heartbeat();

    /**
     * @brief Replaces the connection with a fresh one after a failure.
     * @throw ConnectionError if connecting fails.
     */
    void reconnect();

    void close();
    bool isHealthy() const { return engine.isHealthy(); }

    const RegisterTable& registers() const { return *table; }
    const SessionConfig& config() const { return session_config; }
    const CodecContext& codecContext() const { return codec_context; }

private:
    struct ConnectKey {
        explicit ConnectKey() = default;
    };

public:
    /// @brief Only reachable through connect(), which opens the connection afterwards.
    Session(ConnectKey, std::shared_ptr<const RegisterTable> registers, const SessionConfig& config,
            std::shared_ptr<TransportFactory> factory, TransactionEngine::Sleeper sleeper);

private:

    void loadTimeZone();
    std::optional<TransactionEngine::Deadline> deadlineFor(const RequestOptions& options) const;
    int unitFor(const RequestOptions& options) const;

    std::shared_ptr<const RegisterTable> table;
    SessionConfig session_config;
    ReadPlanner planner;
    TransactionEngine engine;
    CodecContext codec_context;
};

#endif // SESSION_H
