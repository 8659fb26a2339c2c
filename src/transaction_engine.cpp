#include "transaction_engine.hpp"
#include "inverter_errors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

TransactionEngine::TransactionEngine(std::shared_ptr<TransportFactory> transport_factory, RetryPolicy retry_policy,
                                     EngineSettings engine_settings, Sleeper sleep_function)
    : factory(std::move(transport_factory)),
      retry(retry_policy),
      settings(engine_settings),
      sleeper(std::move(sleep_function)),
      healthy(false),
      closed(false) {
    if (!sleeper) {
        sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

TransactionEngine::~TransactionEngine() {
    close();
}

void TransactionEngine::open() {
    acquire(std::nullopt);
    TransactionGuard guard(lock);
    if (closed) {
        throw ConnectionUnavailable("Session is closed");
    }
    connectLocked();
}

void TransactionEngine::reconnect() {
    acquire(std::nullopt);
    TransactionGuard guard(lock);
    if (closed) {
        throw ConnectionUnavailable("Session is closed");
    }
    if (transport) {
        transport->close();
        transport.reset();
    }
    healthy = false;
    try {
        connectLocked();
    } catch (const ConnectionError& e) {
        std::cerr << "Reconnect failed: " << e.what() << std::endl;
        throw;
    }
    std::cout << "Reconnected to inverter." << std::endl;
}

void TransactionEngine::close() {
    lock.acquire();
    TransactionGuard guard(lock);
    if (closed) return;
    closed = true;
    healthy = false;
    if (transport) {
        transport->close();
        transport.reset();
        std::cout << "Connection to inverter closed." << std::endl;
    }
}

RegisterSnapshot TransactionEngine::read(int unit_id, const ReadPlan& plan, const std::optional<Deadline>& deadline) {
    RegisterSnapshot snapshot;
    if (plan.ranges.empty()) {
        return snapshot;
    }

    acquire(deadline);
    TransactionGuard guard(lock);
    ensureUsable();

    for (const ReadRange& range : plan.ranges) {
        execute("Read", range.start, range.count, deadline, [&](ModbusTransport& connection) {
            std::vector<uint16_t> words = connection.readRegisters(unit_id, range.start, range.count);
            if (words.size() != range.count) {
                throw TransportError(TransportErrorKind::ProtocolError,
                                     "Read at " + std::to_string(range.start) + " returned " +
                                         std::to_string(words.size()) + " registers instead of " +
                                         std::to_string(range.count),
                                     range.start, range.count);
            }
            snapshot.append(range, words);
        });
    }
    cooldown();
    return snapshot;
}

void TransactionEngine::write(int unit_id, const std::string& name, uint16_t address,
                              const std::vector<uint16_t>& words, const std::optional<Deadline>& deadline) {
    if (words.empty()) {
        return;
    }
    const uint16_t count = static_cast<uint16_t>(words.size());

    acquire(deadline);
    TransactionGuard guard(lock);
    ensureUsable();

    auto writeSingle = [unit_id](uint16_t register_address, uint16_t value) {
        return [=](ModbusTransport& connection) {
            if (!connection.writeRegister(unit_id, register_address, value)) {
                throw TransportError(TransportErrorKind::ProtocolError,
                                     "Write at " + std::to_string(register_address) + " was not acknowledged",
                                     register_address, 1);
            }
        };
    };

    if (count == 1) {
        execute("Write", address, 1, deadline, writeSingle(address, words[0]));
    } else if (settings.atomic_multi_write && transport->supportsMultiWrite()) {
        execute("Write", address, count, deadline, [&](ModbusTransport& connection) {
            if (!connection.writeRegisters(unit_id, address, words)) {
                throw TransportError(TransportErrorKind::ProtocolError,
                                     "Write at " + std::to_string(address) + " was not acknowledged",
                                     address, count);
            }
        });
    } else {
        // Not atomic: a failure partway leaves the earlier registers written
        std::vector<uint16_t> confirmed;
        for (uint16_t i = 0; i < count; ++i) {
            const uint16_t register_address = static_cast<uint16_t>(address + i);
            try {
                execute("Write", register_address, 1, deadline, writeSingle(register_address, words[i]));
            } catch (const InverterError& e) {
                // TransportError after retries, or PermissionDenied
                if (confirmed.empty()) {
                    throw;
                }
                std::vector<uint16_t> unconfirmed;
                for (uint16_t j = i; j < count; ++j) {
                    unconfirmed.push_back(static_cast<uint16_t>(address + j));
                }
                std::cerr << "Warning: write to " << name << " partially applied, " << unconfirmed.size()
                          << " register(s) unconfirmed" << std::endl;
                throw PartialWriteFailure(name, confirmed, unconfirmed, e.what());
            }
            confirmed.push_back(register_address);
        }
    }
    cooldown();
}

bool TransactionEngine::tryWriteOnce(int unit_id, uint16_t address, uint16_t value) {
    lock.acquire();
    TransactionGuard guard(lock);
    if (closed || !healthy || !transport) {
        return false;
    }
    try {
        transport->setResponseTimeout(settings.connect_timeout);
        bool acknowledged = transport->writeRegister(unit_id, address, value);
        cooldown();
        return acknowledged;
    } catch (const TransportError& e) {
        std::cerr << "Warning: single write to " << address << " failed: " << e.what() << std::endl;
        return false;
    } catch (const PermissionDenied& e) {
        std::cerr << "Warning: single write to " << address << " refused: " << e.what() << std::endl;
        return false;
    }
}

void TransactionEngine::acquire(const std::optional<Deadline>& deadline) {
    if (!lock.acquire(deadline)) {
        throw TransportError(TransportErrorKind::Timeout, "Timed out waiting for the connection", 0, 0, 0);
    }
}

void TransactionEngine::ensureUsable() {
    if (closed) {
        throw ConnectionUnavailable("Session is closed");
    }
    if (healthy) {
        return;
    }
    if (!settings.reconnect_on_demand) {
        throw ConnectionUnavailable("Connection is unhealthy; reconnect required");
    }
    try {
        connectLocked();
    } catch (const ConnectionError& e) {
        std::cerr << "Reconnect failed: " << e.what() << std::endl;
        throw ConnectionUnavailable(std::string("Connection is unhealthy and reconnect failed: ") + e.what());
    }
    std::cout << "Reconnected to inverter." << std::endl;
}

void TransactionEngine::connectLocked() {
    transport = factory->connect(settings.connect_timeout);
    if (!transport) {
        throw ConnectionError("Transport factory returned no connection");
    }
    healthy = true;
}

void TransactionEngine::teardown(const std::string& reason) {
    std::cerr << "Tearing down connection: " << reason << std::endl;
    if (transport) {
        transport->close();
        transport.reset();
    }
    healthy = false;
}

void TransactionEngine::cooldown() {
    if (settings.cooldown.count() > 0) {
        sleeper(settings.cooldown);
    }
}

void TransactionEngine::execute(const std::string& operation, uint16_t address, uint16_t count,
                                const std::optional<Deadline>& deadline,
                                const std::function<void(ModbusTransport&)>& request) {
    for (int attempt = 1;; ++attempt) {
        std::chrono::milliseconds response_timeout = settings.connect_timeout;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            if (remaining.count() <= 0) {
                // Nothing is in flight yet, so the connection stays usable
                throw TransportError(TransportErrorKind::Timeout,
                                     operation + " at " + std::to_string(address) + " timed out",
                                     address, count, attempt - 1);
            }
            response_timeout = std::min(response_timeout, remaining);
        }
        transport->setResponseTimeout(response_timeout);

        try {
            request(*transport);
            return;
        } catch (const TransportError& e) {
            const std::string context = operation + " at " + std::to_string(address) + " (" +
                                        std::to_string(count) + " registers)";

            if (deadline && Clock::now() >= *deadline) {
                // The abandoned request leaves the protocol state unknown
                teardown(context + " abandoned at deadline");
                throw TransportError(TransportErrorKind::Timeout, context + " timed out: " + e.what(),
                                     address, count, attempt, e.exceptionCode());
            }
            if (!retry.shouldRetry(attempt)) {
                teardown(context + " failed after " + std::to_string(attempt) + " tries");
                throw TransportError(e.kind(),
                                     context + " failed after " + std::to_string(attempt) + " tries: " + e.what(),
                                     address, count, attempt, e.exceptionCode());
            }
            const std::chrono::milliseconds delay = retry.delayAfter(attempt);
            if (deadline && Clock::now() + delay >= *deadline) {
                // Nothing is in flight, so the connection stays usable for other callers
                std::cerr << "Giving up on " << context << ": next try would pass the deadline" << std::endl;
                throw TransportError(TransportErrorKind::Timeout,
                                     context + " timed out after " + std::to_string(attempt) + " tries: " + e.what(),
                                     address, count, attempt, e.exceptionCode());
            }
            std::cerr << "Backing off " << context << " for " << delay.count() << " ms after " << attempt
                      << " tries: " << e.what() << std::endl;
            sleeper(delay);
        }
    }
}
