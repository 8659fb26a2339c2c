#include "session.hpp"
#include "config_loader.hpp"
#include "inverter_errors.hpp"
#include "libmodbus_transport.hpp"
#include "value_codec.hpp"
#include <cmath>
#include <iostream>
#include <utility>

Session::Session(ConnectKey, std::shared_ptr<const RegisterTable> registers, const SessionConfig& config,
                 std::shared_ptr<TransportFactory> factory, TransactionEngine::Sleeper sleeper)
    : table(std::move(registers)),
      session_config(config),
      planner(PlannerOptions{config.max_registers_per_request, config.coalesce_gap_threshold}),
      engine(std::move(factory),
             RetryPolicy(config.retry_attempts, config.retry_base_delay, config.retry_max_delay),
             EngineSettings{config.connect_timeout, config.cooldown, config.atomic_multi_write,
                            config.reconnect_on_demand},
             std::move(sleeper)) {}

Session::~Session() {
    close();
}

std::unique_ptr<Session> Session::connect(std::shared_ptr<const RegisterTable> registers,
                                          const SessionConfig& config,
                                          std::shared_ptr<TransportFactory> factory,
                                          TransactionEngine::Sleeper sleeper) {
    ConfigLoader::validate(config);
    if (!registers) {
        throw ConfigError("A register table is required");
    }
    if (config.time_zone_register && !registers->contains(*config.time_zone_register)) {
        throw ConfigError("time_zone_register names unknown register " + *config.time_zone_register);
    }

    auto session = std::make_unique<Session>(ConnectKey(), std::move(registers), config, std::move(factory),
                                             std::move(sleeper));
    session->engine.open();
    session->loadTimeZone();
    return session;
}

std::unique_ptr<Session> Session::connect(std::shared_ptr<const RegisterTable> registers,
                                          const SessionConfig& config) {
    return connect(std::move(registers), config, std::make_shared<LibmodbusTransportFactory>(config.endpoint));
}

void Session::loadTimeZone() {
    if (!session_config.time_zone_register) {
        return;
    }
    TypedValue offset = get(*session_config.time_zone_register);
    const auto* minutes = std::get_if<ScaledNumber>(&offset.value);
    if (minutes == nullptr) {
        throw ConfigError("time_zone_register " + offset.name + " does not hold a number");
    }
    codec_context.utc_offset = std::chrono::minutes(std::lround(minutes->toDouble()));
    std::cout << "Inverter time zone offset: " << codec_context.utc_offset.count() << " min" << std::endl;
}

TypedValue Session::get(const std::string& name, const RequestOptions& options) {
    return getMultiple({name}, options).at(name);
}

std::map<std::string, TypedValue> Session::getMultiple(const std::vector<std::string>& names,
                                                       const RequestOptions& options) {
    std::map<std::string, const RegisterDescriptor*> requested;
    for (const auto& name : names) {
        requested[name] = &table->lookup(name);
    }

    std::map<std::string, TypedValue> values;
    if (requested.empty()) {
        return values;
    }

    ReadPlan plan = planner.plan(requested);
    RegisterSnapshot snapshot = engine.read(unitFor(options), plan, deadlineFor(options));

    for (const auto& entry : requested) {
        const RegisterDescriptor& descriptor = *entry.second;
        std::vector<uint16_t> words = snapshot.slice(descriptor.address, descriptor.length);
        if (words.size() != descriptor.length) {
            throw DecodeError(descriptor.name, "registers missing from the response");
        }
        values.emplace(entry.first, ValueCodec::decode(descriptor, words, codec_context));
    }
    return values;
}

WriteAck Session::set(const std::string& name, const WriteValue& value, const RequestOptions& options) {
    const RegisterDescriptor& descriptor = table->lookup(name);
    std::vector<uint16_t> words = ValueCodec::encode(descriptor, value, codec_context);

    engine.write(unitFor(options), descriptor.name, descriptor.address, words, deadlineFor(options));
    return WriteAck{descriptor.name, descriptor.address, descriptor.length};
}

bool Session::verifyWrite(const std::string& name, const WriteValue& value, const RequestOptions& options) {
    const RegisterDescriptor& descriptor = table->lookup(name);
    std::vector<uint16_t> expected = ValueCodec::encodeUnchecked(descriptor, value, codec_context);

    ReadPlan plan = planner.plan({{descriptor.name, &descriptor}});
    RegisterSnapshot snapshot = engine.read(unitFor(options), plan, deadlineFor(options));
    return snapshot.slice(descriptor.address, descriptor.length) == expected;
}

bool Session::heartbeat() {
    if (!session_config.heartbeat_register) {
        return false;
    }
    return engine.tryWriteOnce(session_config.unit_id, *session_config.heartbeat_register, 0x1);
}

void Session::reconnect() {
    engine.reconnect();
}

void Session::close() {
    engine.close();
}

std::optional<TransactionEngine::Deadline> Session::deadlineFor(const RequestOptions& options) const {
    std::optional<std::chrono::milliseconds> timeout = options.timeout ? options.timeout : session_config.default_timeout;
    if (!timeout) {
        return std::nullopt;
    }
    return TransactionEngine::Clock::now() + *timeout;
}

int Session::unitFor(const RequestOptions& options) const {
    const int unit_id = options.unit_id.value_or(session_config.unit_id);
    if (unit_id < 0 || unit_id > 255) {
        throw ConfigError("unit_id must be between 0 and 255");
    }
    return unit_id;
}
