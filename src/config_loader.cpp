#include "config_loader.hpp"
#include "inverter_errors.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace {

// Integer layouts accepted in the "type" field
struct IntegerLayout {
    bool is_signed;
    uint16_t width;
};

bool toIntegerLayout(const std::string& s, IntegerLayout& layout) {
    if (s == "U16") { layout = {false, 1}; return true; }
    if (s == "S16") { layout = {true, 1}; return true; }
    if (s == "U32") { layout = {false, 2}; return true; }
    if (s == "S32") { layout = {true, 2}; return true; }
    if (s == "U64") { layout = {false, 4}; return true; }
    if (s == "S64") { layout = {true, 4}; return true; }
    return false;
}

bool toWritable(const std::string& s) {
    if (s == "RO") return false;
    if (s == "RW" || s == "WO") return true;
    throw ConfigError("Invalid register access type: " + s);
}

WordOrder toWordOrder(const std::string& s) {
    if (s == "high_first") return WordOrder::HighFirst;
    if (s == "low_first") return WordOrder::LowFirst;
    throw ConfigError("Invalid word order: " + s);
}

// Scale implied by a fixed point format, e.g. FIX2 -> 1/100
Rational formatScale(const std::string& format) {
    if (format == "RAW" || format == "FIX0" || format == "Duration") return {1, 1};
    if (format == "FIX1" || format == "TEMP") return {1, 10};
    if (format == "FIX2") return {1, 100};
    if (format == "FIX3") return {1, 1000};
    if (format == "FIX4") return {1, 10000};
    throw ConfigError("Invalid register format: " + format);
}

// Accepts "1/10", "10" or an integer gain
Rational parseScale(const YAML::Node& node) {
    const std::string text = node.as<std::string>();
    Rational scale;
    auto slash = text.find('/');
    try {
        if (slash == std::string::npos) {
            scale = {std::stoll(text), 1};
        } else {
            scale = {std::stoll(text.substr(0, slash)), std::stoll(text.substr(slash + 1))};
        }
    } catch (const std::exception&) {
        throw ConfigError("Invalid scale: " + text);
    }
    if (scale.numerator == 0 || scale.denominator == 0) {
        throw ConfigError("Scale must not be zero: " + text);
    }
    return scale;
}

std::chrono::milliseconds millis(const YAML::Node& node) {
    long long value = node.as<long long>();
    if (value < 0) {
        throw ConfigError("Durations must not be negative");
    }
    return std::chrono::milliseconds(value);
}

Endpoint parseEndpoint(const YAML::Node& connection) {
    if (connection["tcp"] && connection["serial"]) {
        throw ConfigError("connection must define either tcp or serial, not both");
    }
    if (const YAML::Node tcp = connection["tcp"]) {
        TcpEndpoint endpoint;
        endpoint.host = tcp["host"].as<std::string>();
        if (tcp["port"]) endpoint.port = tcp["port"].as<int>();
        return endpoint;
    }
    if (const YAML::Node serial = connection["serial"]) {
        SerialEndpoint endpoint;
        endpoint.device = serial["device"].as<std::string>();
        if (serial["baud"]) endpoint.baud = serial["baud"].as<int>();
        if (serial["parity"]) {
            const std::string parity = serial["parity"].as<std::string>();
            if (parity.size() != 1) {
                throw ConfigError("serial parity must be a single character");
            }
            endpoint.parity = parity[0];
        }
        if (serial["data_bits"]) endpoint.data_bits = serial["data_bits"].as<int>();
        if (serial["stop_bits"]) endpoint.stop_bits = serial["stop_bits"].as<int>();
        return endpoint;
    }
    throw ConfigError("connection must define tcp or serial");
}

RegisterDescriptor parseRegister(const YAML::Node& node) {
    RegisterDescriptor reg{};
    reg.name = node["name"].as<std::string>();
    reg.address = node["address"].as<uint16_t>();
    reg.writable = node["access"] ? toWritable(node["access"].as<std::string>()) : false;
    reg.scale = {1, 1};
    if (node["unit"]) reg.unit = node["unit"].as<std::string>();
    if (node["word_order"]) reg.word_order = toWordOrder(node["word_order"].as<std::string>());
    if (node["alias_of"]) reg.alias_of = node["alias_of"].as<std::string>();

    const std::string type = node["type"].as<std::string>();
    const std::string format = node["format"] ? node["format"].as<std::string>() : "RAW";

    if (type == "STR") {
        if (!node["length"]) {
            throw ConfigError("String register " + reg.name + " needs a length");
        }
        reg.length = node["length"].as<uint16_t>();
        reg.type = AsciiString{reg.length};
        return reg;
    }

    IntegerLayout layout{};
    if (!toIntegerLayout(type, layout)) {
        throw ConfigError("Invalid register type: " + type);
    }
    reg.length = layout.width;

    if (format == "ENUM") {
        Enumeration enumeration{layout.width, {}};
        for (const auto& entry : node["values"]) {
            enumeration.mapping[entry.first.as<uint32_t>()] = entry.second.as<std::string>();
        }
        reg.type = enumeration;
    } else if (format == "BITS") {
        Bitfield bitfield{layout.width, {}};
        for (const auto& entry : node["bits"]) {
            bitfield.bits[entry.first.as<unsigned>()] = entry.second.as<std::string>();
        }
        reg.type = bitfield;
    } else if (format == "DT") {
        if (layout.is_signed) {
            throw ConfigError("Timestamp register " + reg.name + " must be unsigned");
        }
        Timestamp timestamp;
        if (node["epoch_base"]) timestamp.epoch_base = node["epoch_base"].as<int64_t>();
        if (node["resolution_ms"]) timestamp.resolution = millis(node["resolution_ms"]);
        if (node["local_time"]) timestamp.local_time = node["local_time"].as<bool>();
        if (timestamp.resolution.count() == 0) {
            throw ConfigError("Timestamp register " + reg.name + " needs a positive resolution");
        }
        reg.type = timestamp;
    } else {
        reg.scale = formatScale(format);
        if (layout.is_signed) {
            reg.type = SignedInt{layout.width};
        } else {
            reg.type = UnsignedInt{layout.width};
        }
    }

    if (node["gain"]) {
        long long gain = node["gain"].as<long long>();
        if (gain <= 0) {
            throw ConfigError("Register " + reg.name + " needs a positive gain");
        }
        reg.scale = {1, gain};
    }
    if (node["scale"]) {
        reg.scale = parseScale(node["scale"]);
    }
    return reg;
}

LoadedConfig parseRoot(const YAML::Node& root) {
    LoadedConfig config;
    SessionConfig& session = config.session;

    // Load connection settings
    const YAML::Node connection = root["connection"];
    if (!connection) {
        throw ConfigError("Missing connection section");
    }
    session.endpoint = parseEndpoint(connection);
    if (connection["unit_id"]) session.unit_id = connection["unit_id"].as<int>();
    if (connection["connect_timeout_ms"]) session.connect_timeout = millis(connection["connect_timeout_ms"]);
    if (connection["default_timeout_ms"]) session.default_timeout = millis(connection["default_timeout_ms"]);
    if (connection["time_zone_register"]) {
        session.time_zone_register = connection["time_zone_register"].as<std::string>();
    }
    if (connection["heartbeat_register"]) {
        session.heartbeat_register = connection["heartbeat_register"].as<uint16_t>();
    }

    // Load transaction settings
    if (const YAML::Node transaction = root["transaction"]) {
        if (transaction["max_registers_per_request"]) {
            session.max_registers_per_request = transaction["max_registers_per_request"].as<size_t>();
        }
        if (transaction["coalesce_gap_threshold"]) {
            session.coalesce_gap_threshold = transaction["coalesce_gap_threshold"].as<size_t>();
        }
        if (transaction["retry_attempts"]) session.retry_attempts = transaction["retry_attempts"].as<int>();
        if (transaction["retry_base_delay_ms"]) session.retry_base_delay = millis(transaction["retry_base_delay_ms"]);
        if (transaction["retry_max_delay_ms"]) session.retry_max_delay = millis(transaction["retry_max_delay_ms"]);
        if (transaction["cooldown_ms"]) session.cooldown = millis(transaction["cooldown_ms"]);
        if (transaction["atomic_multi_write"]) {
            session.atomic_multi_write = transaction["atomic_multi_write"].as<bool>();
        }
        if (transaction["reconnect_on_demand"]) {
            session.reconnect_on_demand = transaction["reconnect_on_demand"].as<bool>();
        }
    }

    // Load registers
    if (const YAML::Node registers = root["registers"]) {
        for (const auto& node : registers) {
            config.registers.push_back(parseRegister(node));
        }
    }

    ConfigLoader::validate(session);
    return config;
}

} // namespace

LoadedConfig ConfigLoader::loadConfig(const std::string& filename) {
    try {
        return parseRoot(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error loading " + filename + ": " + e.what());
    }
}

LoadedConfig ConfigLoader::parseConfig(const std::string& yaml_text) {
    try {
        return parseRoot(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Error parsing configuration: ") + e.what());
    }
}

void ConfigLoader::validate(const SessionConfig& config) {
    if (config.max_registers_per_request < 1 || config.max_registers_per_request > 125) {
        throw ConfigError("max_registers_per_request must be between 1 and 125");
    }
    if (config.retry_attempts < 1) {
        throw ConfigError("retry_attempts must be at least 1");
    }
    if (config.retry_max_delay < config.retry_base_delay) {
        throw ConfigError("retry_max_delay must not be below retry_base_delay");
    }
    if (config.unit_id < 0 || config.unit_id > 255) {
        throw ConfigError("unit_id must be between 0 and 255");
    }
    if (const auto* tcp = std::get_if<TcpEndpoint>(&config.endpoint)) {
        if (tcp->host.empty()) throw ConfigError("tcp host must not be empty");
        if (tcp->port <= 0 || tcp->port > 65535) throw ConfigError("tcp port out of range");
    } else if (const auto* serial = std::get_if<SerialEndpoint>(&config.endpoint)) {
        if (serial->device.empty()) throw ConfigError("serial device must not be empty");
        if (serial->parity != 'N' && serial->parity != 'E' && serial->parity != 'O') {
            throw ConfigError("serial parity must be N, E or O");
        }
    }
}
