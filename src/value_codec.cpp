#include "value_codec.hpp"
#include "inverter_errors.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace {

uint64_t assembleWords(const std::vector<uint16_t>& words, WordOrder order) {
    uint64_t value = 0;
    const size_t count = words.size();
    for (size_t i = 0; i < count; ++i) {
        uint16_t word = order == WordOrder::HighFirst ? words[i] : words[count - 1 - i];
        value = (value << 16) | word;
    }
    return value;
}

std::vector<uint16_t> splitWords(uint64_t value, size_t width, WordOrder order) {
    std::vector<uint16_t> words(width);
    for (size_t i = 0; i < width; ++i) {
        uint16_t word = static_cast<uint16_t>((value >> (16 * (width - 1 - i))) & 0xFFFF);
        words[order == WordOrder::HighFirst ? i : width - 1 - i] = word;
    }
    return words;
}

struct RawRange {
    int64_t min;
    int64_t max;
};

RawRange unsignedRange(size_t width) {
    const size_t bits = 16 * width;
    if (bits >= 64) return {0, std::numeric_limits<int64_t>::max()};
    return {0, static_cast<int64_t>((uint64_t{1} << bits) - 1)};
}

RawRange signedRange(size_t width) {
    const size_t bits = 16 * width;
    if (bits >= 64) return {std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max()};
    const int64_t half = int64_t{1} << (bits - 1);
    return {-half, half - 1};
}

int64_t decodeUnsigned(const RegisterDescriptor& descriptor, const std::vector<uint16_t>& words) {
    uint64_t value = assembleWords(words, descriptor.word_order);
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw DecodeError(descriptor.name, "value " + std::to_string(value) + " is not representable");
    }
    return static_cast<int64_t>(value);
}

int64_t decodeSigned(const RegisterDescriptor& descriptor, const std::vector<uint16_t>& words) {
    uint64_t value = assembleWords(words, descriptor.word_order);
    const size_t bits = 16 * words.size();
    if (bits < 64 && (value & (uint64_t{1} << (bits - 1)))) {
        return static_cast<int64_t>(value) - (int64_t{1} << bits);
    }
    return static_cast<int64_t>(value);
}

// Converts a requested quantity into the raw integer, rounding half away from zero.
int64_t toRaw(const RegisterDescriptor& descriptor, const WriteValue& value, RawRange range) {
    const Rational& scale = descriptor.scale;
    long double exact;

    if (const auto* number = std::get_if<ScaledNumber>(&value)) {
        if (number->scale == scale) {
            exact = static_cast<long double>(number->raw);
        } else {
            exact = static_cast<long double>(number->raw) * number->scale.numerator / number->scale.denominator *
                    scale.denominator / scale.numerator;
        }
    } else if (const auto* plain = std::get_if<double>(&value)) {
        exact = static_cast<long double>(*plain) * scale.denominator / scale.numerator;
    } else {
        throw EncodeError(descriptor.name, "expected a number");
    }

    if (!std::isfinite(exact)) {
        throw EncodeError(descriptor.name, "value is not finite");
    }
    long double rounded = std::round(exact);
    if (rounded < static_cast<long double>(range.min) || rounded > static_cast<long double>(range.max)) {
        throw EncodeError(descriptor.name, "value out of range for " + std::to_string(descriptor.length) +
                                               " register(s)");
    }
    return static_cast<int64_t>(rounded);
}

FlagSet decodeBitfield(const Bitfield& type, uint64_t mask) {
    FlagSet result;
    for (const auto& bit : type.bits) {
        uint64_t flag = uint64_t{1} << bit.first;
        if (mask & flag) {
            result.flags.push_back(bit.second);
            mask &= ~flag;
        }
    }
    result.unrecognized = mask;
    return result;
}

uint64_t encodeBitfield(const RegisterDescriptor& descriptor, const Bitfield& type, const WriteValue& value) {
    const auto* flag_set = std::get_if<FlagSet>(&value);
    if (flag_set == nullptr) {
        throw EncodeError(descriptor.name, "expected a set of flags");
    }
    uint64_t mask = flag_set->unrecognized;
    for (const auto& label : flag_set->flags) {
        bool found = false;
        for (const auto& bit : type.bits) {
            if (bit.second == label) {
                mask |= uint64_t{1} << bit.first;
                found = true;
                break;
            }
        }
        if (!found) {
            throw EncodeError(descriptor.name, "unknown flag '" + label + "'");
        }
    }
    const size_t bits = 16 * descriptor.length;
    if (bits < 64 && (mask >> bits) != 0) {
        throw EncodeError(descriptor.name, "flags do not fit in " + std::to_string(descriptor.length) +
                                               " register(s)");
    }
    return mask;
}

uint32_t encodeEnumeration(const RegisterDescriptor& descriptor, const Enumeration& type, const WriteValue& value) {
    auto codeForLabel = [&](const std::string& label) -> uint32_t {
        for (const auto& entry : type.mapping) {
            if (entry.second == label) return entry.first;
        }
        throw EncodeError(descriptor.name, "unknown label '" + label + "'");
    };

    if (const auto* enum_value = std::get_if<EnumValue>(&value)) {
        if (!enum_value->label.empty()) {
            return codeForLabel(enum_value->label);
        }
        if (type.mapping.count(enum_value->code) == 0) {
            throw EncodeError(descriptor.name, "unknown code " + std::to_string(enum_value->code));
        }
        return enum_value->code;
    }
    if (const auto* label = std::get_if<std::string>(&value)) {
        return codeForLabel(*label);
    }
    if (const auto* plain = std::get_if<double>(&value)) {
        if (*plain < 0 || *plain != std::floor(*plain) || *plain > std::numeric_limits<uint32_t>::max() ||
            type.mapping.count(static_cast<uint32_t>(*plain)) == 0) {
            throw EncodeError(descriptor.name, "unknown code " + std::to_string(*plain));
        }
        return static_cast<uint32_t>(*plain);
    }
    throw EncodeError(descriptor.name, "expected an enumeration label or code");
}

std::string decodeString(const std::vector<uint16_t>& words) {
    std::string text;
    text.reserve(words.size() * 2);
    for (uint16_t word : words) {
        text.push_back(static_cast<char>(word >> 8));
        text.push_back(static_cast<char>(word & 0xFF));
    }
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

std::vector<uint16_t> encodeString(const RegisterDescriptor& descriptor, const WriteValue& value) {
    const auto* input = std::get_if<std::string>(&value);
    if (input == nullptr) {
        throw EncodeError(descriptor.name, "expected a string");
    }
    std::string text = *input;
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    const size_t capacity = static_cast<size_t>(descriptor.length) * 2;
    if (text.size() > capacity) {
        throw EncodeError(descriptor.name, "string of " + std::to_string(text.size()) +
                                               " bytes does not fit in " + std::to_string(capacity));
    }
    text.resize(capacity, '\0');

    std::vector<uint16_t> words(descriptor.length);
    for (size_t i = 0; i < words.size(); ++i) {
        words[i] = static_cast<uint16_t>((static_cast<uint8_t>(text[2 * i]) << 8) |
                                         static_cast<uint8_t>(text[2 * i + 1]));
    }
    return words;
}

int64_t offsetMillis(const Timestamp& type, const CodecContext& context) {
    int64_t offset = type.epoch_base * 1000;
    if (type.local_time) {
        offset -= std::chrono::duration_cast<std::chrono::milliseconds>(context.utc_offset).count();
    }
    return offset;
}

TimePoint decodeTimestamp(const RegisterDescriptor& descriptor, const Timestamp& type,
                          const std::vector<uint16_t>& words, const CodecContext& context) {
    const int64_t ticks = decodeUnsigned(descriptor, words);
    const int64_t resolution = type.resolution.count();
    const int64_t limit = std::chrono::duration_cast<std::chrono::milliseconds>(
                              TimePoint::max().time_since_epoch()).count() / 2;
    if (resolution <= 0 || ticks > limit / resolution) {
        throw DecodeError(descriptor.name, "timestamp " + std::to_string(ticks) + " out of range");
    }
    const std::chrono::milliseconds since_epoch(ticks * resolution + offsetMillis(type, context));
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

uint64_t encodeTimestamp(const RegisterDescriptor& descriptor, const Timestamp& type,
                         const WriteValue& value, const CodecContext& context) {
    const auto* instant = std::get_if<TimePoint>(&value);
    if (instant == nullptr) {
        throw EncodeError(descriptor.name, "expected a point in time");
    }
    const int64_t resolution = type.resolution.count();
    if (resolution <= 0) {
        throw EncodeError(descriptor.name, "timestamp resolution must be positive");
    }
    const int64_t millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(instant->time_since_epoch()).count() -
        offsetMillis(type, context);
    if (millis < 0) {
        throw EncodeError(descriptor.name, "point in time precedes the register's epoch");
    }
    int64_t ticks = millis / resolution;
    if (2 * (millis % resolution) >= resolution) {
        ++ticks;
    }
    if (ticks > unsignedRange(descriptor.length).max) {
        throw EncodeError(descriptor.name, "point in time out of range");
    }
    return static_cast<uint64_t>(ticks);
}

} // namespace

TypedValue ValueCodec::decode(const RegisterDescriptor& descriptor, const std::vector<uint16_t>& words,
                              const CodecContext& context) {
    if (words.size() != descriptor.length) {
        throw DecodeError(descriptor.name, "expected " + std::to_string(descriptor.length) +
                                               " register(s), got " + std::to_string(words.size()));
    }

    TypedValue result{descriptor.name, descriptor.unit, descriptor.scale, Value{}};

    if (std::holds_alternative<UnsignedInt>(descriptor.type)) {
        result.value = ScaledNumber{decodeUnsigned(descriptor, words), descriptor.scale};
    } else if (std::holds_alternative<SignedInt>(descriptor.type)) {
        result.value = ScaledNumber{decodeSigned(descriptor, words), descriptor.scale};
    } else if (const auto* bitfield = std::get_if<Bitfield>(&descriptor.type)) {
        result.value = decodeBitfield(*bitfield, assembleWords(words, descriptor.word_order));
    } else if (const auto* enumeration = std::get_if<Enumeration>(&descriptor.type)) {
        uint32_t code = static_cast<uint32_t>(assembleWords(words, descriptor.word_order));
        auto it = enumeration->mapping.find(code);
        if (it == enumeration->mapping.end()) {
            throw DecodeError(descriptor.name, "unknown code " + std::to_string(code));
        }
        result.value = EnumValue{code, it->second};
    } else if (std::holds_alternative<AsciiString>(descriptor.type)) {
        result.value = decodeString(words);
    } else if (const auto* timestamp = std::get_if<Timestamp>(&descriptor.type)) {
        result.value = decodeTimestamp(descriptor, *timestamp, words, context);
    }
    return result;
}

std::vector<uint16_t> ValueCodec::encode(const RegisterDescriptor& descriptor, const WriteValue& value,
                                         const CodecContext& context) {
    if (!descriptor.writable) {
        throw NotWritable(descriptor.name);
    }
    return encodeUnchecked(descriptor, value, context);
}

std::vector<uint16_t> ValueCodec::encodeUnchecked(const RegisterDescriptor& descriptor, const WriteValue& value,
                                                  const CodecContext& context) {
    const size_t width = descriptor.length;

    if (std::holds_alternative<UnsignedInt>(descriptor.type)) {
        int64_t raw = toRaw(descriptor, value, unsignedRange(width));
        return splitWords(static_cast<uint64_t>(raw), width, descriptor.word_order);
    }
    if (std::holds_alternative<SignedInt>(descriptor.type)) {
        int64_t raw = toRaw(descriptor, value, signedRange(width));
        return splitWords(static_cast<uint64_t>(raw), width, descriptor.word_order);
    }
    if (const auto* bitfield = std::get_if<Bitfield>(&descriptor.type)) {
        return splitWords(encodeBitfield(descriptor, *bitfield, value), width, descriptor.word_order);
    }
    if (const auto* enumeration = std::get_if<Enumeration>(&descriptor.type)) {
        uint32_t code = encodeEnumeration(descriptor, *enumeration, value);
        if (width == 1 && code > 0xFFFF) {
            throw EncodeError(descriptor.name, "code " + std::to_string(code) + " does not fit in one register");
        }
        return splitWords(code, width, descriptor.word_order);
    }
    if (std::holds_alternative<AsciiString>(descriptor.type)) {
        return encodeString(descriptor, value);
    }
    const auto& timestamp = std::get<Timestamp>(descriptor.type);
    return splitWords(encodeTimestamp(descriptor, timestamp, value, context), width, descriptor.word_order);
}
