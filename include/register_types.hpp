#ifndef REGISTER_TYPES_H
#define REGISTER_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

/**
 * @struct Rational
 * @brief Exact multiplier applied to the raw integer held by a register.
 *
 * A register reporting volts with a gain of 10 has the scale 1/10, so a raw
 * value of 2301 reads as 230.1 V.
 */
struct Rational {
    int64_t numerator = 1;
    int64_t denominator = 1;

    double toDouble() const;
    bool operator==(const Rational& other) const;
    bool operator!=(const Rational& other) const { return !(*this == other); }
};

/// @brief Order in which the registers of a multi-register integer appear on the wire.
enum class WordOrder {
    HighFirst, ///< Most significant register at the lowest address
    LowFirst   ///< Least significant register at the lowest address
};

/// @brief Unsigned integer spread over @c width registers.
struct UnsignedInt {
    size_t width;
};

/// @brief Two's complement integer spread over @c width registers.
struct SignedInt {
    size_t width;
};

/// @brief Set of flags, one label per bit index. Bits without a label are kept as a residual.
struct Bitfield {
    size_t width;
    std::map<unsigned, std::string> bits;
};

/// @brief Integer code translated to a label through a fixed mapping.
struct Enumeration {
    size_t width;
    std::map<uint32_t, std::string> mapping;
};

/// @brief Fixed size string, two characters per register, padded with NUL.
struct AsciiString {
    size_t length;
};

/**
 * @struct Timestamp
 * @brief Unsigned tick counter relative to an epoch.
 *
 * The decoded instant is @c epoch_base seconds after the Unix epoch plus the
 * raw value times @c resolution. Registers flagged @c local_time hold the
 * inverter's wall clock and are shifted by its UTC offset.
 */
struct Timestamp {
    int64_t epoch_base = 0;
    std::chrono::milliseconds resolution{1000};
    bool local_time = false;
};

using DataType = std::variant<UnsignedInt, SignedInt, Bitfield, Enumeration, AsciiString, Timestamp>;

/**
 * @struct RegisterDescriptor
 * @brief Static description of how one or more registers form a typed value.
 *
 * Descriptors are defined once when the register table is built and never
 * change afterwards. A descriptor naming another one in @c alias_of may share
 * its addresses.
 */
struct RegisterDescriptor {
    std::string name;
    uint16_t address;
    uint16_t length;
    DataType type;
    Rational scale;
    std::string unit;
    bool writable = false;
    WordOrder word_order = WordOrder::HighFirst;
    std::string alias_of;

    /// @brief One past the last register covered, computed without 16-bit overflow.
    uint32_t end() const { return static_cast<uint32_t>(address) + length; }
};

/// @brief Integer register content together with the scale that turns it into a quantity.
struct ScaledNumber {
    int64_t raw = 0;
    Rational scale;

    double toDouble() const;
    bool operator==(const ScaledNumber& other) const;
};

/// @brief Decoded bitfield. @c unrecognized holds set bits that have no label.
struct FlagSet {
    std::vector<std::string> flags;
    uint64_t unrecognized = 0;

    bool operator==(const FlagSet& other) const;
};

struct EnumValue {
    uint32_t code = 0;
    std::string label;

    bool operator==(const EnumValue& other) const;
};

using TimePoint = std::chrono::system_clock::time_point;

/// @brief A decoded register value.
using Value = std::variant<ScaledNumber, FlagSet, EnumValue, std::string, TimePoint>;

/**
 * @brief A value supplied for a write.
 *
 * Plain numbers are scaled and rounded by the codec; a ScaledNumber is written
 * exactly.
 */
using WriteValue = std::variant<double, ScaledNumber, FlagSet, EnumValue, std::string, TimePoint>;

/**
 * @struct TypedValue
 * @brief Value decoded from a register together with its display metadata.
 */
struct TypedValue {
    std::string name;
    std::string unit;
    Rational scale;
    Value value;

    /**
     * @brief Renders the value for display, e.g. "230.1 V" or "On-grid".
     */
    std::string toString() const;
};

/**
 * @struct CodecContext
 * @brief Device state the codec needs beyond the descriptor itself.
 */
struct CodecContext {
    std::chrono::minutes utc_offset{0};
};

#endif // REGISTER_TYPES_H
