#include "inverter_errors.hpp"
#include "value_codec.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <random>

using std::chrono::hours;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {

RegisterDescriptor number(const std::string& name, bool is_signed, uint16_t width, Rational scale,
                          bool writable = true, WordOrder order = WordOrder::HighFirst) {
    RegisterDescriptor descriptor{name, 100, width, UnsignedInt{width}, scale, "", writable, order};
    if (is_signed) {
        descriptor.type = SignedInt{width};
    }
    return descriptor;
}

ScaledNumber scaled(const TypedValue& value) {
    return std::get<ScaledNumber>(value.value);
}

} // namespace

TEST(ValueCodec, DecodesScaledUnsignedRegister) {
    auto a = number("A", false, 1, {1, 10});
    TypedValue value = ValueCodec::decode(a, {1234});
    EXPECT_EQ(scaled(value).raw, 1234);
    EXPECT_EQ(value.scale, (Rational{1, 10}));
    EXPECT_DOUBLE_EQ(scaled(value).toDouble(), 123.4);
}

TEST(ValueCodec, SignExtendsNegativeValues) {
    EXPECT_EQ(scaled(ValueCodec::decode(number("s16", true, 1, {1, 1}), {0xFFFF})).raw, -1);
    EXPECT_EQ(scaled(ValueCodec::decode(number("s32", true, 2, {1, 1}), {0xFFFF, 0xFFFE})).raw, -2);
    EXPECT_EQ(scaled(ValueCodec::decode(number("s64", true, 4, {1, 1}), {0x8000, 0, 0, 0})).raw,
              std::numeric_limits<int64_t>::min());
}

TEST(ValueCodec, HonoursWordOrder) {
    auto high = number("high", false, 2, {1, 1});
    auto low = number("low", false, 2, {1, 1}, true, WordOrder::LowFirst);
    EXPECT_EQ(scaled(ValueCodec::decode(high, {0x0001, 0x0002})).raw, 0x00010002);
    EXPECT_EQ(scaled(ValueCodec::decode(low, {0x0002, 0x0001})).raw, 0x00010002);
    EXPECT_EQ(ValueCodec::encode(low, 65538.0), (std::vector<uint16_t>{0x0002, 0x0001}));
}

TEST(ValueCodec, RejectsWrongWordCount) {
    auto a = number("A", false, 2, {1, 1});
    EXPECT_THROW(ValueCodec::decode(a, {1}), DecodeError);
    EXPECT_THROW(ValueCodec::decode(a, {1, 2, 3}), DecodeError);
}

TEST(ValueCodec, RejectsUnsigned64BitValueBeyondInt64) {
    auto a = number("counter", false, 4, {1, 1});
    EXPECT_THROW(ValueCodec::decode(a, {0x8000, 0, 0, 0}), DecodeError);
    EXPECT_EQ(scaled(ValueCodec::decode(a, {0x7FFF, 0xFFFF, 0xFFFF, 0xFFFF})).raw,
              std::numeric_limits<int64_t>::max());
}

TEST(ValueCodec, EncodeRoundsHalfAwayFromZero) {
    auto positive = number("p", false, 1, {1, 2});
    auto both = number("b", true, 1, {1, 2});
    EXPECT_EQ(ValueCodec::encode(positive, 1.25), (std::vector<uint16_t>{3}));
    EXPECT_EQ(ValueCodec::encode(positive, 1.2), (std::vector<uint16_t>{2}));
    EXPECT_EQ(ValueCodec::encode(both, -1.25), (std::vector<uint16_t>{static_cast<uint16_t>(-3)}));
}

TEST(ValueCodec, EncodesScaledNumberExactly) {
    auto a = number("A", false, 2, {1, 1000});
    EXPECT_EQ(ValueCodec::encode(a, ScaledNumber{123456, {1, 1000}}), (std::vector<uint16_t>{0x0001, 0xE240}));
    // 1.5 kW expressed with a coarser scale
    EXPECT_EQ(ValueCodec::encode(a, ScaledNumber{15, {1, 10}}), (std::vector<uint16_t>{0, 1500}));
}

TEST(ValueCodec, EncodeRejectsOutOfRangeValues) {
    EXPECT_THROW(ValueCodec::encode(number("u16", false, 1, {1, 1}), 70000.0), EncodeError);
    EXPECT_THROW(ValueCodec::encode(number("u16", false, 1, {1, 1}), -1.0), EncodeError);
    EXPECT_THROW(ValueCodec::encode(number("s16", true, 1, {1, 1}), -40000.0), EncodeError);
    EXPECT_THROW(ValueCodec::encode(number("s16", true, 1, {1, 10}), 3276.8), EncodeError);
    EXPECT_NO_THROW(ValueCodec::encode(number("s16", true, 1, {1, 10}), 3276.7));
}

TEST(ValueCodec, EncodeRejectsWrongKind) {
    auto a = number("A", false, 1, {1, 1});
    EXPECT_THROW(ValueCodec::encode(a, std::string("12")), EncodeError);
    EXPECT_THROW(ValueCodec::encode(a, FlagSet{}), EncodeError);
}

TEST(ValueCodec, ReadOnlyRegisterIsNotWritable) {
    auto a = number("A", false, 1, {1, 1}, false);
    EXPECT_THROW(ValueCodec::encode(a, 1.0), NotWritable);
    EXPECT_THROW(ValueCodec::encode(a, 1.0), EncodeError);
    EXPECT_EQ(ValueCodec::encodeUnchecked(a, 1.0), (std::vector<uint16_t>{1}));
}

TEST(ValueCodec, BitfieldKeepsUnlabelledBits) {
    RegisterDescriptor alarms{"alarms", 10, 1, Bitfield{1, {{0, "standby"}, {2, "grid_connected"}}}, {1, 1}, "", true};

    TypedValue value = ValueCodec::decode(alarms, {0b1011});
    const auto& flags = std::get<FlagSet>(value.value);
    EXPECT_EQ(flags.flags, (std::vector<std::string>{"standby"}));
    EXPECT_EQ(flags.unrecognized, 0b1010u);
    EXPECT_EQ(ValueCodec::encode(alarms, flags), (std::vector<uint16_t>{0b1011}));

    EXPECT_EQ(ValueCodec::encode(alarms, FlagSet{{"grid_connected", "standby"}, 0}), (std::vector<uint16_t>{0b101}));
    EXPECT_THROW(ValueCodec::encode(alarms, FlagSet{{"unknown"}, 0}), EncodeError);
    EXPECT_THROW(ValueCodec::encode(alarms, FlagSet{{}, 1u << 16}), EncodeError);
}

TEST(ValueCodec, FlagSetComparisonIgnoresOrder) {
    EXPECT_EQ((FlagSet{{"a", "b"}, 4}), (FlagSet{{"b", "a"}, 4}));
    EXPECT_FALSE((FlagSet{{"a"}, 0}) == (FlagSet{{"a"}, 4}));
}

TEST(ValueCodec, Enumeration) {
    RegisterDescriptor mode{"mode", 20, 1, Enumeration{1, {{0, "adaptive"}, {2, "max_self_consumption"}}},
                            {1, 1}, "", true};

    EXPECT_EQ(std::get<EnumValue>(ValueCodec::decode(mode, {2}).value), (EnumValue{2, "max_self_consumption"}));
    EXPECT_THROW(ValueCodec::decode(mode, {7}), DecodeError);

    EXPECT_EQ(ValueCodec::encode(mode, std::string("adaptive")), (std::vector<uint16_t>{0}));
    EXPECT_EQ(ValueCodec::encode(mode, EnumValue{2, ""}), (std::vector<uint16_t>{2}));
    EXPECT_EQ(ValueCodec::encode(mode, 2.0), (std::vector<uint16_t>{2}));
    EXPECT_THROW(ValueCodec::encode(mode, std::string("turbo")), EncodeError);
    EXPECT_THROW(ValueCodec::encode(mode, 1.0), EncodeError);
}

TEST(ValueCodec, StringsArePackedHighByteFirst) {
    RegisterDescriptor model{"model", 30000, 4, AsciiString{4}, {1, 1}, "", true};

    EXPECT_EQ(std::get<std::string>(ValueCodec::decode(model, {0x5355, 0x4E32, 0x3030, 0x3000}).value), "SUN2000");
    EXPECT_EQ(ValueCodec::encode(model, std::string("SUN")), (std::vector<uint16_t>{0x5355, 0x4E00, 0, 0}));
    EXPECT_NO_THROW(ValueCodec::encode(model, std::string("12345678")));
    EXPECT_THROW(ValueCodec::encode(model, std::string("123456789")), EncodeError);
}

TEST(ValueCodec, TimestampWithEpochAndResolution) {
    RegisterDescriptor uptime{"uptime", 0, 2, Timestamp{946684800, milliseconds(100), false}, {1, 1}, "", true};

    auto instant = std::get<TimePoint>(ValueCodec::decode(uptime, {0, 25}).value);
    EXPECT_EQ(instant.time_since_epoch(), seconds(946684800) + milliseconds(2500));

    EXPECT_EQ(ValueCodec::encode(uptime, TimePoint(seconds(946684800) + milliseconds(2550))),
              (std::vector<uint16_t>{0, 26}));
    EXPECT_THROW(ValueCodec::encode(uptime, TimePoint(seconds(946684799))), EncodeError);
}

TEST(ValueCodec, LocalTimeTimestampUsesUtcOffset) {
    Timestamp clock;
    clock.local_time = true;
    RegisterDescriptor system_time{"system_time", 40000, 2, clock, {1, 1}, "", true};
    CodecContext context;
    context.utc_offset = minutes(60);

    const uint32_t local = 1700003600;
    std::vector<uint16_t> words{static_cast<uint16_t>(local >> 16), static_cast<uint16_t>(local & 0xFFFF)};
    auto instant = std::get<TimePoint>(ValueCodec::decode(system_time, words, context).value);
    EXPECT_EQ(instant.time_since_epoch(), seconds(1700000000));
    EXPECT_EQ(ValueCodec::encode(system_time, instant, context), words);

    auto utc = std::get<TimePoint>(ValueCodec::decode(system_time, words).value);
    EXPECT_EQ(utc - instant, hours(1));
}

TEST(Rational, ComparesLargeTermsExactly) {
    EXPECT_FALSE((Rational{4000000000, 4000000001}) == (Rational{4000000002, 4000000003}));
    EXPECT_TRUE((Rational{6074001000, 12148002000}) == (Rational{3037000500, 6074001000}));
    EXPECT_TRUE((Rational{1, -2}) == (Rational{-1, 2}));
    EXPECT_TRUE((Rational{1, 10}) != (Rational{1, 100}));
}

TEST(ValueCodec, ScaledNumberWithLargeScaleTermsIsConverted) {
    auto a = number("A", false, 1, {1, 10});
    // 3037000500 / 6074001000 is one half, so the raw value becomes 42 * 0.5 * 10
    EXPECT_EQ(ValueCodec::encode(a, ScaledNumber{42, {3037000500, 6074001000}}), (std::vector<uint16_t>{210}));
}

TEST(ValueCodec, ToStringIncludesUnit) {
    TypedValue voltage{"grid_voltage", "V", {1, 10}, ScaledNumber{2301, {1, 10}}};
    EXPECT_EQ(voltage.toString(), "230.1 V");
    TypedValue status{"device_status", "", {1, 1}, EnumValue{0x200, "On-grid"}};
    EXPECT_EQ(status.toString(), "On-grid");
}

TEST(ValueCodec, RandomValuesSurviveEncodeAndDecode) {
    std::mt19937_64 rng(20240611);

    for (int i = 0; i < 300; ++i) {
        const uint16_t width = static_cast<uint16_t>(1 + rng() % 4);
        const Rational scale{1, static_cast<int64_t>(1 + rng() % 1000)};

        auto u = number("u", false, width, scale);
        const int64_t u_max = width == 4 ? std::numeric_limits<int64_t>::max()
                                         : static_cast<int64_t>((uint64_t{1} << (16 * width)) - 1);
        ScaledNumber u_value{static_cast<int64_t>(rng() % static_cast<uint64_t>(u_max)), scale};
        EXPECT_EQ(scaled(ValueCodec::decode(u, ValueCodec::encode(u, u_value))), u_value);

        auto s = number("s", true, width, scale, true, i % 2 ? WordOrder::LowFirst : WordOrder::HighFirst);
        int64_t s_raw = static_cast<int64_t>(rng());
        if (width < 4) {
            s_raw >>= 64 - 16 * width;
        }
        ScaledNumber s_value{s_raw, scale};
        EXPECT_EQ(scaled(ValueCodec::decode(s, ValueCodec::encode(s, s_value))), s_value);
    }

    RegisterDescriptor bits{"bits", 0, 2, Bitfield{2, {{0, "a"}, {5, "b"}, {17, "c"}, {31, "d"}}}, {1, 1}, "", true};
    RegisterDescriptor text{"text", 0, 6, AsciiString{6}, {1, 1}, "", true};
    RegisterDescriptor stamp{"stamp", 0, 2, Timestamp{}, {1, 1}, "", true};
    for (int i = 0; i < 300; ++i) {
        auto flags = std::get<FlagSet>(ValueCodec::decode(bits, {static_cast<uint16_t>(rng()), static_cast<uint16_t>(rng())}).value);
        EXPECT_EQ(std::get<FlagSet>(ValueCodec::decode(bits, ValueCodec::encode(bits, flags)).value), flags);

        std::string word(rng() % 13, ' ');
        for (auto& c : word) {
            c = static_cast<char>('!' + rng() % 94);
        }
        EXPECT_EQ(std::get<std::string>(ValueCodec::decode(text, ValueCodec::encode(text, word)).value), word);

        TimePoint instant(seconds(static_cast<int64_t>(rng() % 0xFFFFFFFFu)));
        EXPECT_EQ(std::get<TimePoint>(ValueCodec::decode(stamp, ValueCodec::encode(stamp, instant)).value), instant);
    }
}
