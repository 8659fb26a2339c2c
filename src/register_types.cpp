#include "register_types.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

double Rational::toDouble() const {
    return static_cast<double>(numerator) / static_cast<double>(denominator);
}

bool Rational::operator==(const Rational& other) const {
    // Cross multiplication so that 1/10 equals 2/20; 128-bit products cannot overflow
    return static_cast<__int128>(numerator) * other.denominator ==
           static_cast<__int128>(other.numerator) * denominator;
}

double ScaledNumber::toDouble() const {
    return static_cast<double>(raw) * static_cast<double>(scale.numerator) / static_cast<double>(scale.denominator);
}

bool ScaledNumber::operator==(const ScaledNumber& other) const {
    return raw == other.raw && scale == other.scale;
}

bool FlagSet::operator==(const FlagSet& other) const {
    if (unrecognized != other.unrecognized || flags.size() != other.flags.size()) {
        return false;
    }
    std::vector<std::string> lhs = flags;
    std::vector<std::string> rhs = other.flags;
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    return lhs == rhs;
}

bool EnumValue::operator==(const EnumValue& other) const {
    return code == other.code && label == other.label;
}

std::string TypedValue::toString() const {
    std::ostringstream out;
    if (const auto* number = std::get_if<ScaledNumber>(&value)) {
        out << number->toDouble();
    } else if (const auto* flag_set = std::get_if<FlagSet>(&value)) {
        out << "[";
        for (size_t i = 0; i < flag_set->flags.size(); ++i) {
            if (i > 0) out << ", ";
            out << flag_set->flags[i];
        }
        if (flag_set->unrecognized != 0) {
            if (!flag_set->flags.empty()) out << ", ";
            out << "0x" << std::hex << flag_set->unrecognized << std::dec;
        }
        out << "]";
    } else if (const auto* enum_value = std::get_if<EnumValue>(&value)) {
        out << enum_value->label;
    } else if (const auto* text = std::get_if<std::string>(&value)) {
        out << *text;
    } else if (const auto* instant = std::get_if<TimePoint>(&value)) {
        std::time_t seconds = std::chrono::system_clock::to_time_t(*instant);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    }
    if (!unit.empty()) {
        out << " " << unit;
    }
    return out.str();
}
