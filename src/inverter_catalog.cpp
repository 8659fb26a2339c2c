#include "inverter_catalog.hpp"
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

const std::map<unsigned, std::string> kState1Bits = {
    {0, "Standby"},
    {1, "Grid-connected"},
    {2, "Grid-connected normally"},
    {3, "Grid connection with derating due to power rationing"},
    {4, "Grid connection with derating due to internal causes of the solar inverter"},
    {5, "Normal stop"},
    {6, "Stop due to faults"},
    {7, "Stop due to power rationing"},
    {8, "Shutdown"},
    {9, "Spot check"},
};

const std::map<unsigned, std::string> kState2Bits = {
    {0, "Locked"},
    {1, "PV connected"},
    {2, "DSP data collection"},
};

const std::map<unsigned, std::string> kState3Bits = {
    {0, "Off-grid"},
    {1, "Off-grid switch enabled"},
};

const std::map<unsigned, std::string> kAlarm1Bits = {
    {0, "High String Input Voltage"},
    {1, "DC Arc Fault"},
    {2, "String Reverse Connection"},
    {3, "String Current Backfeed"},
    {4, "Abnormal String Power"},
    {5, "AFCI Self-Check Fail"},
    {6, "Phase Wire Short-Circuited to PE"},
    {7, "Grid Loss"},
    {8, "Grid Undervoltage"},
    {9, "Grid Overvoltage"},
    {10, "Grid Volt. Imbalance"},
    {11, "Grid Overfrequency"},
    {12, "Grid Underfrequency"},
    {13, "Unstable Grid Frequency"},
    {14, "Output Overcurrent"},
    {15, "Output DC Component Overhigh"},
};

const std::map<unsigned, std::string> kAlarm2Bits = {
    {0, "Abnormal Residual Current"},
    {1, "Abnormal Grounding"},
    {2, "Low Insulation Resistance"},
    {3, "Overtemperature"},
    {4, "Device Fault"},
    {5, "Upgrade Failed or Version Mismatch"},
    {6, "License Expired"},
    {7, "Faulty Monitoring Unit"},
    {8, "Faulty Power Collector"},
    {9, "Battery abnormal"},
    {10, "Active Islanding"},
    {11, "Passive Islanding"},
    {12, "Transient AC Overvoltage"},
    {13, "Peripheral Port Short Circuit"},
    {14, "Churn Output Overload"},
    {15, "Abnormal PV Module Configuration"},
};

const std::map<unsigned, std::string> kAlarm3Bits = {
    {0, "Optimizer Fault"},
    {1, "Built-in PID Operation Abnormal"},
    {2, "High Input String Voltage to Ground"},
    {3, "External Fan Abnormal"},
    {4, "Battery Reverse Connection"},
    {5, "On-grid/Off-grid Controller Abnormal"},
    {6, "PV String Loss"},
    {7, "Internal Fan Abnormal"},
    {8, "DC Protection Unit Abnormal"},
};

const std::map<uint32_t, std::string> kDeviceStatus = {
    {0x0000, "Standby: initializing"},
    {0x0001, "Standby: detecting insulation resistance"},
    {0x0002, "Standby: detecting irradiation"},
    {0x0003, "Standby: grid detecting"},
    {0x0100, "Starting"},
    {0x0200, "On-grid"},
    {0x0201, "Grid connection: power limited"},
    {0x0202, "Grid connection: self-derating"},
    {0x0300, "Shutdown: fault"},
    {0x0301, "Shutdown: command"},
    {0x0302, "Shutdown: OVGR"},
    {0x0303, "Shutdown: communication disconnected"},
    {0x0304, "Shutdown: power limited"},
    {0x0305, "Shutdown: manual startup required"},
    {0x0306, "Shutdown: DC switches disconnected"},
    {0x0307, "Shutdown: rapid cutoff"},
    {0x0308, "Shutdown: input underpower"},
    {0x0401, "Grid scheduling: cosphi-P curve"},
    {0x0402, "Grid scheduling: Q-U curve"},
    {0x0403, "Grid scheduling: PF-U curve"},
    {0x0404, "Grid scheduling: dry contact"},
    {0x0405, "Grid scheduling: Q-P curve"},
    {0x0500, "Spot-check ready"},
    {0x0501, "Spot-checking"},
    {0x0600, "Inspecting"},
    {0x0700, "AFCI self check"},
    {0x0800, "I-V scanning"},
    {0x0900, "DC input detection"},
    {0x0A00, "Running: off-grid charging"},
    {0xA000, "Standby: no irradiation"},
};

const std::map<uint32_t, std::string> kStorageStatus = {
    {0, "Offline"},
    {1, "Standby"},
    {2, "Running"},
    {3, "Fault"},
    {4, "Sleep mode"},
};

const std::map<uint32_t, std::string> kStorageWorkingMode = {
    {0, "Adaptive"},
    {1, "Fixed charge/discharge"},
    {2, "Maximise self consumption"},
    {3, "Time of use (LG)"},
    {4, "Fully fed to grid"},
    {5, "Time of use (LUNA2000)"},
};

const std::map<uint32_t, std::string> kGridCodes = {
    {0, "VDE-AR-N-4105 (Germany)"},
    {1, "NB/T 32004 (China)"},
    {2, "UTE C 15-712-1(A) (France)"},
    {3, "UTE C 15-712-1(B) (France)"},
    {4, "UTE C 15-712-1(C) (France)"},
    {5, "VDE 0126-1-1-BU (Bulgaria)"},
    {6, "VDE 0126-1-1-GR(A) (Greece)"},
    {7, "VDE 0126-1-1-GR(B) (Greece)"},
    {8, "BDEW-MV (Germany)"},
    {9, "G59-England"},
    {10, "G59-Scotland"},
    {11, "G83-England"},
    {12, "G83-Scotland"},
    {13, "CEI0-21 (Italy)"},
    {14, "EN50438-CZ (Czech Republic)"},
    {15, "RD1699/661 (Spain)"},
    {16, "RD1699/661-MV480 (Spain)"},
    {17, "EN50438-NL (Netherlands)"},
    {18, "C10/11 (Belgium)"},
    {19, "AS4777 (Australia)"},
    {20, "IEC61727 (General)"},
};

RegisterDescriptor number(const std::string& name, uint16_t address, bool is_signed, uint16_t width,
                          int64_t gain, const std::string& unit, bool writable = false) {
    DataType type = is_signed ? DataType(SignedInt{width}) : DataType(UnsignedInt{width});
    return RegisterDescriptor{name, address, width, type, Rational{1, gain}, unit, writable};
}

RegisterDescriptor u16(const std::string& name, uint16_t address, int64_t gain = 1, const std::string& unit = "") {
    return number(name, address, false, 1, gain, unit);
}

RegisterDescriptor i16(const std::string& name, uint16_t address, int64_t gain = 1, const std::string& unit = "") {
    return number(name, address, true, 1, gain, unit);
}

RegisterDescriptor u32(const std::string& name, uint16_t address, int64_t gain = 1, const std::string& unit = "") {
    return number(name, address, false, 2, gain, unit);
}

RegisterDescriptor i32(const std::string& name, uint16_t address, int64_t gain = 1, const std::string& unit = "") {
    return number(name, address, true, 2, gain, unit);
}

RegisterDescriptor text(const std::string& name, uint16_t address, uint16_t length) {
    return RegisterDescriptor{name, address, length, AsciiString{length}, Rational{1, 1}, "", false};
}

RegisterDescriptor flags(const std::string& name, uint16_t address, uint16_t width,
                         const std::map<unsigned, std::string>& bits) {
    return RegisterDescriptor{name, address, width, Bitfield{width, bits}, Rational{1, 1}, "", false};
}

RegisterDescriptor choice(const std::string& name, uint16_t address, const std::map<uint32_t, std::string>& mapping,
                          bool writable = false) {
    return RegisterDescriptor{name, address, 1, Enumeration{1, mapping}, Rational{1, 1}, "", writable};
}

// The inverter keeps its clock in local time, seconds since 1970
RegisterDescriptor localTime(const std::string& name, uint16_t address, bool writable = false) {
    Timestamp type;
    type.local_time = true;
    return RegisterDescriptor{name, address, 2, type, Rational{1, 1}, "", writable};
}

RegisterDescriptor writable(RegisterDescriptor descriptor) {
    descriptor.writable = true;
    return descriptor;
}

RegisterDescriptor alias(RegisterDescriptor descriptor, const std::string& target) {
    descriptor.alias_of = target;
    return descriptor;
}

std::vector<RegisterDescriptor> buildDescriptors() {
    std::vector<RegisterDescriptor> registers = {
        text("model_name", 30000, 15),
        text("serial_number", 30015, 10),
        text("product_number", 30025, 10),
        u16("model_id", 30070),
        u16("nb_pv_strings", 30071),
        u16("nb_mpp_tracks", 30072),
        u32("rated_power", 30073, 1, "W"),
        u32("p_max", 30075, 1, "W"),
        u32("s_max", 30077, 1, "VA"),
        i32("q_max_out", 30079, 1, "var"),
        i32("q_max_in", 30081, 1, "var"),

        flags("state_1", 32000, 1, kState1Bits),
        flags("state_2", 32002, 1, kState2Bits),
        flags("state_3", 32003, 2, kState3Bits),
        flags("alarm_1", 32008, 1, kAlarm1Bits),
        flags("alarm_2", 32009, 1, kAlarm2Bits),
        flags("alarm_3", 32010, 1, kAlarm3Bits),
    };

    for (int string_no = 1; string_no <= 24; ++string_no) {
        char prefix[8];
        std::snprintf(prefix, sizeof(prefix), "pv_%02d", string_no);
        const uint16_t address = static_cast<uint16_t>(32016 + 2 * (string_no - 1));
        registers.push_back(i16(std::string(prefix) + "_voltage", address, 10, "V"));
        registers.push_back(i16(std::string(prefix) + "_current", address + 1, 100, "A"));
    }

    std::vector<RegisterDescriptor> grid = {
        i32("input_power", 32064, 1, "W"),
        u16("line_voltage_a_b", 32066, 10, "V"),
        alias(u16("grid_voltage", 32066, 10, "V"), "line_voltage_a_b"),
        u16("line_voltage_b_c", 32067, 10, "V"),
        u16("line_voltage_c_a", 32068, 10, "V"),
        u16("phase_a_voltage", 32069, 10, "V"),
        u16("phase_b_voltage", 32070, 10, "V"),
        u16("phase_c_voltage", 32071, 10, "V"),
        i32("phase_a_current", 32072, 1000, "A"),
        alias(i32("grid_current", 32072, 1000, "A"), "phase_a_current"),
        i32("phase_b_current", 32074, 1000, "A"),
        i32("phase_c_current", 32076, 1000, "A"),
        i32("day_active_power_peak", 32078, 1, "W"),
        i32("active_power", 32080, 1, "W"),
        i32("reactive_power", 32082, 1, "var"),
        i16("power_factor", 32084, 1000),
        u16("grid_frequency", 32085, 100, "Hz"),
        u16("efficiency", 32086, 100, "%"),
        i16("internal_temperature", 32087, 10, "°C"),
        u16("insulation_resistance", 32088, 100, "MOhm"),
        choice("device_status", 32089, kDeviceStatus),
        u16("fault_code", 32090),
        localTime("startup_time", 32091),
        localTime("shutdown_time", 32093),
        u32("accumulated_yield_energy", 32106, 100, "kWh"),
        u32("daily_yield_energy", 32114, 100, "kWh"),

        choice("storage_unit_1_running_status", 37000, kStorageStatus),
        i32("storage_unit_1_charge_discharge_power", 37001, 1, "W"),
        u16("storage_unit_1_bus_voltage", 37003, 10, "V"),
        u16("storage_unit_1_state_of_capacity", 37004, 10, "%"),
        u16("nb_optimizers", 37200),
        u16("nb_online_optimizers", 37201),

        localTime("system_time", 40000, true),
        writable(u16("active_power_fixed_derating", 40120, 10, "kW")),
        writable(i16("reactive_power_compensation_pf", 40122, 1000)),
        writable(i16("reactive_power_compensation_q_s", 40123, 1000)),
        writable(i16("active_power_percentage_derating", 40125, 10, "%")),
        choice("grid_code", 42000, kGridCodes),
        writable(i16("time_zone", 43006, 1, "min")),

        writable(u32("storage_maximum_charging_power", 47075, 1, "W")),
        writable(u32("storage_maximum_discharging_power", 47077, 1, "W")),
        writable(u16("storage_charging_cutoff_capacity", 47081, 10, "%")),
        writable(u16("storage_discharging_cutoff_capacity", 47082, 10, "%")),
        choice("storage_working_mode_settings", 47086, kStorageWorkingMode, true),
    };
    registers.insert(registers.end(), grid.begin(), grid.end());
    return registers;
}

} // namespace

std::shared_ptr<const RegisterTable> huaweiSun2000Registers() {
    static const std::shared_ptr<const RegisterTable> table =
        std::make_shared<const RegisterTable>(buildDescriptors());
    return table;
}
