#include "inverter_catalog.hpp"
#include "inverter_errors.hpp"
#include "register_table.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace {

RegisterDescriptor u16(const std::string& name, uint16_t address) {
    return RegisterDescriptor{name, address, 1, UnsignedInt{1}, {1, 1}, ""};
}

RegisterDescriptor u32(const std::string& name, uint16_t address) {
    return RegisterDescriptor{name, address, 2, UnsignedInt{2}, {1, 1}, ""};
}

RegisterDescriptor aliasOf(RegisterDescriptor descriptor, const std::string& target) {
    descriptor.alias_of = target;
    return descriptor;
}

} // namespace

TEST(RegisterTable, LooksUpByName) {
    RegisterTable table({u16("A", 100), u32("B", 101)});
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.lookup("B").address, 101);
    EXPECT_TRUE(table.contains("A"));
    EXPECT_FALSE(table.contains("C"));
    EXPECT_EQ(table.names(), (std::vector<std::string>{"A", "B"}));
}

TEST(RegisterTable, UnknownNameNamesTheRegister) {
    RegisterTable table({u16("A", 100)});
    try {
        table.lookup("missing");
        FAIL() << "lookup of an unknown register succeeded";
    } catch (const UnknownRegister& e) {
        EXPECT_EQ(e.registerName(), "missing");
    }
}

TEST(RegisterTable, RejectsDuplicateNames) {
    EXPECT_THROW(RegisterTable({u16("A", 100), u16("A", 200)}), RegisterTableError);
}

TEST(RegisterTable, RejectsOverlappingRegisters) {
    EXPECT_THROW(RegisterTable({u32("A", 100), u16("B", 101)}), RegisterTableError);
}

TEST(RegisterTable, AllowsAliasesWithinTheirTarget) {
    RegisterTable table({u32("phase_a_current", 32072), aliasOf(u32("grid_current", 32072), "phase_a_current")});
    EXPECT_EQ(table.lookup("grid_current").alias_of, "phase_a_current");

    EXPECT_THROW(RegisterTable({u16("A", 100), aliasOf(u16("B", 100), "C")}), RegisterTableError);
    EXPECT_THROW(RegisterTable({u16("A", 100), aliasOf(u32("B", 100), "A")}), RegisterTableError);
}

TEST(RegisterTable, RejectsDescriptorsPastTheAddressSpace) {
    EXPECT_THROW(RegisterTable({u32("A", 65535)}), RegisterTableError);
    EXPECT_NO_THROW(RegisterTable({u16("A", 65535)}));
}

TEST(RegisterTable, RejectsInconsistentDescriptors) {
    RegisterDescriptor wrong_width{"A", 100, 2, UnsignedInt{1}, {1, 1}, ""};
    EXPECT_THROW(RegisterTable({wrong_width}), RegisterTableError);

    RegisterDescriptor zero_scale{"A", 100, 1, UnsignedInt{1}, {0, 1}, ""};
    EXPECT_THROW(RegisterTable({zero_scale}), RegisterTableError);

    RegisterDescriptor empty{"A", 100, 0, AsciiString{0}, {1, 1}, ""};
    EXPECT_THROW(RegisterTable({empty}), RegisterTableError);

    RegisterDescriptor high_bit{"A", 100, 1, Bitfield{1, {{16, "overflow"}}}, {1, 1}, ""};
    EXPECT_THROW(RegisterTable({high_bit}), RegisterTableError);
}

TEST(RegisterTable, ConcurrentLookups) {
    auto table = huaweiSun2000Registers();
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&table] {
            for (int n = 0; n < 1000; ++n) {
                EXPECT_EQ(table->lookup("active_power").address, 32080);
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
}

TEST(InverterCatalog, DescribesSun2000Registers) {
    auto table = huaweiSun2000Registers();
    EXPECT_EQ(table, huaweiSun2000Registers());
    EXPECT_EQ(table->names().front(), "model_name");

    const auto& power = table->lookup("active_power");
    EXPECT_EQ(power.length, 2);
    EXPECT_EQ(power.unit, "W");
    EXPECT_TRUE(std::holds_alternative<SignedInt>(power.type));

    EXPECT_EQ(table->lookup("grid_voltage").alias_of, "line_voltage_a_b");
    EXPECT_EQ(table->lookup("grid_voltage").scale, (Rational{1, 10}));
    EXPECT_TRUE(table->lookup("system_time").writable);
    EXPECT_TRUE(std::get<Timestamp>(table->lookup("system_time").type).local_time);
    EXPECT_FALSE(table->lookup("pv_24_current").writable);
    EXPECT_TRUE(std::holds_alternative<Enumeration>(table->lookup("device_status").type));
}
