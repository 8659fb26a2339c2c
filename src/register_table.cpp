#include "register_table.hpp"
#include "inverter_errors.hpp"
#include <algorithm>

namespace {

// Register count implied by the data type, or 0 when the type accepts any length.
size_t expectedLength(const DataType& type) {
    if (const auto* t = std::get_if<UnsignedInt>(&type)) return t->width;
    if (const auto* t = std::get_if<SignedInt>(&type)) return t->width;
    if (const auto* t = std::get_if<Bitfield>(&type)) return t->width;
    if (const auto* t = std::get_if<Enumeration>(&type)) return t->width;
    if (const auto* t = std::get_if<AsciiString>(&type)) return t->length;
    return 0;
}

size_t maxLength(const DataType& type) {
    if (std::holds_alternative<AsciiString>(type)) return 0xFFFF;
    if (std::holds_alternative<Enumeration>(type)) return 2;
    return 4;
}

} // namespace

RegisterTable::RegisterTable(std::vector<RegisterDescriptor> descriptors) {
    for (auto& descriptor : descriptors) {
        if (descriptor.name.empty()) {
            throw RegisterTableError("Register at address " + std::to_string(descriptor.address) + " has no name");
        }
        std::string name = descriptor.name;
        if (!descriptors_by_name.emplace(name, std::move(descriptor)).second) {
            throw RegisterTableError("Duplicate register name: " + name);
        }
        ordered_names.push_back(name);
    }
    validate();
}

void RegisterTable::validate() const {
    std::vector<const RegisterDescriptor*> by_address;
    by_address.reserve(descriptors_by_name.size());

    for (const auto& name : ordered_names) {
        const RegisterDescriptor& reg = descriptors_by_name.at(name);

        if (reg.length == 0) {
            throw RegisterTableError("Register " + name + " has zero length");
        }
        if (reg.end() > 0x10000) {
            throw RegisterTableError("Register " + name + " extends past address 65535");
        }
        size_t expected = expectedLength(reg.type);
        if (expected != 0 && expected != reg.length) {
            throw RegisterTableError("Register " + name + " has length " + std::to_string(reg.length) +
                                     " but its type needs " + std::to_string(expected));
        }
        if (reg.length > maxLength(reg.type)) {
            throw RegisterTableError("Register " + name + " is too wide for its type");
        }
        if (const auto* bitfield = std::get_if<Bitfield>(&reg.type)) {
            for (const auto& bit : bitfield->bits) {
                if (bit.first >= 16u * reg.length) {
                    throw RegisterTableError("Register " + name + " labels bit " + std::to_string(bit.first) +
                                             " outside its width");
                }
            }
        }
        if (reg.scale.numerator == 0 || reg.scale.denominator == 0) {
            throw RegisterTableError("Register " + name + " has a zero scale");
        }

        if (!reg.alias_of.empty()) {
            auto target = descriptors_by_name.find(reg.alias_of);
            if (target == descriptors_by_name.end()) {
                throw RegisterTableError("Register " + name + " aliases unknown register " + reg.alias_of);
            }
            if (!target->second.alias_of.empty()) {
                throw RegisterTableError("Register " + name + " aliases another alias " + reg.alias_of);
            }
            if (reg.address < target->second.address || reg.end() > target->second.end()) {
                throw RegisterTableError("Alias " + name + " is not contained in " + reg.alias_of);
            }
            // Aliases share their target's registers and take no part in the overlap check
            continue;
        }
        by_address.push_back(&reg);
    }

    std::sort(by_address.begin(), by_address.end(),
              [](const RegisterDescriptor* a, const RegisterDescriptor* b) { return a->address < b->address; });

    for (size_t i = 1; i < by_address.size(); ++i) {
        const RegisterDescriptor* previous = by_address[i - 1];
        const RegisterDescriptor* current = by_address[i];
        if (previous->end() > current->address) {
            throw RegisterTableError("Registers " + previous->name + " and " + current->name +
                                     " overlap at address " + std::to_string(current->address));
        }
    }
}

const RegisterDescriptor& RegisterTable::lookup(const std::string& name) const {
    auto it = descriptors_by_name.find(name);
    if (it == descriptors_by_name.end()) {
        throw UnknownRegister(name);
    }
    return it->second;
}

bool RegisterTable::contains(const std::string& name) const {
    return descriptors_by_name.count(name) != 0;
}

std::vector<std::string> RegisterTable::names() const {
    return ordered_names;
}
