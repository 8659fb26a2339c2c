#ifndef REGISTER_TABLE_H
#define REGISTER_TABLE_H

#include "register_types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @class RegisterTable
 * @brief Immutable catalog mapping register names to their descriptors.
 *
 * The table is validated once on construction and never modified afterwards,
 * so concurrent lookups need no synchronization.
 */
class RegisterTable {
public:
    /**
     * @brief Builds and validates the table.
     * @param descriptors All register descriptors of the device.
     * @throw RegisterTableError on duplicate names, descriptors that do not fit
     *        the 16-bit address space, a length that disagrees with the data type,
     *        a zero scale, or two non-alias descriptors sharing a register.
     */
    explicit RegisterTable(std::vector<RegisterDescriptor> descriptors);

    /**
     * @brief Finds the descriptor registered under a name.
     * @param name The logical register name.
     * @return The descriptor; the reference stays valid for the table's lifetime.
     * @throw UnknownRegister if no descriptor has this name.
     */
    const RegisterDescriptor& lookup(const std::string& name) const;

    bool contains(const std::string& name) const;

    /// @brief Register names in declaration order.
    std::vector<std::string> names() const;

    size_t size() const { return ordered_names.size(); }

private:
    void validate() const;

    std::unordered_map<std::string, RegisterDescriptor> descriptors_by_name;
    std::vector<std::string> ordered_names;
};

#endif // REGISTER_TABLE_H
