#ifndef READ_PLANNER_H
#define READ_PLANNER_H

#include "register_types.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/// @brief One contiguous block of registers fetched by a single read request.
struct ReadRange {
    uint16_t start;
    uint16_t count;

    uint32_t end() const { return static_cast<uint32_t>(start) + count; }
    bool operator==(const ReadRange& other) const { return start == other.start && count == other.count; }
};

/**
 * @struct ReadPlan
 * @brief Read requests covering a set of descriptors.
 *
 * Ranges are disjoint, sorted by address and never longer than the
 * registers-per-request limit the plan was built for.
 */
struct ReadPlan {
    std::vector<ReadRange> ranges;

    size_t totalRegisters() const;
};

struct PlannerOptions {
    size_t max_registers_per_request = 125;
    /// Largest number of unrequested registers read to join two descriptors into one request.
    size_t coalesce_gap_threshold = 0;
};

/**
 * @class ReadPlanner
 * @brief Coalesces the registers of requested descriptors into few read requests.
 */
class ReadPlanner {
public:
    /**
     * @throw ConfigError if max_registers_per_request is zero.
     */
    explicit ReadPlanner(PlannerOptions options);

    /**
     * @brief Builds the read plan for the requested descriptors.
     * @param requested Descriptors keyed by register name.
     * @return Sorted, disjoint ranges. A descriptor longer than the request limit
     *         is split over consecutive ranges.
     */
    ReadPlan plan(const std::map<std::string, const RegisterDescriptor*>& requested) const;

    const PlannerOptions& options() const { return planner_options; }

private:
    PlannerOptions planner_options;
};

/**
 * @class RegisterSnapshot
 * @brief Raw words returned for the ranges of one read plan, in request order.
 */
class RegisterSnapshot {
public:
    void append(const ReadRange& range, const std::vector<uint16_t>& words);

    /**
     * @brief Collects the words of @p count registers starting at @p address.
     * @return The words, or an empty vector if any register is not covered.
     */
    std::vector<uint16_t> slice(uint16_t address, uint16_t count) const;

    const std::vector<ReadRange>& ranges() const { return read_ranges; }
    const std::vector<uint16_t>& words() const { return raw_words; }

private:
    std::vector<ReadRange> read_ranges;
    std::vector<size_t> offsets;
    std::vector<uint16_t> raw_words;
};

#endif // READ_PLANNER_H
