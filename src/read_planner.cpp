#include "read_planner.hpp"
#include "inverter_errors.hpp"
#include <algorithm>
#include <utility>

size_t ReadPlan::totalRegisters() const {
    size_t total = 0;
    for (const auto& range : ranges) {
        total += range.count;
    }
    return total;
}

ReadPlanner::ReadPlanner(PlannerOptions options) : planner_options(options) {
    if (planner_options.max_registers_per_request == 0) {
        throw ConfigError("max_registers_per_request must be at least 1");
    }
}

ReadPlan ReadPlanner::plan(const std::map<std::string, const RegisterDescriptor*>& requested) const {
    std::vector<std::pair<uint32_t, uint32_t>> spans; // [begin, end)
    spans.reserve(requested.size());
    for (const auto& entry : requested) {
        spans.emplace_back(entry.second->address, entry.second->end());
    }
    std::sort(spans.begin(), spans.end());

    const uint32_t limit = static_cast<uint32_t>(planner_options.max_registers_per_request);
    const uint32_t gap = static_cast<uint32_t>(planner_options.coalesce_gap_threshold);

    // Merge into disjoint intervals; an interval may still exceed the limit
    // when a single descriptor does.
    std::vector<std::pair<uint32_t, uint32_t>> merged;
    for (const auto& span : spans) {
        if (merged.empty()) {
            merged.push_back(span);
            continue;
        }
        auto& current = merged.back();
        if (span.second <= current.second) {
            continue; // already covered
        }
        const bool close_enough = span.first <= current.second + gap;
        const bool fits = std::max(span.second, current.second) - current.first <= limit;
        if (close_enough && fits) {
            current.second = span.second;
        } else {
            merged.emplace_back(std::max(span.first, current.second), span.second);
        }
    }

    ReadPlan result;
    for (const auto& interval : merged) {
        for (uint32_t start = interval.first; start < interval.second; start += limit) {
            uint32_t count = std::min(limit, interval.second - start);
            result.ranges.push_back({static_cast<uint16_t>(start), static_cast<uint16_t>(count)});
        }
    }
    return result;
}

void RegisterSnapshot::append(const ReadRange& range, const std::vector<uint16_t>& words) {
    read_ranges.push_back(range);
    offsets.push_back(raw_words.size());
    raw_words.insert(raw_words.end(), words.begin(), words.end());
}

std::vector<uint16_t> RegisterSnapshot::slice(uint16_t address, uint16_t count) const {
    std::vector<uint16_t> result;
    result.reserve(count);
    const uint32_t end = static_cast<uint32_t>(address) + count;
    for (uint32_t current = address; current < end; ++current) {
        bool found = false;
        for (size_t i = 0; i < read_ranges.size(); ++i) {
            const ReadRange& range = read_ranges[i];
            if (current >= range.start && current < range.end()) {
                size_t index = offsets[i] + (current - range.start);
                if (index >= raw_words.size()) {
                    return {};
                }
                result.push_back(raw_words[index]);
                found = true;
                break;
            }
        }
        if (!found) {
            return {};
        }
    }
    return result;
}
