#pragma once

#include <string>
#include <vector>

#include "config.h"
#include "types.h"

namespace cloudpulse::aggregation {

// Maps windows onto the hour-partitioned key layout:
//   <input>/YYYY/MM/DD/hour=HH/...
//   <output>/YYYY/MM/DD/hour=HH/aggregated-YYYYMMDD-HHMMSS.json
class WindowKeyPlanner {
public:
    explicit WindowKeyPlanner(PartitionConfig config = {});

    // One prefix per hour bucket from the bucket of window.start through the
    // bucket of window.end, inclusive, oldest first. Partitions are not
    // trimmed to the exact window, so callers see whole hours.
    [[nodiscard]] auto PartitionPrefixes(const TimeWindow& window) const -> std::vector<std::string>;

    [[nodiscard]] auto PartitionPrefix(TimePoint hour) const -> std::string;

    // Depends only on window_end; reruns for the same end overwrite.
    [[nodiscard]] auto RollupKey(TimePoint window_end) const -> std::string;

private:
    PartitionConfig config_;
};

} // namespace cloudpulse::aggregation
