#include "aggregation/window_key_planner.h"

#include "time_resolution.h"

namespace cloudpulse::aggregation {

WindowKeyPlanner::WindowKeyPlanner(PartitionConfig config) : config_(std::move(config)) {}

auto WindowKeyPlanner::PartitionPrefix(TimePoint hour) const -> std::string {
    return config_.input_prefix + "/" + FormatUtc(hour, "%Y/%m/%d/hour=%H") + "/";
}

auto WindowKeyPlanner::PartitionPrefixes(const TimeWindow& window) const -> std::vector<std::string> {
    std::vector<std::string> prefixes;
    auto last = FloorToHour(window.end);
    for (auto bucket = FloorToHour(window.start); bucket <= last; bucket += std::chrono::hours(1)) {
        prefixes.push_back(PartitionPrefix(bucket));
    }
    return prefixes;
}

auto WindowKeyPlanner::RollupKey(TimePoint window_end) const -> std::string {
    return config_.output_prefix + "/" + FormatUtc(window_end, "%Y/%m/%d/hour=%H") +
           "/aggregated-" + FormatUtc(window_end, "%Y%m%d-%H%M%S") + ".json";
}

} // namespace cloudpulse::aggregation
