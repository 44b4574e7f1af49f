#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aggregation/aggregator.h"
#include "aggregation/window_key_planner.h"
#include "store/object_store.h"
#include "types.h"

namespace cloudpulse::aggregation {

// The rollup could not be stored. Fatal for the run.
class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& key, const std::string& reason)
        : std::runtime_error("Failed to store rollup " + key + ": " + reason), key_(key) {}

    [[nodiscard]] auto key() const -> const std::string& { return key_; }

private:
    std::string key_;
};

auto WindowToJson(const TimeWindow& window) -> nlohmann::json;
auto AggregateToJson(const DeviceAggregate& agg) -> nlohmann::json;
auto SummaryStatsToJson(const TimeWindow& window, TimePoint processed_at) -> nlohmann::json;

// {aggregations, summary_stats, metadata}
auto BuildRollupDocument(const std::vector<DeviceAggregate>& aggregates,
                         const TimeWindow& window,
                         TimePoint processed_at) -> nlohmann::json;

struct WrittenRollup {
    std::string key;
    TimePoint processed_at; // the timestamp embedded in the stored document
};

class ResultWriter {
public:
    ResultWriter(std::shared_ptr<store::IObjectStore> store, WindowKeyPlanner planner, NowFn now);

    // Stores the rollup at planner.RollupKey(window.end). Reads the clock once.
    // Throws PersistenceError if the put fails; nothing is retried.
    auto Write(const std::vector<DeviceAggregate>& aggregates, const TimeWindow& window) -> WrittenRollup;

private:
    std::shared_ptr<store::IObjectStore> store_;
    WindowKeyPlanner planner_;
    NowFn now_;
};

} // namespace cloudpulse::aggregation
