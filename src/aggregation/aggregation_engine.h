#pragma once

#include <memory>
#include <string>
#include <vector>

#include "aggregation/aggregator.h"
#include "aggregation/object_discovery.h"
#include "aggregation/record_loader.h"
#include "aggregation/result_writer.h"
#include "aggregation/window_key_planner.h"
#include "config.h"
#include "store/object_store.h"
#include "types.h"

namespace cloudpulse::aggregation {

struct RunReport {
    std::string run_id;
    TimeWindow window;
    std::vector<DeviceAggregate> aggregates; // ordered by device id
    size_t discovered_objects = 0;
    size_t loaded_objects = 0;
    std::vector<PrefixFailure> failed_prefixes;
    std::vector<LoadFailure> failed_objects;
    std::string rollup_key;
    TimePoint processed_at; // as stored in the rollup document
};

/**
 * @brief Runs plan -> discover -> load -> aggregate -> write for one window.
 *
 * Holds no state between runs, so one engine may serve concurrent callers.
 * Per-object and per-prefix failures are absorbed into the report; a failed
 * rollup write propagates as PersistenceError.
 */
class AggregationEngine {
public:
    AggregationEngine(std::shared_ptr<store::IObjectStore> store, EngineConfig config, NowFn now = Clock::now);

    auto Run(const TimeWindow& window, const std::string& request_id = "") -> RunReport;

    [[nodiscard]] auto Planner() const -> const WindowKeyPlanner& { return planner_; }
    [[nodiscard]] auto Now() const -> TimePoint { return now_(); }

private:
    auto AggregateDevices(const DeviceGroup& groups, const TimeWindow& window) const -> std::vector<DeviceAggregate>;

    std::shared_ptr<store::IObjectStore> store_;
    EngineConfig config_;
    NowFn now_;
    WindowKeyPlanner planner_;
    Aggregator aggregator_;
};

} // namespace cloudpulse::aggregation
