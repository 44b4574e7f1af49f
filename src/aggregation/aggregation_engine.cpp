#include "aggregation/aggregation_engine.h"

#include <optional>

#include "ids.h"
#include "obs/context.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "time_resolution.h"
#include "worker_pool.h"

namespace cloudpulse::aggregation {

AggregationEngine::AggregationEngine(std::shared_ptr<store::IObjectStore> store, EngineConfig config, NowFn now)
    : store_(std::move(store)),
      config_(std::move(config)),
      now_(std::move(now)),
      planner_(config_.partitions),
      aggregator_(config_, now_) {
    ValidateEngineConfig(config_);
}

auto AggregationEngine::AggregateDevices(const DeviceGroup& groups, const TimeWindow& window) const
    -> std::vector<DeviceAggregate> {
    std::vector<const std::pair<const std::string, std::vector<Reading>>*> entries;
    entries.reserve(groups.size());
    for (const auto& entry : groups) {
        entries.push_back(&entry);
    }

    std::vector<std::optional<DeviceAggregate>> slots(entries.size());
    RunBounded(entries.size(), config_.fetch_concurrency, [&](size_t i) {
        slots[i] = aggregator_.Aggregate(entries[i]->first, entries[i]->second, window);
    });

    std::vector<DeviceAggregate> aggregates;
    aggregates.reserve(slots.size());
    for (auto& slot : slots) {
        aggregates.push_back(std::move(*slot));
    }
    return aggregates;
}

auto AggregationEngine::Run(const TimeWindow& window, const std::string& request_id) -> RunReport {
    obs::Context ctx;
    ctx.request_id = request_id;
    ctx.run_id = GenerateUuid();
    ctx.window_start = FormatIsoTime(window.start);
    ctx.window_end = FormatIsoTime(window.end);
    obs::ScopedContext scope(ctx);
    obs::ScopedTimer timer("rollup_run", "engine");

    obs::LogEvent(obs::LogLevel::Info, "rollup_run_start", "engine",
                  {{"duration_hours", window.DurationHours()}});

    RunReport report{ctx.run_id, window};

    auto prefixes = planner_.PartitionPrefixes(window);
    ObjectDiscovery discovery(store_);
    auto discovered = discovery.Discover(prefixes);
    report.discovered_objects = discovered.keys.size();
    report.failed_prefixes = std::move(discovered.failed_prefixes);

    if (!discovered.keys.empty()) {
        RecordLoader loader(store_, config_.channels, config_.fetch_concurrency);
        auto loaded = loader.Load(discovered.keys);
        report.loaded_objects = loaded.loaded;
        report.failed_objects = std::move(loaded.failures);
        report.aggregates = AggregateDevices(loaded.groups, window);
    }

    long anomalies = 0;
    for (const auto& agg : report.aggregates) {
        anomalies += agg.anomalies.total;
    }
    obs::EmitCounter("rollup_devices_total", static_cast<long>(report.aggregates.size()), "devices", "engine");
    obs::EmitCounter("rollup_anomalies_total", anomalies, "values", "engine");

    ResultWriter writer(store_, planner_, now_);
    auto written = writer.Write(report.aggregates, window);
    report.rollup_key = written.key;
    report.processed_at = written.processed_at;

    size_t failures = report.failed_prefixes.size() + report.failed_objects.size();
    timer.Stop(failures > 0 ? obs::LogLevel::Warn : obs::LogLevel::Info,
               {{"rollup_key", report.rollup_key},
                {"device_count", report.aggregates.size()},
                {"discovered_objects", report.discovered_objects},
                {"loaded_objects", report.loaded_objects},
                {"failed_objects", report.failed_objects.size()},
                {"failed_prefixes", report.failed_prefixes.size()},
                {"anomalies", anomalies}});
    return report;
}

} // namespace cloudpulse::aggregation
