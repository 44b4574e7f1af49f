#include "aggregation/result_writer.h"

#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "time_resolution.h"

namespace cloudpulse::aggregation {

using json = nlohmann::json;

auto WindowToJson(const TimeWindow& window) -> json {
    return {
        {"start_time", FormatIsoTime(window.start)},
        {"end_time", FormatIsoTime(window.end)}
    };
}

auto AggregateToJson(const DeviceAggregate& agg) -> json {
    json j;
    j["sensor_id"] = agg.device_id;
    j["aggregation_window"] = WindowToJson(agg.window);
    j["record_count"] = agg.record_count;
    for (const auto& [name, stats] : agg.channels) {
        j[name] = {
            {"avg", stats.avg},
            {"min", stats.min},
            {"max", stats.max},
            {"std", stats.std}
        };
    }
    j["data_quality"] = {
        {"avg_score", agg.quality.avg_score},
        {"high_quality_count", agg.quality.high_quality_count},
        {"low_quality_count", agg.quality.low_quality_count}
    };
    json anomalies = json::object();
    for (const auto& [name, count] : agg.anomalies.per_channel) {
        anomalies[name + "_anomalies"] = count;
    }
    anomalies["total_anomalies"] = agg.anomalies.total;
    j["anomaly_detection"] = anomalies;
    j["processed_timestamp"] = FormatIsoTimeMillis(agg.processed_at);
    return j;
}

auto SummaryStatsToJson(const TimeWindow& window, TimePoint processed_at) -> json {
    json processing_window = WindowToJson(window);
    processing_window["duration_hours"] = window.DurationHours();
    return {
        {"processing_window", processing_window},
        {"processed_timestamp", FormatIsoTimeMillis(processed_at)}
    };
}

auto BuildRollupDocument(const std::vector<DeviceAggregate>& aggregates,
                         const TimeWindow& window,
                         TimePoint processed_at) -> json {
    json aggregations = json::array();
    for (const auto& agg : aggregates) {
        aggregations.push_back(AggregateToJson(agg));
    }
    json doc;
    doc["aggregations"] = aggregations;
    doc["summary_stats"] = SummaryStatsToJson(window, processed_at);
    doc["metadata"] = {
        {"total_sensors", aggregates.size()},
        {"processing_timestamp", FormatIsoTimeMillis(processed_at)}
    };
    return doc;
}

ResultWriter::ResultWriter(std::shared_ptr<store::IObjectStore> store, WindowKeyPlanner planner, NowFn now)
    : store_(std::move(store)), planner_(std::move(planner)), now_(std::move(now)) {}

auto ResultWriter::Write(const std::vector<DeviceAggregate>& aggregates, const TimeWindow& window) -> WrittenRollup {
    auto key = planner_.RollupKey(window.end);
    auto processed_at = now_();
    auto body = BuildRollupDocument(aggregates, window, processed_at).dump(2);

    try {
        store_->Put(key, body);
    } catch (const store::StoreError& e) {
        obs::LogEvent(obs::LogLevel::Error, "rollup_write_failed", "writer",
                      {{"key", key}, {"error_code", obs::kErrRollupWriteFailed}, {"error", e.what()}});
        throw PersistenceError(key, e.what());
    }

    obs::LogEvent(obs::LogLevel::Info, "rollup_written", "writer",
                  {{"key", key}, {"bytes", body.size()}, {"aggregation_count", aggregates.size()}});
    return WrittenRollup{key, processed_at};
}

} // namespace cloudpulse::aggregation
