#include "aggregation/aggregator.h"

#include <algorithm>
#include <map>

#include "stats/stat_math.h"

namespace cloudpulse::aggregation {

auto ComputeChannelStats(const std::vector<double>& values) -> ChannelStats {
    ChannelStats stats;
    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    stats.min = *lo;
    stats.max = *hi;
    stats.avg = std::clamp(stats::Mean(values), stats.min, stats.max);
    stats.std = stats::PopulationStdDev(values);
    return stats;
}

Aggregator::Aggregator(const EngineConfig& config, NowFn now)
    : quality_(config.quality), detector_(config.outliers), now_(std::move(now)) {}

auto Aggregator::SummarizeQuality(const std::vector<Reading>& readings) const -> QualitySummary {
    QualitySummary summary;
    if (readings.empty()) return summary;

    std::vector<double> scores;
    scores.reserve(readings.size());
    for (const auto& r : readings) {
        scores.push_back(r.quality_score);
        if (r.quality_score > quality_.high_threshold) summary.high_quality_count++;
        if (r.quality_score < quality_.low_threshold) summary.low_quality_count++;
    }
    summary.avg_score = stats::Mean(scores);
    return summary;
}

auto Aggregator::Aggregate(const std::string& device_id,
                           const std::vector<Reading>& readings,
                           const TimeWindow& window) const -> DeviceAggregate {
    DeviceAggregate agg{device_id, window};
    agg.record_count = static_cast<int>(readings.size());

    std::map<std::string, std::vector<double>> series;
    for (const auto& r : readings) {
        for (const auto& [name, value] : r.channels) {
            series[name].push_back(value);
        }
    }
    for (const auto& [name, values] : series) {
        agg.channels[name] = ComputeChannelStats(values);
    }

    agg.quality = SummarizeQuality(readings);
    agg.anomalies = detector_.Detect(readings);
    agg.processed_at = now_();
    return agg;
}

} // namespace cloudpulse::aggregation
