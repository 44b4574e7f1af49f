#pragma once

#include <functional>
#include <string>
#include <vector>

#include "config.h"
#include "detectors/zscore_detector.h"
#include "types.h"

namespace cloudpulse::aggregation {

using NowFn = std::function<TimePoint()>;

/**
 * @brief Builds the per-device summary for one window.
 *
 * Channel statistics cover only the readings that carry the channel; a
 * channel absent from every reading is omitted. Quality and record_count
 * cover all readings.
 */
class Aggregator {
public:
    Aggregator(const EngineConfig& config, NowFn now);

    auto Aggregate(const std::string& device_id,
                   const std::vector<Reading>& readings,
                   const TimeWindow& window) const -> DeviceAggregate;

    auto SummarizeQuality(const std::vector<Reading>& readings) const -> QualitySummary;

private:
    QualityConfig quality_;
    anomaly::ZScoreDetector detector_;
    NowFn now_;
};

// Stats over a non-empty series.
auto ComputeChannelStats(const std::vector<double>& values) -> ChannelStats;

} // namespace cloudpulse::aggregation
