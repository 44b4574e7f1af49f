#include "detectors/zscore_detector.h"

#include <map>
#include <string>

#include "stats/stat_math.h"

namespace cloudpulse::anomaly {

ZScoreDetector::ZScoreDetector(const OutlierConfig& config) : config_(config) {}

auto ZScoreDetector::Detect(const std::vector<Reading>& readings) const -> AnomalyReport {
    std::map<std::string, std::vector<double>> series;
    for (const auto& r : readings) {
        for (const auto& [name, value] : r.channels) {
            series[name].push_back(value);
        }
    }

    AnomalyReport report;
    for (const auto& [name, values] : series) {
        int flagged = 0;
        if (values.size() >= config_.min_samples) {
            flagged = static_cast<int>(stats::ZScoreOutliers(values, config_.z_score_threshold));
        }
        report.per_channel[name] = flagged;
        report.total += flagged;
    }
    return report;
}

} // namespace cloudpulse::anomaly
