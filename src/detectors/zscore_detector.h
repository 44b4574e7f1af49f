#pragma once

#include <vector>

#include "config.h"
#include "types.h"

namespace cloudpulse::anomaly {

// Batch z-score outlier counter over one device's readings. Each channel is
// scored independently against the mean/std of that channel's own values.
class ZScoreDetector {
public:
    explicit ZScoreDetector(const OutlierConfig& config);

    auto Detect(const std::vector<Reading>& readings) const -> AnomalyReport;

private:
    OutlierConfig config_;
};

} // namespace cloudpulse::anomaly
