#include "stats/stat_math.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

namespace cloudpulse::stats {

auto Mean(const std::vector<double>& values) -> double {
    if (values.empty()) {
        throw EmptyInputError();
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

auto PopulationStdDev(const std::vector<double>& values) -> double {
    if (values.size() < 2) {
        return 0.0;
    }
    // Mean of a constant series may round off the value; report it exactly.
    if (std::adjacent_find(values.begin(), values.end(), std::not_equal_to<>()) == values.end()) {
        return 0.0;
    }
    double mean = Mean(values);
    double sq_sum = 0.0;
    for (double x : values) {
        sq_sum += (x - mean) * (x - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

auto ZScoreOutliers(const std::vector<double>& values, double threshold) -> std::size_t {
    double std_dev = PopulationStdDev(values);
    if (std_dev <= 0.0) {
        return 0;
    }
    double mean = Mean(values);
    double limit = threshold * std_dev;
    std::size_t flagged = 0;
    for (double x : values) {
        if (std::abs(x - mean) > limit) {
            flagged++;
        }
    }
    return flagged;
}

} // namespace cloudpulse::stats
