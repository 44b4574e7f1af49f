#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace cloudpulse::stats {

class EmptyInputError : public std::invalid_argument {
public:
    EmptyInputError() : std::invalid_argument("mean of an empty sequence is undefined") {}
};

// Throws EmptyInputError when values is empty.
auto Mean(const std::vector<double>& values) -> double;

// Population standard deviation (divisor n). 0 for fewer than two values
// and for constant series.
auto PopulationStdDev(const std::vector<double>& values) -> double;

// Number of values with |x - mean| > threshold * std. A zero std flags nothing.
auto ZScoreOutliers(const std::vector<double>& values, double threshold = 2.0) -> std::size_t;

} // namespace cloudpulse::stats
