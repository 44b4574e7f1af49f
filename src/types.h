#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cloudpulse {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Half-open interval [start, end).
struct TimeWindow {
    TimePoint start;
    TimePoint end;

    TimeWindow(TimePoint s, TimePoint e) : start(s), end(e) {
        if (!(start < end)) {
            throw std::invalid_argument("Invalid window: start must be before end");
        }
    }

    [[nodiscard]] auto DurationHours() const -> double {
        return std::chrono::duration<double, std::ratio<3600>>(end - start).count();
    }
};

struct Reading {
    std::string device_id;
    std::map<std::string, double> channels;
    std::optional<TimePoint> timestamp;
    double quality_score = 0.0;
};

// device_id -> readings in discovery order
using DeviceGroup = std::map<std::string, std::vector<Reading>>;

struct ChannelStats {
    double avg = 0.0;
    double min = 0.0;
    double max = 0.0;
    double std = 0.0;
};

struct QualitySummary {
    double avg_score = 0.0;
    int high_quality_count = 0;
    int low_quality_count = 0;
};

struct AnomalyReport {
    std::map<std::string, int> per_channel;
    int total = 0;
};

struct DeviceAggregate {
    std::string device_id;
    TimeWindow window;
    int record_count = 0;
    std::map<std::string, ChannelStats> channels;
    QualitySummary quality;
    AnomalyReport anomalies;
    TimePoint processed_at;
};

} // namespace cloudpulse
