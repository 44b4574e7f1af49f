#pragma once

#include <limits>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace cloudpulse::metrics {

using Labels = std::map<std::string, std::string>;

class MetricsRegistry {
public:
    static MetricsRegistry& Instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void Increment(const std::string& name, const Labels& labels, long value = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[SerializeKey(name, labels)] += value;
    }

    void SetGauge(const std::string& name, const Labels& labels, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[SerializeKey(name, labels)] = value;
    }

    void RecordLatency(const std::string& name, const Labels& labels, double ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& h = histograms_[SerializeKey(name, labels)];
        h.count++;
        h.sum += ms;
        if (ms < h.min) h.min = ms;
        if (ms > h.max) h.max = ms;
    }

    struct HistogramStats {
        long count = 0;
        double sum = 0.0;
        double min = std::numeric_limits<double>::max();
        double max = 0.0;
    };

    long CounterValue(const std::string& name, const Labels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(SerializeKey(name, labels));
        return it == counters_.end() ? 0 : it->second;
    }

    // Prometheus text exposition format (untyped samples).
    std::string ToPrometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream out;
        for (const auto& kv : counters_) {
            out << kv.first << " " << kv.second << "\n";
        }
        for (const auto& kv : gauges_) {
            out << kv.first << " " << kv.second << "\n";
        }
        for (const auto& kv : histograms_) {
            auto brace = kv.first.find('{');
            std::string base = kv.first.substr(0, brace);
            std::string labels = brace == std::string::npos ? "" : kv.first.substr(brace);
            out << base << "_count" << labels << " " << kv.second.count << "\n";
            out << base << "_sum" << labels << " " << kv.second.sum << "\n";
        }
        return out.str();
    }

private:
    MetricsRegistry() = default;

    static std::string SerializeKey(const std::string& name, const Labels& labels) {
        if (labels.empty()) return name;
        std::string key = name + "{";
        bool first = true;
        for (const auto& lp : labels) {
            if (!first) key += ",";
            key += lp.first + "=\"" + lp.second + "\"";
            first = false;
        }
        key += "}";
        return key;
    }

    std::mutex mutex_;
    std::map<std::string, long> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, HistogramStats> histograms_;
};

} // namespace cloudpulse::metrics
