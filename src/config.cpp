#include "config.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cloudpulse {

namespace {

auto EnvString(const char* name, std::string& out) -> void {
    if (const char* value = std::getenv(name)) {
        out = value;
    }
}

template <typename T, typename Parse>
auto EnvNumber(const char* name, T& out, Parse parse) -> void {
    const char* value = std::getenv(name);
    if (!value) return;
    try {
        out = static_cast<T>(parse(std::string(value)));
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring malformed {}='{}' ({}), keeping default", name, value, e.what());
    }
}

auto ParseDouble(const std::string& s) -> double { return std::stod(s); }
auto ParseUnsigned(const std::string& s) -> unsigned long {
    if (!s.empty() && s[0] == '-') {
        throw std::invalid_argument("negative value");
    }
    return std::stoul(s);
}
auto ParseInt(const std::string& s) -> int { return std::stoi(s); }

} // namespace

auto SplitChannelList(const std::string& csv) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first == std::string::npos) continue;
        out.push_back(item.substr(first, last - first + 1));
    }
    return out;
}

auto ValidateEngineConfig(const EngineConfig& config) -> void {
    if (config.channels.empty()) {
        throw std::invalid_argument("At least one channel must be configured");
    }
    static const std::vector<std::string> reserved = {
        "sensor_id", "aggregation_window", "record_count", "data_quality",
        "anomaly_detection", "processed_timestamp", "timestamp", "data_quality_score",
        "total"}; // <channel>_anomalies must not shadow total_anomalies
    for (const auto& channel : config.channels) {
        if (std::find(reserved.begin(), reserved.end(), channel) != reserved.end()) {
            throw std::invalid_argument("Channel name collides with a rollup field: " + channel);
        }
    }
    if (config.outliers.z_score_threshold <= 0.0) {
        throw std::invalid_argument("Z-score threshold must be positive");
    }
    if (config.quality.low_threshold > config.quality.high_threshold) {
        throw std::invalid_argument("Low quality threshold must not exceed high quality threshold");
    }
    if (config.fetch_concurrency == 0) {
        throw std::invalid_argument("Fetch concurrency must be at least 1");
    }
    if (config.partitions.input_prefix.empty() || config.partitions.output_prefix.empty()) {
        throw std::invalid_argument("Partition prefixes must not be empty");
    }
}

auto LoadServiceConfigFromEnv() -> ServiceConfig {
    ServiceConfig config;

    if (const char* channels = std::getenv("CHANNELS")) {
        config.engine.channels = SplitChannelList(channels);
    }
    EnvNumber("ZSCORE_THRESHOLD", config.engine.outliers.z_score_threshold, ParseDouble);
    EnvNumber("HIGH_QUALITY_THRESHOLD", config.engine.quality.high_threshold, ParseDouble);
    EnvNumber("LOW_QUALITY_THRESHOLD", config.engine.quality.low_threshold, ParseDouble);
    EnvNumber("FETCH_CONCURRENCY", config.engine.fetch_concurrency, ParseUnsigned);
    EnvString("INPUT_PREFIX", config.engine.partitions.input_prefix);
    EnvString("OUTPUT_PREFIX", config.engine.partitions.output_prefix);

    EnvString("STORE_BACKEND", config.store.backend);
    EnvString("STORE_ROOT", config.store.root);
    EnvString("DB_CONNECTION_STRING", config.store.db_connection);
    EnvNumber("DB_POOL_SIZE", config.store.db_pool_size, ParseUnsigned);
    long timeout_ms = config.store.db_acquire_timeout.count();
    EnvNumber("DB_ACQUIRE_TIMEOUT_MS", timeout_ms, ParseInt);
    config.store.db_acquire_timeout = std::chrono::milliseconds(timeout_ms);

    EnvString("API_HOST", config.api_host);
    EnvNumber("API_PORT", config.api_port, ParseInt);
    EnvString("LOG_LEVEL", config.log_level);

    if (config.store.backend != "fs" && config.store.backend != "postgres") {
        throw std::invalid_argument("Unknown STORE_BACKEND: " + config.store.backend);
    }
    ValidateEngineConfig(config.engine);
    return config;
}

} // namespace cloudpulse
