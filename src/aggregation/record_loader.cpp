#include "aggregation/record_loader.h"

#include "contract.h"
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "worker_pool.h"

namespace cloudpulse::aggregation {

RecordLoader::RecordLoader(std::shared_ptr<store::IObjectStore> store,
                           std::vector<std::string> channels,
                           size_t max_concurrency)
    : store_(std::move(store)), channels_(std::move(channels)), max_concurrency_(max_concurrency) {}

auto RecordLoader::LoadOne(const std::string& key) -> Outcome {
    std::string body;
    try {
        body = store_->Get(key);
    } catch (const store::StoreError& e) {
        return Outcome{std::nullopt, LoadFailure{key, LoadStage::Fetch, e.what()}};
    }

    auto parsed = ParseReading(body, channels_);
    if (!parsed.reading.has_value()) {
        return Outcome{std::nullopt, LoadFailure{key, LoadStage::Parse, parsed.error}};
    }
    return Outcome{std::move(parsed.reading), std::nullopt};
}

auto RecordLoader::Load(const std::vector<std::string>& keys) -> LoadResult {
    obs::ScopedTimer timer("record_load", "loader", {{"key_count", keys.size()}});

    // Slot i belongs to keys[i]; workers never touch each other's slots.
    std::vector<Outcome> outcomes(keys.size());
    RunBounded(keys.size(), max_concurrency_, [&](size_t i) {
        outcomes[i] = LoadOne(keys[i]);
    });

    LoadResult result;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        auto& outcome = outcomes[i];
        if (outcome.failure.has_value()) {
            const auto& f = *outcome.failure;
            const char* code = f.stage == LoadStage::Fetch ? obs::kErrStoreGetFailed : obs::kErrRecordParseFailed;
            obs::LogEvent(obs::LogLevel::Warn, "object_skipped", "loader",
                          {{"key", f.key}, {"stage", LoadStageToString(f.stage)},
                           {"error_code", code}, {"error", f.error}});
            obs::EmitCounter("rollup_object_failures_total", 1, "objects", "loader",
                             {{"stage", LoadStageToString(f.stage)}});
            result.failures.push_back(std::move(*outcome.failure));
            continue;
        }
        auto& reading = *outcome.reading;
        result.groups[reading.device_id].push_back(std::move(reading));
        result.loaded++;
    }

    timer.Stop(obs::LogLevel::Info, {{"loaded", result.loaded},
                                     {"failed", result.failures.size()},
                                     {"device_count", result.groups.size()}});
    return result;
}

} // namespace cloudpulse::aggregation
