#include "aggregation/object_discovery.h"

#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace cloudpulse::aggregation {

ObjectDiscovery::ObjectDiscovery(std::shared_ptr<store::IObjectStore> store) : store_(std::move(store)) {}

auto ObjectDiscovery::Discover(const std::vector<std::string>& prefixes) -> DiscoveryResult {
    obs::ScopedTimer timer("object_discovery", "discovery", {{"prefix_count", prefixes.size()}});
    DiscoveryResult result;

    for (const auto& prefix : prefixes) {
        try {
            auto keys = store_->List(prefix);
            obs::LogEvent(obs::LogLevel::Debug, "prefix_listed", "discovery",
                          {{"prefix", prefix}, {"key_count", keys.size()}});
            result.keys.insert(result.keys.end(),
                               std::make_move_iterator(keys.begin()),
                               std::make_move_iterator(keys.end()));
        } catch (const store::StoreError& e) {
            obs::LogEvent(obs::LogLevel::Warn, "prefix_list_failed", "discovery",
                          {{"prefix", prefix}, {"error_code", obs::kErrStoreListFailed}, {"error", e.what()}});
            obs::EmitCounter("rollup_prefix_failures_total", 1, "prefixes", "discovery");
            result.failed_prefixes.push_back({prefix, e.what()});
        }
    }

    obs::EmitCounter("rollup_objects_discovered_total", static_cast<long>(result.keys.size()), "objects", "discovery");
    if (result.keys.empty()) {
        obs::LogEvent(obs::LogLevel::Warn, "no_objects_found", "discovery", {{"prefix_count", prefixes.size()}});
    }
    timer.Stop(obs::LogLevel::Info, {{"key_count", result.keys.size()},
                                     {"failed_prefixes", result.failed_prefixes.size()}});
    return result;
}

} // namespace cloudpulse::aggregation
