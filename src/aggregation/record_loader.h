#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "store/object_store.h"
#include "types.h"

namespace cloudpulse::aggregation {

enum class LoadStage {
    Fetch,
    Parse
};

inline const char* LoadStageToString(LoadStage stage) {
    switch (stage) {
        case LoadStage::Fetch:
            return "fetch";
        case LoadStage::Parse:
            return "parse";
    }
    return "fetch";
}

struct LoadFailure {
    std::string key;
    LoadStage stage;
    std::string error;
};

struct LoadResult {
    DeviceGroup groups;
    size_t loaded = 0;
    std::vector<LoadFailure> failures; // in key order
};

class RecordLoader {
public:
    RecordLoader(std::shared_ptr<store::IObjectStore> store,
                 std::vector<std::string> channels,
                 size_t max_concurrency);

    // Fetches and parses every key. Failed keys are reported in
    // LoadResult::failures and skipped. Each device bucket keeps the order of
    // `keys`, independent of which fetch finishes first.
    auto Load(const std::vector<std::string>& keys) -> LoadResult;

private:
    struct Outcome {
        std::optional<Reading> reading;
        std::optional<LoadFailure> failure;
    };

    auto LoadOne(const std::string& key) -> Outcome;

    std::shared_ptr<store::IObjectStore> store_;
    std::vector<std::string> channels_;
    size_t max_concurrency_;
};

} // namespace cloudpulse::aggregation
