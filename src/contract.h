#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace cloudpulse {

// Reading object as written by the ingest validator.
struct ReadingContract {
    static constexpr const char* kDeviceIdField = "sensor_id";
    static constexpr const char* kTimestampField = "timestamp";
    static constexpr const char* kQualityScoreField = "data_quality_score";
};

struct ParseOutcome {
    std::optional<Reading> reading;
    std::string error; // set when reading is empty
};

// Parses one stored object. `channels` names the numeric fields to extract;
// a listed field that is present but not a number rejects the object.
// Missing channels are simply absent from Reading::channels, and unknown
// fields are ignored. Never throws.
auto ParseReading(const std::string& body, const std::vector<std::string>& channels) -> ParseOutcome;

} // namespace cloudpulse
