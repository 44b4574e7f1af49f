#include "contract.h"

#include <nlohmann/json.hpp>

#include "time_resolution.h"

namespace cloudpulse {

namespace {

auto Reject(std::string error) -> ParseOutcome {
    return ParseOutcome{std::nullopt, std::move(error)};
}

} // namespace

auto ParseReading(const std::string& body, const std::vector<std::string>& channels) -> ParseOutcome {
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Reject("malformed JSON");
    }
    if (!j.is_object()) {
        return Reject("record is not a JSON object");
    }

    auto id_it = j.find(ReadingContract::kDeviceIdField);
    if (id_it == j.end()) {
        return Reject(std::string("missing required field: ") + ReadingContract::kDeviceIdField);
    }
    if (!id_it->is_string() || id_it->get_ref<const std::string&>().empty()) {
        return Reject(std::string(ReadingContract::kDeviceIdField) + " must be a non-empty string");
    }

    Reading reading;
    reading.device_id = id_it->get<std::string>();

    for (const auto& channel : channels) {
        auto it = j.find(channel);
        if (it == j.end() || it->is_null()) continue;
        if (!it->is_number()) {
            return Reject("channel '" + channel + "' must be a number");
        }
        reading.channels[channel] = it->get<double>();
    }

    auto score_it = j.find(ReadingContract::kQualityScoreField);
    if (score_it != j.end() && !score_it->is_null()) {
        if (!score_it->is_number()) {
            return Reject(std::string(ReadingContract::kQualityScoreField) + " must be a number");
        }
        reading.quality_score = score_it->get<double>();
    }

    // An unparseable timestamp is tolerated; the ingest side already lowers
    // the quality score for it.
    auto ts_it = j.find(ReadingContract::kTimestampField);
    if (ts_it != j.end() && ts_it->is_string()) {
        reading.timestamp = ParseIsoTime(ts_it->get<std::string>());
    }

    return ParseOutcome{std::move(reading), {}};
}

} // namespace cloudpulse
