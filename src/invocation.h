#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "aggregation/aggregation_engine.h"

namespace cloudpulse {

struct InvocationRequest {
    std::optional<std::string> start_time;
    std::optional<std::string> end_time;
    std::string request_id;
};

// Reads optional "start_time"/"end_time" strings from an invocation event.
// Throws std::invalid_argument when a present bound is not a string.
auto ParseInvocationRequest(const nlohmann::json& event) -> InvocationRequest;

auto RunReportToJson(const aggregation::RunReport& report) -> nlohmann::json;

// Resolves the window, runs the engine and renders the outcome. Success:
//   {status: "success", statusCode: 200, processed_window, aggregation_count,
//    summary_stats, rollup_key, run_id, failure_counts}
// Failure:
//   {status: "failure", statusCode: 400|500, error: {code, message}}
auto Invoke(aggregation::AggregationEngine& engine, const InvocationRequest& request) -> nlohmann::json;

} // namespace cloudpulse
