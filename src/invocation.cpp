#include "invocation.h"

#include <stdexcept>

#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "time_resolution.h"

namespace cloudpulse {

using json = nlohmann::json;

namespace {

auto OptionalString(const json& event, const char* field) -> std::optional<std::string> {
    auto it = event.find(field);
    if (it == event.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string(field) + " must be an ISO-8601 string");
    }
    return it->get<std::string>();
}

auto FailurePayload(int status_code, const char* code, const std::string& message) -> json {
    return {
        {"status", "failure"},
        {"statusCode", status_code},
        {"error", {{"code", code}, {"message", message}}}
    };
}

} // namespace

auto ParseInvocationRequest(const json& event) -> InvocationRequest {
    InvocationRequest request;
    if (event.is_null()) {
        return request;
    }
    if (!event.is_object()) {
        throw std::invalid_argument("invocation event must be a JSON object");
    }
    request.start_time = OptionalString(event, "start_time");
    request.end_time = OptionalString(event, "end_time");
    return request;
}

auto RunReportToJson(const aggregation::RunReport& report) -> json {
    json failed_objects = json::array();
    for (const auto& f : report.failed_objects) {
        failed_objects.push_back({{"key", f.key},
                                  {"stage", aggregation::LoadStageToString(f.stage)},
                                  {"error", f.error}});
    }
    json failed_prefixes = json::array();
    for (const auto& f : report.failed_prefixes) {
        failed_prefixes.push_back({{"prefix", f.prefix}, {"error", f.error}});
    }

    return {
        {"status", "success"},
        {"statusCode", 200},
        {"run_id", report.run_id},
        {"processed_window", aggregation::WindowToJson(report.window)},
        {"aggregation_count", report.aggregates.size()},
        {"summary_stats", aggregation::SummaryStatsToJson(report.window, report.processed_at)},
        {"rollup_key", report.rollup_key},
        {"failure_counts", {
            {"discovered_objects", report.discovered_objects},
            {"loaded_objects", report.loaded_objects},
            {"failed_objects", report.failed_objects.size()},
            {"failed_prefixes", report.failed_prefixes.size()}
        }},
        {"failed_objects", failed_objects},
        {"failed_prefixes", failed_prefixes}
    };
}

auto Invoke(aggregation::AggregationEngine& engine, const InvocationRequest& request) -> json {
    obs::ScopedTimer timer("invocation", "invocation", {{"request_id", request.request_id}});

    std::optional<TimeWindow> window;
    try {
        window = ResolveWindow(request.start_time, request.end_time, engine.Now());
    } catch (const std::invalid_argument& e) {
        obs::EmitCounter("rollup_runs_total", 1, "runs", "invocation", {{"status", "rejected"}});
        timer.Stop(obs::LogLevel::Warn, {{"error_code", obs::kErrInvalidWindow}, {"error", e.what()}});
        return FailurePayload(400, obs::kErrInvalidWindow, e.what());
    }

    try {
        auto report = engine.Run(*window, request.request_id);
        double elapsed = timer.ElapsedMs();
        obs::EmitCounter("rollup_runs_total", 1, "runs", "invocation", {{"status", "success"}});
        obs::EmitHistogram("rollup_run_duration_ms", elapsed, "ms", "invocation");
        auto result = RunReportToJson(report);
        timer.Stop(obs::LogLevel::Info, {{"status", "success"}, {"rollup_key", report.rollup_key},
                                         {"failure_counts", result["failure_counts"]}});
        return result;
    } catch (const aggregation::PersistenceError& e) {
        obs::EmitCounter("rollup_runs_total", 1, "runs", "invocation", {{"status", "failure"}});
        timer.Stop(obs::LogLevel::Error, {{"error_code", obs::kErrRollupWriteFailed}, {"error", e.what()}});
        return FailurePayload(500, obs::kErrRollupWriteFailed, e.what());
    } catch (const std::exception& e) {
        obs::EmitCounter("rollup_runs_total", 1, "runs", "invocation", {{"status", "failure"}});
        timer.Stop(obs::LogLevel::Error, {{"error_code", obs::kErrInternal}, {"error", e.what()}});
        return FailurePayload(500, obs::kErrInternal, e.what());
    }
}

} // namespace cloudpulse
