#include "api_server.h"

#include <map>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "ids.h"
#include "invocation.h"
#include "metrics.h"
#include "obs/error_codes.h"
#include "obs/http_log.h"
#include "time_resolution.h"

namespace cloudpulse::api {

auto GetRequestId(const httplib::Request& req) -> std::string {
    if (req.has_header("X-Request-ID")) {
        return req.get_header_value("X-Request-ID");
    }
    return GenerateUuid();
}

ApiServer::ApiServer(std::shared_ptr<store::IObjectStore> store,
                     std::shared_ptr<aggregation::AggregationEngine> engine)
    : store_(std::move(store)), engine_(std::move(engine)) {
    svr_.set_read_timeout(5, 0);
    svr_.set_write_timeout(30, 0);
    RegisterRoutes(kRequiredRoutes);
}

ApiServer::~ApiServer() {
    Stop();
}

auto ApiServer::HandlerFor(const std::string& handler_name) -> Handler {
    static const std::map<std::string, Handler> handlers = {
        {"RunAggregation", &ApiServer::HandleAggregate},
        {"GetRollup", &ApiServer::HandleGetRollup},
        {"HealthCheck", &ApiServer::HandleHealth},
        {"Metrics", &ApiServer::HandleMetrics}
    };
    auto it = handlers.find(handler_name);
    return it == handlers.end() ? nullptr : it->second;
}

void ApiServer::ValidateRoutes(const std::vector<RouteSpec>& routes) {
    std::vector<std::string> problems;
    for (const auto& route : routes) {
        if (route.method != "GET" && route.method != "POST") {
            problems.push_back("unsupported method " + route.method + " for " + route.pattern);
        }
        if (HandlerFor(route.handler_name) == nullptr) {
            problems.push_back("no handler '" + route.handler_name + "' for " + route.method + " " + route.pattern);
        }
    }
    if (!problems.empty()) {
        std::string message = "Route registry invalid:";
        for (const auto& p : problems) {
            message += " " + p + ";";
        }
        throw std::invalid_argument(message);
    }
}

void ApiServer::RegisterRoutes(const std::vector<RouteSpec>& routes) {
    ValidateRoutes(routes);
    for (const auto& route : routes) {
        Handler handler = HandlerFor(route.handler_name);
        auto bound = [this, handler](const httplib::Request& req, httplib::Response& res) {
            (this->*handler)(req, res);
        };
        if (route.method == "POST") {
            svr_.Post(route.pattern, bound);
        } else {
            svr_.Get(route.pattern, bound);
        }
    }
    spdlog::info("Registered {} routes", routes.size());
}

void ApiServer::Start(const std::string& host, int port) {
    spdlog::info("HTTP API Server listening on {}:{}", host, port);
    if (!svr_.listen(host.c_str(), port)) {
        throw std::runtime_error("Failed to listen on " + host + ":" + std::to_string(port));
    }
}

void ApiServer::Stop() {
    svr_.stop();
}

void ApiServer::HandleAggregate(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);

    InvocationRequest request;
    try {
        nlohmann::json event = nlohmann::json::object();
        if (!req.body.empty()) {
            event = nlohmann::json::parse(req.body);
        }
        request = ParseInvocationRequest(event);
    } catch (const nlohmann::json::parse_error& e) {
        log.RecordError(obs::kErrHttpJsonParseError, e.what(), 400);
        SendError({res, std::string("Invalid JSON body: ") + e.what(), 400, obs::kErrHttpJsonParseError, rid});
        return;
    } catch (const std::invalid_argument& e) {
        log.RecordError(obs::kErrHttpBadRequest, e.what(), 400);
        SendError({res, e.what(), 400, obs::kErrHttpBadRequest, rid});
        return;
    }
    request.request_id = rid;

    auto result = Invoke(*engine_, request);
    int status = result.value("statusCode", 500);
    if (result.value("status", "") != "success") {
        const auto& error = result["error"];
        log.RecordError(error.value("code", obs::kErrInternal), error.value("message", ""), status);
    } else {
        log.AddFields({{"rollup_key", result["rollup_key"]}, {"run_id", result["run_id"]}});
    }
    SendJson(res, result, status, rid);
}

void ApiServer::HandleGetRollup(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);

    if (!req.has_param("end_time")) {
        log.RecordError(obs::kErrHttpMissingField, "end_time is required", 400);
        SendError({res, "Query parameter end_time is required", 400, obs::kErrHttpMissingField, rid});
        return;
    }
    auto end = ParseIsoTime(req.get_param_value("end_time"));
    if (!end.has_value()) {
        log.RecordError(obs::kErrInvalidWindow, "unparseable end_time", 400);
        SendError({res, "end_time must be ISO-8601", 400, obs::kErrInvalidWindow, rid});
        return;
    }

    auto key = engine_->Planner().RollupKey(*end);
    log.AddFields({{"rollup_key", key}});
    try {
        auto body = store_->Get(key);
        res.set_header("X-Request-ID", rid);
        res.set_content(body, "application/json");
        res.status = 200;
    } catch (const store::StoreError& e) {
        if (e.kind() == store::StoreError::Kind::NotFound) {
            log.RecordError(obs::kErrStoreNotFound, e.what(), 404);
            SendError({res, "No rollup stored for window ending " + FormatIsoTime(*end), 404,
                       obs::kErrStoreNotFound, rid});
        } else {
            log.RecordError(obs::kErrStoreGetFailed, e.what(), 502);
            SendError({res, e.what(), 502, obs::kErrStoreGetFailed, rid});
        }
    }
}

void ApiServer::HandleHealth(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    SendJson(res, {{"status", "ok"}}, 200, rid);
}

void ApiServer::HandleMetrics(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(metrics::MetricsRegistry::Instance().ToPrometheus(), "text/plain; version=0.0.4");
    res.status = 200;
}

void ApiServer::SendJson(httplib::Response& res, const nlohmann::json& j, int status, const std::string& request_id) {
    res.status = status;
    if (!request_id.empty()) {
        res.set_header("X-Request-ID", request_id);
    }
    res.set_content(j.dump(), "application/json");
}

void ApiServer::SendError(const ApiErrorArgs& args) {
    metrics::MetricsRegistry::Instance().Increment("http_errors_total",
        {{"status", std::to_string(args.status)}, {"code", args.code}});
    nlohmann::json j;
    j["status"] = "failure";
    j["error"]["message"] = args.message;
    j["error"]["code"] = args.code;
    if (!args.request_id.empty()) {
        j["error"]["request_id"] = args.request_id;
    }
    SendJson(args.res, j, args.status, args.request_id);
}

} // namespace cloudpulse::api
