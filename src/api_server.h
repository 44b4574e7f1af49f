#pragma once

#include <memory>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "aggregation/aggregation_engine.h"
#include "route_registry.h"
#include "store/object_store.h"

namespace cloudpulse::api {

// HTTP front for the scheduler: triggers rollup runs and serves stored
// rollups. Each request runs synchronously on the httplib worker thread.
class ApiServer {
public:
    ApiServer(std::shared_ptr<store::IObjectStore> store,
              std::shared_ptr<aggregation::AggregationEngine> engine);
    ~ApiServer();

    // Member handler bound to a RouteSpec::handler_name.
    using Handler = void (ApiServer::*)(const httplib::Request&, httplib::Response&);

    // Throws std::invalid_argument for any route whose handler name is unknown
    // or whose method is neither GET nor POST.
    static void ValidateRoutes(const std::vector<RouteSpec>& routes);

    // nullptr when no handler carries that name.
    static auto HandlerFor(const std::string& handler_name) -> Handler;

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Blocks until Stop() is called. Throws std::runtime_error if the socket
    // cannot be bound.
    void Start(const std::string& host, int port);
    void Stop();
    [[nodiscard]] bool IsRunning() const { return svr_.is_running(); }

private:
    void RegisterRoutes(const std::vector<RouteSpec>& routes);

    void HandleAggregate(const httplib::Request& req, httplib::Response& res);
    void HandleGetRollup(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);
    void HandleMetrics(const httplib::Request& req, httplib::Response& res);

    void SendJson(httplib::Response& res, const nlohmann::json& j, int status, const std::string& request_id);
    struct ApiErrorArgs {
        httplib::Response& res;
        std::string message;
        int status = 400;
        std::string code = "E_INTERNAL";
        std::string request_id = "";
    };
    void SendError(const ApiErrorArgs& args);

    httplib::Server svr_;
    std::shared_ptr<store::IObjectStore> store_;
    std::shared_ptr<aggregation::AggregationEngine> engine_;
};

auto GetRequestId(const httplib::Request& req) -> std::string;

} // namespace cloudpulse::api
