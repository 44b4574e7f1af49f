#include "route_registry.h"

namespace cloudpulse::api {

const std::vector<RouteSpec> kRequiredRoutes = {
    {"POST", "/aggregate", "RunAggregation"},
    {"GET", "/rollups", "GetRollup"},
    {"GET", "/healthz", "HealthCheck"},
    {"GET", "/metrics", "Metrics"}
};

} // namespace cloudpulse::api
