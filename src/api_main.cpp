#include <cstdlib>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "aggregation/aggregation_engine.h"
#include "api_server.h"
#include "config.h"
#include "store/store_factory.h"

int main() {
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    try {
        auto config = cloudpulse::LoadServiceConfigFromEnv();
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        auto store = cloudpulse::store::MakeObjectStore(config.store);
        auto engine = std::make_shared<cloudpulse::aggregation::AggregationEngine>(store, config.engine);

        cloudpulse::api::ApiServer server(store, engine);
        server.Start(config.api_host, config.api_port);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error in API Server: {}", e.what());
        return 1;
    }
    return 0;
}
