#include <cstring>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "aggregation/aggregation_engine.h"
#include "config.h"
#include "ids.h"
#include "invocation.h"
#include "store/store_factory.h"

namespace {

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--start ISO8601] [--end ISO8601]\n"
              << "Rolls up the window [start, end). Defaults to the hour before now.\n";
}

} // namespace

int main(int argc, char** argv) {
    // Logs go to stderr so stdout carries only the result document.
    auto console = spdlog::stderr_color_mt("console");
    spdlog::set_default_logger(console);

    cloudpulse::InvocationRequest request;
    for (int i = 1; i < argc; ++i) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--start") == 0 && has_value) {
            request.start_time = argv[++i];
        } else if (std::strcmp(argv[i], "--end") == 0 && has_value) {
            request.end_time = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }
    request.request_id = cloudpulse::GenerateUuid();

    try {
        auto config = cloudpulse::LoadServiceConfigFromEnv();
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        auto store = cloudpulse::store::MakeObjectStore(config.store);
        cloudpulse::aggregation::AggregationEngine engine(store, config.engine);

        auto result = cloudpulse::Invoke(engine, request);
        std::cout << result.dump(2) << std::endl;
        return result.value("status", "") == "success" ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Aggregation run could not start: {}", e.what());
        return 1;
    }
}
