#include <gtest/gtest.h>

#include "../mocks/fake_object_store.h"
#include "../test_helpers.h"
#include "aggregation/aggregation_engine.h"
#include "invocation.h"

namespace cloudpulse {

using testing_helpers::At;
using testing_helpers::ReadingJson;

class AggregationEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeObjectStore> store = std::make_shared<FakeObjectStore>();
    TimePoint fixed_now = At("2024-03-01T14:00:00Z");
    aggregation::AggregationEngine engine{store, EngineConfig{}, [this] { return fixed_now; }};

    const std::string hour13 = "sensor-data/2024/03/01/hour=13/";
    const std::string rollup_key = "aggregated-data/2024/03/01/hour=14/aggregated-20240301-140000.json";

    void SeedReading(const std::string& name, const std::string& body) {
        store->Seed(hour13 + name, body);
    }

    nlohmann::json InvokeDefault() {
        InvocationRequest request;
        request.request_id = "req-test";
        return Invoke(engine, request);
    }
};

TEST_F(AggregationEngineTest, OutlierIsFlaggedEndToEnd) {
    std::vector<double> temps = {20, 21, 20, 21, 20, 95};
    std::vector<double> hums = {40, 42, 41, 40, 42, 41};
    for (size_t i = 0; i < temps.size(); ++i) {
        SeedReading("temp_001-" + std::to_string(i) + ".json", ReadingJson("temp_001", temps[i], hums[i], 0.9));
    }

    auto result = InvokeDefault();

    ASSERT_EQ(result["status"], "success") << result.dump();
    EXPECT_EQ(result["statusCode"], 200);
    EXPECT_EQ(result["aggregation_count"], 1);
    EXPECT_EQ(result["rollup_key"], rollup_key);
    EXPECT_EQ(result["processed_window"]["start_time"], "2024-03-01T13:00:00Z");
    EXPECT_EQ(result["processed_window"]["end_time"], "2024-03-01T14:00:00Z");
    EXPECT_FALSE(result["run_id"].get<std::string>().empty());

    auto doc = nlohmann::json::parse(store->Body(rollup_key));
    const auto& agg = doc["aggregations"][0];
    EXPECT_EQ(agg["sensor_id"], "temp_001");
    EXPECT_EQ(agg["record_count"], 6);
    EXPECT_GT(agg["temperature"]["std"].get<double>(), 20.0);
    EXPECT_DOUBLE_EQ(agg["temperature"]["max"].get<double>(), 95.0);
    EXPECT_EQ(agg["anomaly_detection"]["temperature_anomalies"], 1);
    EXPECT_EQ(agg["anomaly_detection"]["humidity_anomalies"], 0);
    EXPECT_EQ(agg["anomaly_detection"]["total_anomalies"], 1);
    EXPECT_EQ(agg["data_quality"]["high_quality_count"], 6);
}

TEST_F(AggregationEngineTest, EmptyWindowSucceedsWithNoAggregations) {
    auto result = InvokeDefault();

    ASSERT_EQ(result["status"], "success");
    EXPECT_EQ(result["aggregation_count"], 0);
    EXPECT_EQ(result["failure_counts"]["discovered_objects"], 0);
    ASSERT_TRUE(store->Contains(rollup_key));
    auto doc = nlohmann::json::parse(store->Body(rollup_key));
    EXPECT_TRUE(doc["aggregations"].empty());
}

TEST_F(AggregationEngineTest, MalformedObjectIsSkippedAndCounted) {
    for (int i = 0; i < 4; ++i) {
        SeedReading("s1-" + std::to_string(i) + ".json", ReadingJson("s1", 20.0 + i, 40.0));
    }
    SeedReading("s1-bad.json", "{\"sensor_id\": \"s1\", \"temperature\": ");

    auto result = InvokeDefault();

    ASSERT_EQ(result["status"], "success");
    EXPECT_EQ(result["aggregation_count"], 1);
    EXPECT_EQ(result["failure_counts"]["discovered_objects"], 5);
    EXPECT_EQ(result["failure_counts"]["loaded_objects"], 4);
    EXPECT_EQ(result["failure_counts"]["failed_objects"], 1);
    ASSERT_EQ(result["failed_objects"].size(), 1u);
    EXPECT_EQ(result["failed_objects"][0]["key"], hour13 + "s1-bad.json");
    EXPECT_EQ(result["failed_objects"][0]["stage"], "parse");

    auto doc = nlohmann::json::parse(store->Body(rollup_key));
    EXPECT_EQ(doc["aggregations"][0]["record_count"], 4);
}

TEST_F(AggregationEngineTest, MissingChannelIsOmittedFromRollup) {
    SeedReading("a.json", ReadingJson("temp_only", 20.0, std::nullopt));
    SeedReading("b.json", ReadingJson("temp_only", 22.0, std::nullopt));

    auto report = engine.Run(TimeWindow(At("2024-03-01T13:00:00Z"), At("2024-03-01T14:00:00Z")));

    ASSERT_EQ(report.aggregates.size(), 1u);
    const auto& agg = report.aggregates[0];
    EXPECT_EQ(agg.channels.count("temperature"), 1u);
    EXPECT_EQ(agg.channels.count("humidity"), 0u);

    auto doc = nlohmann::json::parse(store->Body(report.rollup_key));
    EXPECT_TRUE(doc["aggregations"][0].contains("temperature"));
    EXPECT_FALSE(doc["aggregations"][0].contains("humidity"));
}

TEST_F(AggregationEngineTest, DevicesAreOrderedAndCountsReconcile) {
    SeedReading("1.json", ReadingJson("zeta", 10.0, 50.0));
    SeedReading("2.json", ReadingJson("alpha", 11.0, 51.0));
    SeedReading("3.json", ReadingJson("mid", 12.0, 52.0));
    SeedReading("4.json", ReadingJson("alpha", 13.0, 53.0));
    SeedReading("5.json", "[]");

    auto report = engine.Run(TimeWindow(At("2024-03-01T13:00:00Z"), At("2024-03-01T14:00:00Z")));

    ASSERT_EQ(report.aggregates.size(), 3u);
    EXPECT_EQ(report.aggregates[0].device_id, "alpha");
    EXPECT_EQ(report.aggregates[1].device_id, "mid");
    EXPECT_EQ(report.aggregates[2].device_id, "zeta");
    EXPECT_EQ(report.aggregates[0].record_count, 2);

    int total = 0;
    for (const auto& agg : report.aggregates) total += agg.record_count;
    EXPECT_EQ(static_cast<size_t>(total), report.loaded_objects);
    EXPECT_EQ(report.loaded_objects + report.failed_objects.size(), report.discovered_objects);
}

TEST_F(AggregationEngineTest, ListingFailureIsPartialNotFatal) {
    SeedReading("a.json", ReadingJson("s1", 20.0, 40.0));
    store->FailListing("sensor-data/2024/03/01/hour=14/");

    auto result = InvokeDefault();

    ASSERT_EQ(result["status"], "success");
    EXPECT_EQ(result["aggregation_count"], 1);
    EXPECT_EQ(result["failure_counts"]["failed_prefixes"], 1);
    EXPECT_EQ(result["failed_prefixes"][0]["prefix"], "sensor-data/2024/03/01/hour=14/");
}

TEST_F(AggregationEngineTest, WriteFailureIsFatal) {
    SeedReading("a.json", ReadingJson("s1", 20.0, 40.0));
    store->FailPuts(true);

    auto result = InvokeDefault();

    EXPECT_EQ(result["status"], "failure");
    EXPECT_EQ(result["statusCode"], 500);
    EXPECT_EQ(result["error"]["code"], "E_ROLLUP_WRITE_FAILED");
}

TEST_F(AggregationEngineTest, InvalidWindowIsRejectedBeforeAnyStoreAccess) {
    InvocationRequest request;
    request.start_time = "2024-03-01T14:00:00Z";
    request.end_time = "2024-03-01T13:00:00Z";

    auto result = Invoke(engine, request);

    EXPECT_EQ(result["status"], "failure");
    EXPECT_EQ(result["statusCode"], 400);
    EXPECT_EQ(result["error"]["code"], "E_INVALID_WINDOW");
    EXPECT_TRUE(store->ListCalls().empty());
    EXPECT_EQ(store->PutCount(), 0);
}

TEST_F(AggregationEngineTest, ExplicitWindowListsEveryTouchedHour) {
    InvocationRequest request;
    request.start_time = "2024-03-01T13:45:00Z";
    request.end_time = "2024-03-01T14:15:00Z";

    auto result = Invoke(engine, request);

    ASSERT_EQ(result["status"], "success");
    auto calls = store->ListCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], hour13);
    EXPECT_EQ(calls[1], "sensor-data/2024/03/01/hour=14/");
    EXPECT_EQ(result["rollup_key"], "aggregated-data/2024/03/01/hour=14/aggregated-20240301-141500.json");
}

TEST_F(AggregationEngineTest, RerunOverwritesSameKey) {
    SeedReading("a.json", ReadingJson("s1", 20.0, 40.0));
    auto first = InvokeDefault();
    auto body = store->Body(rollup_key);
    auto second = InvokeDefault();
    EXPECT_EQ(first["rollup_key"], second["rollup_key"]);
    EXPECT_EQ(store->Body(rollup_key), body);
    EXPECT_NE(first["run_id"], second["run_id"]);
}

TEST(AggregationEngineClockTest, ResponseReportsTheStoredProcessingTime) {
    auto store = std::make_shared<FakeObjectStore>();
    // Every clock read advances one second.
    auto tick = At("2024-03-01T14:00:00Z");
    aggregation::AggregationEngine engine(store, EngineConfig{}, [&tick] {
        tick += std::chrono::seconds(1);
        return tick;
    });
    InvocationRequest request;
    request.start_time = "2024-03-01T13:00:00Z";
    request.end_time = "2024-03-01T14:00:00Z";

    auto result = Invoke(engine, request);

    ASSERT_EQ(result["status"], "success") << result.dump();
    auto doc = nlohmann::json::parse(store->Body(result["rollup_key"].get<std::string>()));
    EXPECT_EQ(result["summary_stats"]["processed_timestamp"], doc["summary_stats"]["processed_timestamp"]);
    EXPECT_EQ(result["summary_stats"]["processed_timestamp"], doc["metadata"]["processing_timestamp"]);
}

TEST(AggregationEngineConfigTest, RejectsInvalidConfig) {
    auto store = std::make_shared<FakeObjectStore>();
    EngineConfig config;
    config.channels.clear();
    EXPECT_THROW({ aggregation::AggregationEngine engine(store, config); }, std::invalid_argument);
}

TEST(InvocationRequestTest, ParsesOptionalBounds) {
    auto empty = ParseInvocationRequest(nlohmann::json::object());
    EXPECT_FALSE(empty.start_time.has_value());
    EXPECT_FALSE(empty.end_time.has_value());

    auto full = ParseInvocationRequest({{"start_time", "2024-03-01T13:00:00Z"}, {"end_time", nullptr}});
    EXPECT_EQ(full.start_time, std::optional<std::string>("2024-03-01T13:00:00Z"));
    EXPECT_FALSE(full.end_time.has_value());

    EXPECT_THROW(ParseInvocationRequest({{"start_time", 12345}}), std::invalid_argument);
    EXPECT_THROW(ParseInvocationRequest(nlohmann::json::array()), std::invalid_argument);
}

} // namespace cloudpulse
