#include <gtest/gtest.h>

#include "../mocks/fake_object_store.h"
#include "../test_helpers.h"
#include "aggregation/result_writer.h"

namespace cloudpulse {
namespace aggregation {

using testing_helpers::At;

class ResultWriterTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeObjectStore> store = std::make_shared<FakeObjectStore>();
    TimePoint fixed_now = At("2024-03-01T14:00:05Z");
    TimeWindow window{At("2024-03-01T13:00:00Z"), At("2024-03-01T14:00:00Z")};

    DeviceAggregate MakeAggregate(const std::string& id) {
        DeviceAggregate agg{id, window};
        agg.record_count = 3;
        agg.channels["temperature"] = ChannelStats{21.0, 20.0, 22.0, 0.8};
        agg.quality = QualitySummary{0.9, 3, 0};
        agg.anomalies.per_channel["temperature"] = 0;
        agg.processed_at = fixed_now;
        return agg;
    }

    ResultWriter MakeWriter() {
        return ResultWriter(store, WindowKeyPlanner{}, [this] { return fixed_now; });
    }
};

TEST_F(ResultWriterTest, WritesRollupAtWindowEndKey) {
    auto writer = MakeWriter();
    auto key = writer.Write({MakeAggregate("s1"), MakeAggregate("s2")}, window).key;

    EXPECT_EQ(key, "aggregated-data/2024/03/01/hour=14/aggregated-20240301-140000.json");
    ASSERT_TRUE(store->Contains(key));

    auto doc = nlohmann::json::parse(store->Body(key));
    ASSERT_EQ(doc["aggregations"].size(), 2u);
    const auto& first = doc["aggregations"][0];
    EXPECT_EQ(first["sensor_id"], "s1");
    EXPECT_EQ(first["aggregation_window"]["start_time"], "2024-03-01T13:00:00Z");
    EXPECT_EQ(first["record_count"], 3);
    EXPECT_DOUBLE_EQ(first["temperature"]["avg"].get<double>(), 21.0);
    EXPECT_EQ(first["data_quality"]["high_quality_count"], 3);
    EXPECT_EQ(first["anomaly_detection"]["temperature_anomalies"], 0);
    EXPECT_EQ(first["anomaly_detection"]["total_anomalies"], 0);
    EXPECT_EQ(first["processed_timestamp"], "2024-03-01T14:00:05.000Z");

    EXPECT_DOUBLE_EQ(doc["summary_stats"]["processing_window"]["duration_hours"].get<double>(), 1.0);
    EXPECT_EQ(doc["metadata"]["total_sensors"], 2);
    EXPECT_EQ(doc["metadata"]["processing_timestamp"], "2024-03-01T14:00:05.000Z");
}

TEST_F(ResultWriterTest, EmptyRollupIsStillWritten) {
    auto writer = MakeWriter();
    auto key = writer.Write({}, window).key;
    auto doc = nlohmann::json::parse(store->Body(key));
    EXPECT_TRUE(doc["aggregations"].is_array());
    EXPECT_TRUE(doc["aggregations"].empty());
    EXPECT_EQ(doc["metadata"]["total_sensors"], 0);
}

TEST_F(ResultWriterTest, RerunWithFixedClockIsByteIdentical) {
    auto writer = MakeWriter();
    auto key = writer.Write({MakeAggregate("s1")}, window).key;
    auto first = store->Body(key);
    writer.Write({MakeAggregate("s1")}, window);
    EXPECT_EQ(store->Body(key), first);
    EXPECT_EQ(store->PutCount(), 2);
}

TEST_F(ResultWriterTest, PutFailureRaisesPersistenceError) {
    store->FailPuts(true);
    auto writer = MakeWriter();
    try {
        writer.Write({MakeAggregate("s1")}, window);
        FAIL() << "expected PersistenceError";
    } catch (const PersistenceError& e) {
        EXPECT_EQ(e.key(), "aggregated-data/2024/03/01/hour=14/aggregated-20240301-140000.json");
        EXPECT_NE(std::string(e.what()).find("simulated put failure"), std::string::npos);
    }
    EXPECT_EQ(store->PutCount(), 1);
}

} // namespace aggregation
} // namespace cloudpulse
