#include <gtest/gtest.h>

#include "../test_helpers.h"
#include "aggregation/window_key_planner.h"

namespace cloudpulse {
namespace aggregation {

using testing_helpers::At;

TEST(WindowKeyPlannerTest, WindowInsideOneHourYieldsOnePrefix) {
    WindowKeyPlanner planner;
    auto prefixes = planner.PartitionPrefixes(TimeWindow(At("2024-03-01T13:05:00Z"), At("2024-03-01T13:55:00Z")));
    ASSERT_EQ(prefixes.size(), 1u);
    EXPECT_EQ(prefixes[0], "sensor-data/2024/03/01/hour=13/");
}

TEST(WindowKeyPlannerTest, WindowStraddlingHourYieldsBothBuckets) {
    WindowKeyPlanner planner;
    auto prefixes = planner.PartitionPrefixes(TimeWindow(At("2024-03-01T13:45:00Z"), At("2024-03-01T14:15:00Z")));
    ASSERT_EQ(prefixes.size(), 2u);
    EXPECT_EQ(prefixes[0], "sensor-data/2024/03/01/hour=13/");
    EXPECT_EQ(prefixes[1], "sensor-data/2024/03/01/hour=14/");
}

TEST(WindowKeyPlannerTest, PrefixesCrossDayBoundaryInOrder) {
    WindowKeyPlanner planner;
    auto prefixes = planner.PartitionPrefixes(TimeWindow(At("2024-02-29T22:30:00Z"), At("2024-03-01T00:30:00Z")));
    ASSERT_EQ(prefixes.size(), 3u);
    EXPECT_EQ(prefixes[0], "sensor-data/2024/02/29/hour=22/");
    EXPECT_EQ(prefixes[1], "sensor-data/2024/02/29/hour=23/");
    EXPECT_EQ(prefixes[2], "sensor-data/2024/03/01/hour=00/");
}

TEST(WindowKeyPlannerTest, RollupKeyDependsOnlyOnWindowEnd) {
    WindowKeyPlanner planner;
    EXPECT_EQ(planner.RollupKey(At("2024-03-01T14:00:00Z")),
              "aggregated-data/2024/03/01/hour=14/aggregated-20240301-140000.json");
}

TEST(WindowKeyPlannerTest, UsesConfiguredPrefixes) {
    PartitionConfig config;
    config.input_prefix = "raw";
    config.output_prefix = "rollups";
    WindowKeyPlanner planner(config);
    EXPECT_EQ(planner.PartitionPrefix(At("2024-03-01T09:00:00Z")), "raw/2024/03/01/hour=09/");
    EXPECT_EQ(planner.RollupKey(At("2024-03-01T09:30:15Z")),
              "rollups/2024/03/01/hour=09/aggregated-20240301-093015.json");
}

} // namespace aggregation
} // namespace cloudpulse
