#include "spill/core/FlightRegistry.hh"

#include <gtest/gtest.h>

using namespace spill;

TEST(FlightRegistryTest, ConsumeReturnsSnapshotOnce) {
    FlightRegistry registry;
    DropletConfig config;
    config.mergeRadius = 0.9f;
    registry.registerFlight(7, config);

    EXPECT_TRUE(registry.contains(7));
    auto first = registry.consume(7);
    ASSERT_TRUE(first.has_value());
    EXPECT_FLOAT_EQ(first->mergeRadius, 0.9f);

    EXPECT_FALSE(registry.contains(7));
    EXPECT_FALSE(registry.consume(7).has_value());
}

TEST(FlightRegistryTest, UnknownIdConsumesNothing) {
    FlightRegistry registry;
    EXPECT_FALSE(registry.consume(1).has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(FlightRegistryTest, RegisterReplacesPreviousEntry) {
    FlightRegistry registry;
    DropletConfig first;
    first.kind = DropletKind::Default;
    DropletConfig second;
    second.kind = DropletKind::Decal;

    registry.registerFlight(3, first);
    registry.registerFlight(3, second);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.consume(3)->kind, DropletKind::Decal);
}

TEST(FlightRegistryTest, ClearEmpties) {
    FlightRegistry registry;
    registry.registerFlight(1, DropletConfig{});
    registry.registerFlight(2, DropletConfig{});
    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}
