#include "spill/core/JsonTypes.hh"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace spill {

class JsonTypesTest : public ::testing::Test {};

TEST_F(JsonTypesTest, Vector3RoundTrip) {
    Vec3f original(1.0f, 2.0f, 3.0f);
    nlohmann::json j = original;
    auto restored = j.get<Vec3f>();
    EXPECT_FLOAT_EQ(restored.x, 1.0f);
    EXPECT_FLOAT_EQ(restored.y, 2.0f);
    EXPECT_FLOAT_EQ(restored.z, 3.0f);
}

TEST_F(JsonTypesTest, QuaternionRoundTrip) {
    Quatf original(0.1f, 0.2f, 0.3f, 0.9f);
    nlohmann::json j = original;
    auto restored = j.get<Quatf>();
    EXPECT_FLOAT_EQ(restored.x, 0.1f);
    EXPECT_FLOAT_EQ(restored.w, 0.9f);
}

TEST_F(JsonTypesTest, FromJsonMissingField) {
    nlohmann::json j = {{"x", 1.0f}, {"y", 2.0f}};
    Vec3f v;
    EXPECT_THROW(j.get_to(v), nlohmann::json::out_of_range);
}

TEST_F(JsonTypesTest, NumberRangeIsTwoElementArray) {
    nlohmann::json j = NumberRange{10.0f, 15.0f};
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.size(), 2u);

    auto range = nlohmann::json::parse("[0.5, 2]").get<NumberRange>();
    EXPECT_FLOAT_EQ(range.min, 0.5f);
    EXPECT_FLOAT_EQ(range.max, 2.0f);
}

TEST_F(JsonTypesTest, NumberRangeRejectsWrongShape) {
    EXPECT_THROW(nlohmann::json::parse("[1, 2, 3]").get<NumberRange>(), SpillException);
    EXPECT_THROW(nlohmann::json::parse("{\"min\": 1}").get<NumberRange>(), SpillException);
}

TEST_F(JsonTypesTest, KindSerializesByName) {
    nlohmann::json j = DropletKind::Decal;
    EXPECT_EQ(j.get<std::string>(), "Decal");
    EXPECT_EQ(nlohmann::json("Default").get<DropletKind>(), DropletKind::Default);
}

TEST_F(JsonTypesTest, UnknownKindThrows) {
    EXPECT_THROW(nlohmann::json("Puddle").get<DropletKind>(), SpillException);
}

TEST_F(JsonTypesTest, UnknownEasingThrows) {
    nlohmann::json j = {{"easing", "Bounce"}};
    TweenInfo info;
    EXPECT_THROW(from_json(j, info), SpillException);
}

TEST_F(JsonTypesTest, OverridesReadOnlyPresentKeys) {
    auto j = nlohmann::json::parse(R"({
        "kind": "Decal",
        "merge_radius": 0.5,
        "decay_delay": [0, 0],
        "color": {"r": 0.1, "g": 0.2, "b": 0.3}
    })");
    auto o = j.get<DropletOverrides>();

    ASSERT_TRUE(o.kind.has_value());
    EXPECT_EQ(*o.kind, DropletKind::Decal);
    EXPECT_FLOAT_EQ(*o.mergeRadius, 0.5f);
    EXPECT_EQ(*o.decayDelay, (NumberRange{0.0f, 0.0f}));
    EXPECT_EQ(*o.color, (Color{0.1f, 0.2f, 0.3f}));

    EXPECT_FALSE(o.expansion.has_value());
    EXPECT_FALSE(o.dropletVelocity.has_value());
    EXPECT_FALSE(o.sounds.has_value());
    EXPECT_TRUE(o.tweens.empty());
}

TEST_F(JsonTypesTest, EmptyObjectGivesEmptyOverrides) {
    auto o = nlohmann::json::object().get<DropletOverrides>();
    EXPECT_TRUE(o.empty());
}

TEST_F(JsonTypesTest, PartialTweenStartsFromDefaultTiming) {
    auto j = nlohmann::json::parse(R"({"tweens": {"decay": {"duration": 0}}})");
    auto o = j.get<DropletOverrides>();

    ASSERT_EQ(o.tweens.count("decay"), 1u);
    EXPECT_DOUBLE_EQ(o.tweens.at("decay").duration, 0.0);
    EXPECT_EQ(o.tweens.at("decay").easing, defaultTweens().at("decay").easing);
}

TEST_F(JsonTypesTest, OverridesApplyOntoBase) {
    auto o = nlohmann::json::parse(R"({"expansion": false, "tweens": {"landed": {"easing": "Linear"}}})")
                 .get<DropletOverrides>();
    auto config = applyOverrides(DropletConfig{}, o);

    EXPECT_FALSE(config.expansion);
    EXPECT_EQ(config.tween(kTweenLanded).easing, EasingStyle::Linear);
    EXPECT_EQ(config.tween(kTweenDecay), defaultTweens().at(kTweenDecay));
}

TEST_F(JsonTypesTest, ConfigDumpUsesSnakeCaseKeys) {
    nlohmann::json j = DropletConfig{};
    EXPECT_EQ(j["kind"], "Default");
    EXPECT_EQ(j["limit"], 500);
    EXPECT_TRUE(j.contains("decay_delay"));
    EXPECT_TRUE(j.contains("maximum_size"));
    EXPECT_TRUE(j["tweens"].contains("landed"));
    EXPECT_EQ(j["sounds"]["start"][0], "drip_start");
}

TEST_F(JsonTypesTest, ConfigDumpReadsBackAsOverrides) {
    DropletConfig config;
    config.kind = DropletKind::Decal;
    config.mergeRadius = 0.35f;
    nlohmann::json j = config;

    auto restored = applyOverrides(DropletConfig{}, j.get<DropletOverrides>());
    EXPECT_EQ(restored.kind, DropletKind::Decal);
    EXPECT_FLOAT_EQ(restored.mergeRadius, 0.35f);
}

TEST_F(JsonTypesTest, EngineStatsKeys) {
    EngineStats stats;
    stats.inUseObjects = 3;
    stats.merges = 2;
    nlohmann::json j = stats;

    EXPECT_EQ(j["in_use"], 3);
    EXPECT_EQ(j["merges"], 2);
    for (const char* key : {"free", "created", "in_flight", "landed", "registry", "emitted", "dropped", "recycled"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}

} // namespace spill
