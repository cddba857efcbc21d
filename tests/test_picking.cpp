#include <gtest/gtest.h>
#include "picking/Picking.hpp"

using namespace neta;

// =============================================================================
// Hit shapes
// =============================================================================

TEST(SpriteContainsTest, AxisAligned) {
    Transform t(Vec2(100.0f, 100.0f));
    Sprite s(nullptr, Vec2(40.0f, 20.0f));
    EXPECT_TRUE(spriteContains(t, s, {100.0f, 100.0f}));
    EXPECT_TRUE(spriteContains(t, s, {119.0f, 109.0f}));
    EXPECT_FALSE(spriteContains(t, s, {121.0f, 100.0f}));
    EXPECT_FALSE(spriteContains(t, s, {100.0f, 111.0f}));
}

TEST(SpriteContainsTest, EdgeIsInside) {
    Transform t(Vec2(0.0f, 0.0f));
    Sprite s(nullptr, Vec2(10.0f, 10.0f));
    EXPECT_TRUE(spriteContains(t, s, {5.0f, 5.0f}));
}

TEST(SpriteContainsTest, Rotated) {
    // 40x10 turned upright
    Transform t(Vec2(0.0f, 0.0f), 90.0f);
    Sprite s(nullptr, Vec2(40.0f, 10.0f));
    EXPECT_TRUE(spriteContains(t, s, {0.0f, 18.0f}));
    EXPECT_FALSE(spriteContains(t, s, {18.0f, 0.0f}));
}

TEST(SpriteContainsTest, ScaleEnlargesAndMirrors) {
    Transform t(Vec2(0.0f, 0.0f), 0.0f, Vec2(-2.0f, 1.0f));
    Sprite s(nullptr, Vec2(10.0f, 10.0f));
    EXPECT_TRUE(spriteContains(t, s, {9.0f, 0.0f}));
    EXPECT_TRUE(spriteContains(t, s, {-9.0f, 0.0f}));
    EXPECT_FALSE(spriteContains(t, s, {0.0f, 6.0f}));
}

TEST(SpriteContainsTest, ZeroScaleNeverHit) {
    Transform t(Vec2(0.0f, 0.0f), 0.0f, Vec2(0.0f, 1.0f));
    Sprite s(nullptr, Vec2(10.0f, 10.0f));
    EXPECT_FALSE(spriteContains(t, s, {0.0f, 0.0f}));
}

TEST(CircleContainsTest, StrictRadius) {
    Transform t(Vec2(50.0f, 50.0f));
    PickingCircle c{10.0f};
    EXPECT_TRUE(circleContains(t, c, {50.0f, 50.0f}));
    EXPECT_TRUE(circleContains(t, c, {59.0f, 50.0f}));
    EXPECT_FALSE(circleContains(t, c, {60.0f, 50.0f}));
}

// =============================================================================
// Picker
// =============================================================================

class PickerTest : public ::testing::Test {
protected:
    Registry registry;
    Camera camera{800.0f, 600.0f};
    Picker picker;
    Entity canvas = NullEntity;

    void SetUp() override {
        canvas = registry.create(Canvas{}, Transform{});
    }

    /// Frame centered on `world` with the given depth
    Entity frame(Vec2 world, float depth, Vec2 size = {100.0f, 100.0f}) {
        return registry.create(Transform{world}, Sprite{nullptr, size, depth});
    }

    Entity grip(Vec2 screen, float radius = 8.0f) {
        return registry.create(Overlay{}, Transform{screen}, PickingCircle{radius});
    }

    Vec2 screenOf(Vec2 world) const { return camera.worldToScreen(world); }
};

TEST_F(PickerTest, NothingHitFallsBackToCanvas) {
    frame({0.0f, 0.0f}, 0.0f);
    EXPECT_EQ(picker.pick(registry, camera, screenOf({500.0f, 500.0f}), canvas), canvas);
    EXPECT_TRUE(picker.pickAll(registry, camera, screenOf({500.0f, 500.0f})).empty());
}

TEST_F(PickerTest, HitsFrameThroughCamera) {
    Entity f = frame({200.0f, 0.0f}, 0.0f);
    camera.setPosition(200.0f, 0.0f);
    camera.setZoom(2.0f);
    EXPECT_EQ(picker.pick(registry, camera, {400.0f, 300.0f}, canvas), f);
    // 100 screen px from center is 50 world units, the frame's edge
    EXPECT_EQ(picker.pick(registry, camera, {500.0f, 300.0f}, canvas), f);
    EXPECT_EQ(picker.pick(registry, camera, {510.0f, 300.0f}, canvas), canvas);
}

TEST_F(PickerTest, DeepestFrameWins) {
    Entity low = frame({0.0f, 0.0f}, 0.1f);
    Entity high = frame({20.0f, 0.0f}, 0.5f);
    EXPECT_EQ(picker.pick(registry, camera, screenOf({10.0f, 0.0f}), canvas), high);
    EXPECT_EQ(picker.pick(registry, camera, screenOf({-40.0f, 0.0f}), canvas), low);
}

TEST_F(PickerTest, OpaqueFramesBlockLowerHits) {
    frame({0.0f, 0.0f}, 0.1f);
    Entity high = frame({0.0f, 0.0f}, 0.5f);
    auto hits = picker.pickAll(registry, camera, screenOf({0.0f, 0.0f}));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].entity, high);
    EXPECT_EQ(hits[0].order, 0);
    EXPECT_FLOAT_EQ(hits[0].depth, 0.5f);
}

TEST_F(PickerTest, NonBlockingLetsLowerThrough) {
    Entity low = frame({0.0f, 0.0f}, 0.1f);
    Entity high = frame({0.0f, 0.0f}, 0.5f);
    registry.add<Pickable>(high, Pickable{false, true});

    auto hits = picker.pickAll(registry, camera, screenOf({0.0f, 0.0f}));
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].entity, high);
    EXPECT_EQ(hits[1].entity, low);
}

TEST_F(PickerTest, NonHoverableStillBlocks) {
    frame({0.0f, 0.0f}, 0.1f);
    Entity high = frame({0.0f, 0.0f}, 0.5f);
    registry.add<Pickable>(high, Pickable{true, false});

    EXPECT_TRUE(picker.pickAll(registry, camera, screenOf({0.0f, 0.0f})).empty());
    EXPECT_EQ(picker.pick(registry, camera, screenOf({0.0f, 0.0f}), canvas), canvas);
}

TEST_F(PickerTest, RequireMarkersSkipsUnmarked) {
    Entity low = frame({0.0f, 0.0f}, 0.1f);
    frame({0.0f, 0.0f}, 0.5f);
    registry.add<Pickable>(low);

    PickingSettings settings;
    settings.requireMarkers = true;
    picker.setSettings(settings);
    EXPECT_TRUE(picker.getSettings().requireMarkers);

    EXPECT_EQ(picker.pick(registry, camera, screenOf({0.0f, 0.0f}), canvas), low);
}

TEST_F(PickerTest, InvisibleSpritesIgnored) {
    Entity f = frame({0.0f, 0.0f}, 0.0f);
    registry.get<Sprite>(f).visible = false;
    EXPECT_EQ(picker.pick(registry, camera, screenOf({0.0f, 0.0f}), canvas), canvas);
}

TEST_F(PickerTest, OverlayBeatsWorld) {
    frame({0.0f, 0.0f}, 0.9f);
    Entity g = grip({400.0f, 300.0f});
    auto hits = picker.pickAll(registry, camera, {402.0f, 301.0f});
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].entity, g);
    EXPECT_EQ(hits[0].order, 1);
}

TEST_F(PickerTest, OverlayUsesScreenSpace) {
    Entity g = grip({100.0f, 100.0f});
    camera.setPosition(5000.0f, 5000.0f);
    camera.setZoom(3.0f);
    EXPECT_EQ(picker.pick(registry, camera, {105.0f, 100.0f}, canvas), g);
    EXPECT_EQ(picker.pick(registry, camera, {120.0f, 100.0f}, canvas), canvas);
}

TEST_F(PickerTest, OverlaySpritesAreNotWorldHits) {
    Entity marker = registry.create(Overlay{}, Transform{Vec2(0.0f, 0.0f)},
                                    Sprite{nullptr, Vec2(100.0f, 100.0f)});
    EXPECT_NE(picker.pick(registry, camera, screenOf({0.0f, 0.0f}), canvas), marker);
}

TEST_F(PickerTest, LocalPositionReported) {
    frame({100.0f, 100.0f}, 0.0f);
    auto hits = picker.pickAll(registry, camera, screenOf({110.0f, 95.0f}));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_NEAR(hits[0].local.x, 10.0f, 1e-4f);
    EXPECT_NEAR(hits[0].local.y, -5.0f, 1e-4f);
}
