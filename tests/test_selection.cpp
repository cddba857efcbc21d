#include <gtest/gtest.h>
#include "canvas/Selection.hpp"
#include "MockRenderer.hpp"
#include "PointerScript.hpp"

#include <algorithm>

using namespace neta;

// =============================================================================
// Selection Tests
// =============================================================================

class SelectionTest : public ::testing::Test {
protected:
    Registry registry;
    Camera camera{800.0f, 600.0f};
    CanvasState state;
    ControlHandles handles{registry, camera, state};
    Selection selection{registry, camera, state, handles};
    PointerEventRouter router;

    void SetUp() override {
        state.canvas = registry.create(Canvas{}, Transform{}, Name{"Canvas"});
        PointerHandlers handlers;
        selection.addCanvasHandlers(handlers);
        registry.add<PointerHandlers>(state.canvas, std::move(handlers));
    }

    /// Ready frame centered on `world`, wired like the app does it
    Entity frame(Vec2 world, Vec2 size = {100.0f, 100.0f}) {
        Entity f = registry.create(ImageFrame{"f.png", "/f.png"}, Transform{world},
                                   Sprite{nullptr, size}, Parent{state.canvas});
        registry.add<PointerHandlers>(f, selection.frameHandlers(f));
        return f;
    }

    static bool contains(const std::vector<Entity>& list, Entity e) {
        return std::find(list.begin(), list.end(), e) != list.end();
    }
};

TEST_F(SelectionTest, SelectOnlyAttachesHandle) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    selection.selectOnly(a);
    selection.selectOnly(b);

    EXPECT_FALSE(registry.has<Selected>(a));
    EXPECT_TRUE(registry.has<Selected>(b));
    EXPECT_EQ(handles.controlledFrame(), b);
}

TEST_F(SelectionTest, Toggle) {
    Entity a = frame({0.0f, 0.0f});
    selection.toggle(a);
    EXPECT_TRUE(registry.has<Selected>(a));
    selection.toggle(a);
    EXPECT_FALSE(registry.has<Selected>(a));
}

TEST_F(SelectionTest, DeselectAll) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    selection.toggle(a);
    selection.toggle(b);
    EXPECT_EQ(selection.selectedFrames().size(), 2u);
    selection.deselectAll();
    EXPECT_TRUE(selection.selectedFrames().empty());
}

TEST_F(SelectionTest, SelectIntersecting) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    Entity far = frame({1000.0f, 1000.0f});

    size_t count = selection.selectIntersecting({40.0f, -10.0f, 130.0f, 20.0f}, false);
    EXPECT_EQ(count, 2u);
    EXPECT_TRUE(registry.has<Selected>(a));
    EXPECT_TRUE(registry.has<Selected>(b));
    EXPECT_FALSE(registry.has<Selected>(far));
}

TEST_F(SelectionTest, SelectIntersectingReplacesUnlessAdditive) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({500.0f, 0.0f});
    selection.toggle(a);

    selection.selectIntersecting({490.0f, -10.0f, 20.0f, 20.0f}, true);
    EXPECT_TRUE(registry.has<Selected>(a));
    EXPECT_TRUE(registry.has<Selected>(b));

    selection.selectIntersecting({490.0f, -10.0f, 20.0f, 20.0f}, false);
    EXPECT_FALSE(registry.has<Selected>(a));
    EXPECT_TRUE(registry.has<Selected>(b));
}

TEST_F(SelectionTest, SelectIntersectingUsesScaledSize) {
    Entity a = frame({0.0f, 0.0f}, {10.0f, 10.0f});
    registry.get<Transform>(a).scale = {-10.0f, 1.0f};
    EXPECT_EQ(selection.selectIntersecting({40.0f, -1.0f, 2.0f, 2.0f}, false), 1u);
}

TEST_F(SelectionTest, ActionTargetsAreHoveredOrSelected) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    Entity c = frame({400.0f, 0.0f});
    registry.add<Hovered>(a);
    registry.add<Selected>(b);

    auto targets = selection.actionTargets();
    EXPECT_EQ(targets.size(), 2u);
    EXPECT_TRUE(contains(targets, a));
    EXPECT_TRUE(contains(targets, b));
    EXPECT_FALSE(contains(targets, c));
}

TEST_F(SelectionTest, RemoveFramesDropsHandle) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    selection.selectOnly(a);

    selection.removeFrames({a, NullEntity});
    EXPECT_FALSE(registry.valid(a));
    EXPECT_TRUE(registry.valid(b));
    EXPECT_EQ(handles.current(), NullEntity);
}

TEST_F(SelectionTest, RemoveOtherFrameKeepsHandle) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    selection.selectOnly(a);
    selection.removeFrames({b});
    EXPECT_NE(handles.current(), NullEntity);
}

TEST_F(SelectionTest, MoveFrame) {
    Entity a = frame({0.0f, 0.0f});
    selection.moveFrame(a, {5.0f, -3.0f});
    EXPECT_FLOAT_EQ(registry.get<Transform>(a).position.x, 5.0f);
    EXPECT_FLOAT_EQ(registry.get<Transform>(a).position.y, -3.0f);
}

// =============================================================================
// Pointer interaction
// =============================================================================

TEST_F(SelectionTest, HoverMarksFrame) {
    Entity a = frame({0.0f, 0.0f});
    PointerScript pointer{{400.0f, 300.0f}};
    router.update(registry, pointer.idle(), a);
    EXPECT_TRUE(registry.has<Hovered>(a));
    router.update(registry, pointer.move({10.0f, 10.0f}), state.canvas);
    EXPECT_FALSE(registry.has<Hovered>(a));
}

TEST_F(SelectionTest, ClickSelectsFrame) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    selection.toggle(b);

    PointerScript pointer{{400.0f, 300.0f}};
    router.update(registry, pointer.press(), a);
    router.update(registry, pointer.release(), a);

    EXPECT_TRUE(registry.has<Selected>(a));
    EXPECT_FALSE(registry.has<Selected>(b));
    EXPECT_EQ(handles.controlledFrame(), a);
}

TEST_F(SelectionTest, CtrlClickToggles) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    selection.toggle(b);

    PointerScript pointer{{400.0f, 300.0f}};
    pointer.setCtrl(true);
    router.update(registry, pointer.press(), a);
    router.update(registry, pointer.release(), a);

    EXPECT_TRUE(registry.has<Selected>(a));
    EXPECT_TRUE(registry.has<Selected>(b));
}

TEST_F(SelectionTest, ClickOnCanvasDeselects) {
    Entity a = frame({0.0f, 0.0f});
    selection.selectOnly(a);

    PointerScript pointer{{10.0f, 10.0f}};
    router.update(registry, pointer.press(), state.canvas);
    router.update(registry, pointer.release(), state.canvas);

    EXPECT_FALSE(registry.has<Selected>(a));
    EXPECT_EQ(handles.current(), NullEntity);
}

TEST_F(SelectionTest, CtrlClickOnCanvasKeepsSelection) {
    Entity a = frame({0.0f, 0.0f});
    selection.selectOnly(a);

    PointerScript pointer{{10.0f, 10.0f}};
    pointer.setCtrl(true);
    router.update(registry, pointer.press(), state.canvas);
    router.update(registry, pointer.release(), state.canvas);

    EXPECT_TRUE(registry.has<Selected>(a));
    EXPECT_EQ(handles.current(), NullEntity);
}

TEST_F(SelectionTest, RightClickOnCanvasKeepsSelection) {
    Entity a = frame({0.0f, 0.0f});
    selection.toggle(a);

    PointerScript pointer{{10.0f, 10.0f}};
    router.update(registry, pointer.press(MouseButton::Right), state.canvas);
    router.update(registry, pointer.release(MouseButton::Right), state.canvas);
    EXPECT_TRUE(registry.has<Selected>(a));
}

TEST_F(SelectionTest, DragMovesFrameInWorldUnits) {
    Entity a = frame({0.0f, 0.0f});
    camera.setZoom(2.0f);

    PointerScript pointer{{400.0f, 300.0f}};
    router.update(registry, pointer.press(), a);
    router.update(registry, pointer.move({420.0f, 310.0f}), a);

    EXPECT_FLOAT_EQ(registry.get<Transform>(a).position.x, 10.0f);
    EXPECT_FLOAT_EQ(registry.get<Transform>(a).position.y, 5.0f);
}

TEST_F(SelectionTest, RubberBandSelects) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    Entity c = frame({0.0f, 250.0f});

    // The band starts where the first drag movement lands: screen
    // (381..620, 281..320) is world (-19..220, -19..20)
    PointerScript pointer{{380.0f, 280.0f}};
    router.update(registry, pointer.press(), state.canvas);
    router.update(registry, pointer.move({381.0f, 281.0f}), state.canvas);
    EXPECT_TRUE(state.selectionDrag.isDragging());
    router.update(registry, pointer.move({620.0f, 320.0f}), state.canvas);
    router.update(registry, pointer.release(), state.canvas);

    EXPECT_TRUE(registry.has<Selected>(a));
    EXPECT_TRUE(registry.has<Selected>(b));
    EXPECT_FALSE(registry.has<Selected>(c));
    EXPECT_FALSE(state.selectionDrag.isDragging());
}

TEST_F(SelectionTest, RubberBandFollowsCamera) {
    Entity a = frame({1000.0f, 0.0f}, {10.0f, 10.0f});
    camera.setPosition(1000.0f, 0.0f);
    camera.setZoom(4.0f);

    PointerScript pointer{{390.0f, 290.0f}};
    router.update(registry, pointer.press(), state.canvas);
    router.update(registry, pointer.move({391.0f, 291.0f}), state.canvas);
    router.update(registry, pointer.move({410.0f, 310.0f}), state.canvas);
    router.update(registry, pointer.release(), state.canvas);

    EXPECT_TRUE(registry.has<Selected>(a));
}

TEST_F(SelectionTest, NoHoverWhileBanding) {
    Entity a = frame({0.0f, 0.0f});
    state.selectionDrag.start = Vec2(0.0f, 0.0f);
    PointerScript pointer{{400.0f, 300.0f}};
    router.update(registry, pointer.idle(), a);
    EXPECT_FALSE(registry.has<Hovered>(a));
}

// =============================================================================
// Drawing
// =============================================================================

TEST_F(SelectionTest, DrawsBordersForHoveredAndSelected) {
    Entity a = frame({0.0f, 0.0f});
    Entity b = frame({200.0f, 0.0f});
    frame({400.0f, 0.0f});
    registry.add<Hovered>(a);
    registry.add<Selected>(b);

    MockRenderer renderer;
    selection.draw(renderer);
    EXPECT_EQ(renderer.polylines.size(), 2u);
    EXPECT_TRUE(renderer.outlineRects.empty());
}

TEST_F(SelectionTest, NoBordersWhileHandleShown) {
    Entity a = frame({0.0f, 0.0f});
    selection.selectOnly(a);

    MockRenderer renderer;
    selection.draw(renderer);
    EXPECT_TRUE(renderer.polylines.empty());
}

TEST_F(SelectionTest, DrawsBand) {
    state.selectionDrag.start = Vec2(10.0f, 10.0f);
    state.selectionDrag.end = Vec2(5.0f, 40.0f);

    MockRenderer renderer;
    selection.draw(renderer);
    ASSERT_EQ(renderer.outlineRects.size(), 1u);
    EXPECT_FLOAT_EQ(renderer.outlineRects[0].x, 5.0f);
    EXPECT_FLOAT_EQ(renderer.outlineRects[0].width, 5.0f);
    EXPECT_FLOAT_EQ(renderer.outlineRects[0].height, 30.0f);
}
