#include <gtest/gtest.h>
#include "canvas/ImageFrames.hpp"
#include "MockRenderer.hpp"

#include <filesystem>

using namespace neta;
namespace fs = std::filesystem;

// =============================================================================
// FrameLoader Tests
// =============================================================================

class ImageFramesTest : public ::testing::Test {
protected:
    MockRenderer renderer;
    TextureManager textures;
    Registry registry;
    CanvasState state;
    AssetPolicy policy{makeSettings()};
    FrameLoader loader{registry, state, textures, policy};

    static AssetSettings makeSettings() {
        AssetSettings settings;
        settings.root = (fs::temp_directory_path() / "neta_frames").string();
        return settings;
    }

    void SetUp() override {
        textures.setRenderer(&renderer);
        state.canvas = registry.create(Canvas{}, Transform{});
    }

    /// Make `path` loadable and return the path the texture is loaded from
    std::string addImage(const std::string& path, int w, int h) {
        std::string resolved = *policy.resolve(path);
        renderer.addImage(resolved, w, h);
        return resolved;
    }
};

TEST_F(ImageFramesTest, SpawnFrameUnderCanvas) {
    Entity frame = loader.spawnFrame("boards/cat.png", Vec2(10.0f, 20.0f));
    EXPECT_TRUE((registry.hasAll<ImageFrame, Transform, Parent, Name>(frame)));
    EXPECT_FALSE(registry.has<Sprite>(frame));
    EXPECT_EQ(registry.get<Parent>(frame).entity, state.canvas);
    EXPECT_EQ(registry.get<Name>(frame).value, "cat.png");
    EXPECT_EQ(registry.get<ImageFrame>(frame).path, "boards/cat.png");
    EXPECT_FLOAT_EQ(registry.get<Transform>(frame).position.x, 10.0f);
}

TEST_F(ImageFramesTest, SpawnWithoutPositionAtOrigin) {
    Entity frame = loader.spawnFrame("cat.png");
    EXPECT_FLOAT_EQ(registry.get<Transform>(frame).position.x, 0.0f);
    EXPECT_FLOAT_EQ(registry.get<Transform>(frame).position.y, 0.0f);
}

TEST_F(ImageFramesTest, SetupGivesSpriteAtTextureSize) {
    std::string resolved = addImage("cat.png", 64, 32);
    Entity frame = loader.spawnFrame("cat.png");

    EXPECT_EQ(loader.setupPendingFrames(), 1u);
    ASSERT_TRUE(registry.has<Sprite>(frame));
    const auto& sprite = registry.get<Sprite>(frame);
    ASSERT_NE(sprite.texture, nullptr);
    EXPECT_FLOAT_EQ(sprite.size.x, 64.0f);
    EXPECT_FLOAT_EQ(sprite.size.y, 32.0f);
    EXPECT_TRUE(registry.has<Pickable>(frame));
    EXPECT_EQ(registry.get<ImageFrame>(frame).source, resolved);
}

TEST_F(ImageFramesTest, LaterFramesDrawOnTop) {
    addImage("a.png", 10, 10);
    Entity a = loader.spawnFrame("a.png");
    Entity b = loader.spawnFrame("a.png");
    loader.setupPendingFrames();
    Entity c = loader.spawnFrame("a.png");
    loader.setupPendingFrames();

    float da = registry.get<Sprite>(a).depth;
    float db = registry.get<Sprite>(b).depth;
    float dc = registry.get<Sprite>(c).depth;
    EXPECT_NE(da, db);
    EXPECT_LT(std::max(da, db), dc);
    EXPECT_FLOAT_EQ(dc, 2.0f * FRAME_DEPTH_STEP);
    EXPECT_EQ(state.framesSetUp, 3u);
}

TEST_F(ImageFramesTest, SetupIsIdempotent) {
    addImage("a.png", 10, 10);
    loader.spawnFrame("a.png");
    EXPECT_EQ(loader.setupPendingFrames(), 1u);
    EXPECT_EQ(loader.setupPendingFrames(), 0u);
}

TEST_F(ImageFramesTest, TextureCachedAcrossFrames) {
    addImage("a.png", 10, 10);
    Entity a = loader.spawnFrame("a.png");
    Entity b = loader.spawnFrame("a.png");
    loader.setupPendingFrames();
    EXPECT_EQ(renderer.loadCount, 1);
    EXPECT_EQ(registry.get<Sprite>(a).texture, registry.get<Sprite>(b).texture);
}

TEST_F(ImageFramesTest, FailedLoadDestroysFrame) {
    Entity frame = loader.spawnFrame("missing.png");
    EXPECT_EQ(loader.setupPendingFrames(), 0u);
    EXPECT_FALSE(registry.valid(frame));
    EXPECT_EQ(state.framesSetUp, 0u);
}

TEST_F(ImageFramesTest, RejectedPathDestroysFrame) {
    AssetSettings strict = makeSettings();
    strict.allowExternalPaths = false;
    AssetPolicy strictPolicy(strict);
    FrameLoader strictLoader(registry, state, textures, strictPolicy);

    std::string outside = (fs::temp_directory_path() / "neta_outside.png").string();
    renderer.addImage(fs::weakly_canonical(outside).string(), 10, 10);
    Entity frame = strictLoader.spawnFrame(outside);
    EXPECT_EQ(strictLoader.setupPendingFrames(), 0u);
    EXPECT_FALSE(registry.valid(frame));
}

TEST_F(ImageFramesTest, FrameReadyCallback) {
    addImage("a.png", 10, 10);
    std::vector<Entity> ready;
    loader.setOnFrameReady([&](Entity e) {
        // Sprite is in place by the time the callback runs
        EXPECT_TRUE(registry.has<Sprite>(e));
        ready.push_back(e);
    });
    Entity frame = loader.spawnFrame("a.png");
    loader.setupPendingFrames();
    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(ready[0], frame);
}

TEST_F(ImageFramesTest, DroppedFilesPlacedAtCursor) {
    loader.queueDrop("a.png");
    loader.queueDrop("b.png");
    EXPECT_EQ(registry.count<DropImageFrame>(), 2u);

    EXPECT_EQ(loader.placeDroppedFrames({30.0f, -40.0f}), 2u);
    EXPECT_EQ(registry.count<DropImageFrame>(), 0u);
    EXPECT_EQ(registry.count<ImageFrame>(), 2u);
    for (auto frame : registry.view<ImageFrame>()) {
        EXPECT_FLOAT_EQ(registry.get<Transform>(frame).position.x, 30.0f);
        EXPECT_FLOAT_EQ(registry.get<Transform>(frame).position.y, -40.0f);
        EXPECT_EQ(registry.get<Parent>(frame).entity, state.canvas);
    }
}

TEST_F(ImageFramesTest, NoDropsNothingPlaced) {
    EXPECT_EQ(loader.placeDroppedFrames({0.0f, 0.0f}), 0u);
    EXPECT_EQ(registry.count<ImageFrame>(), 0u);
}

TEST_F(ImageFramesTest, RefreshSwapsTexture) {
    std::string resolved = addImage("a.png", 10, 10);
    Entity frame = loader.spawnFrame("a.png");
    loader.setupPendingFrames();
    registry.get<Sprite>(frame).size = {200.0f, 100.0f};
    const Texture* before = registry.get<Sprite>(frame).texture;

    renderer.addImage(resolved, 20, 20);
    EXPECT_EQ(loader.refreshFrames({resolved}), 1u);

    const auto& sprite = registry.get<Sprite>(frame);
    ASSERT_NE(sprite.texture, nullptr);
    EXPECT_NE(sprite.texture, before);
    EXPECT_EQ(sprite.texture->getWidth(), 20);
    // Frames keep the size the user gave them
    EXPECT_FLOAT_EQ(sprite.size.x, 200.0f);
}

TEST_F(ImageFramesTest, RefreshOfDeletedFileClearsTexture) {
    std::string resolved = addImage("a.png", 10, 10);
    Entity frame = loader.spawnFrame("a.png");
    loader.setupPendingFrames();

    renderer.removeImage(resolved);
    EXPECT_EQ(loader.refreshFrames({resolved}), 1u);
    EXPECT_TRUE(registry.valid(frame));
    EXPECT_EQ(registry.get<Sprite>(frame).texture, nullptr);

    renderer.addImage(resolved, 10, 10);
    loader.refreshFrames({resolved});
    EXPECT_NE(registry.get<Sprite>(frame).texture, nullptr);
}

TEST_F(ImageFramesTest, RefreshIgnoresUnrelatedFiles) {
    addImage("a.png", 10, 10);
    loader.spawnFrame("a.png");
    loader.setupPendingFrames();
    EXPECT_EQ(loader.refreshFrames({"/nowhere/else.png"}), 0u);
}
