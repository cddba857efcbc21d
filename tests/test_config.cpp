#include <gtest/gtest.h>
#include "engine/Config.hpp"

#include <filesystem>
#include <fstream>

using namespace neta;

namespace {

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

// =============================================================================
// Loading and reading
// =============================================================================

TEST(ConfigTest, LoadFromValidString) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"name": "test", "value": 42})"));
    EXPECT_EQ(cfg.getString("name"), "test");
    EXPECT_EQ(cfg.getInt("value"), 42);
}

TEST(ConfigTest, LoadFromInvalidStringKeepsData) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"kept": 1})"));
    EXPECT_FALSE(cfg.loadFromString("{invalid json}"));
    EXPECT_EQ(cfg.getInt("kept"), 1);
}

TEST(ConfigTest, LoadFromMissingFile) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("nonexistent_file.json"));
}

TEST(ConfigTest, DotNotation) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "window": {
            "width": 1920,
            "height": 1080,
            "title": "Board",
            "reactive": true
        },
        "canvas": { "zoom_step": 1.25 }
    })"));

    EXPECT_EQ(cfg.getInt("window.width"), 1920);
    EXPECT_EQ(cfg.getInt("window.height"), 1080);
    EXPECT_EQ(cfg.getString("window.title"), "Board");
    EXPECT_TRUE(cfg.getBool("window.reactive"));
    EXPECT_FLOAT_EQ(cfg.getFloat("canvas.zoom_step"), 1.25f);
}

TEST(ConfigTest, DefaultValues) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({})"));

    EXPECT_EQ(cfg.getString("missing", "fallback"), "fallback");
    EXPECT_EQ(cfg.getInt("missing", 99), 99);
    EXPECT_FLOAT_EQ(cfg.getFloat("missing", 3.14f), 3.14f);
    EXPECT_TRUE(cfg.getBool("missing", true));
}

TEST(ConfigTest, HasKey) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": {"b": 1}})"));

    EXPECT_TRUE(cfg.hasKey("a"));
    EXPECT_TRUE(cfg.hasKey("a.b"));
    EXPECT_FALSE(cfg.hasKey("a.c"));
    EXPECT_FALSE(cfg.hasKey("a.b.c"));
    EXPECT_FALSE(cfg.hasKey("x"));
}

TEST(ConfigTest, TypeMismatchReturnsDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"str": "hello", "num": 7, "flag": true})"));

    EXPECT_EQ(cfg.getInt("str", -1), -1);
    EXPECT_EQ(cfg.getString("num", "none"), "none");
    EXPECT_FALSE(cfg.getBool("num", false));
    EXPECT_EQ(cfg.getInt("flag", 3), 3);
}

TEST(ConfigTest, IntegerReadsAsFloat) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"max_zoom": 20})"));
    EXPECT_FLOAT_EQ(cfg.getFloat("max_zoom"), 20.0f);
}

// =============================================================================
// Colors
// =============================================================================

TEST(ConfigTest, ColorFromRgb) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"canvas": {"background": [0.0, 0.5, 1.0]}})"));
    Color c = cfg.getColor("canvas.background", Color::Black());
    EXPECT_EQ(c.r, 0);
    EXPECT_EQ(c.g, 128);
    EXPECT_EQ(c.b, 255);
    EXPECT_EQ(c.a, 255);
}

TEST(ConfigTest, ColorFromRgba) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"c": [1, 1, 1, 0]})"));
    EXPECT_EQ(cfg.getColor("c", Color::Black()), Color(255, 255, 255, 0));
}

TEST(ConfigTest, MalformedColorReturnsDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "short": [1, 0],
        "long": [1, 0, 0, 1, 1],
        "text": ["a", "b", "c"],
        "scalar": 0.5
    })"));

    Color fallback(1, 2, 3, 4);
    EXPECT_EQ(cfg.getColor("short", fallback), fallback);
    EXPECT_EQ(cfg.getColor("long", fallback), fallback);
    EXPECT_EQ(cfg.getColor("text", fallback), fallback);
    EXPECT_EQ(cfg.getColor("scalar", fallback), fallback);
    EXPECT_EQ(cfg.getColor("missing", fallback), fallback);
}

TEST(ConfigTest, ColorChannelsClamped) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"c": [2.0, -1.0, 0.0]})"));
    EXPECT_EQ(cfg.getColor("c", Color::Black()), Color(255, 0, 0, 255));
}

// =============================================================================
// Setters and dirty keys
// =============================================================================

TEST(ConfigTest, SettersCreateNestedKeys) {
    Config cfg;
    cfg.setBool("window.fullscreen", true);
    cfg.setInt("window.width", 640);
    cfg.setFloat("canvas.zoom_step", 1.2f);
    cfg.setString("ui.theme_dir", "themes/dark");

    EXPECT_TRUE(cfg.getBool("window.fullscreen"));
    EXPECT_EQ(cfg.getInt("window.width"), 640);
    EXPECT_FLOAT_EQ(cfg.getFloat("canvas.zoom_step"), 1.2f);
    EXPECT_EQ(cfg.getString("ui.theme_dir"), "themes/dark");
}

TEST(ConfigTest, SetPreservesSiblings) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"window": {"width": 800, "height": 600}})"));
    cfg.setInt("window.width", 1024);
    EXPECT_EQ(cfg.getInt("window.width"), 1024);
    EXPECT_EQ(cfg.getInt("window.height"), 600);
}

TEST(ConfigTest, DirtyKeysTrackSetters) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": 1})"));
    EXPECT_TRUE(cfg.dirtyKeys().empty());

    cfg.setInt("a", 2);
    cfg.setBool("b.c", true);
    EXPECT_EQ(cfg.dirtyKeys().size(), 2u);
    EXPECT_TRUE(cfg.dirtyKeys().count("a"));
    EXPECT_TRUE(cfg.dirtyKeys().count("b.c"));
}

// =============================================================================
// Per-device overlay
// =============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    std::string basePath = tempPath("neta_test_config.json");
    std::string localPath = tempPath("neta_test_config.local.json");

    void SetUp() override {
        std::filesystem::remove(basePath);
        std::filesystem::remove(localPath);
    }

    void TearDown() override {
        std::filesystem::remove(basePath);
        std::filesystem::remove(localPath);
    }
};

TEST_F(ConfigFileTest, MergeOverwritesAndPreserves) {
    writeFile(basePath, R"({"window": {"width": 1280, "height": 720}, "logging": {"level": "info"}})");
    writeFile(localPath, R"({"window": {"width": 1920}})");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(basePath));
    ASSERT_TRUE(cfg.mergeFromFile(localPath));

    EXPECT_EQ(cfg.getInt("window.width"), 1920);
    EXPECT_EQ(cfg.getInt("window.height"), 720);
    EXPECT_EQ(cfg.getString("logging.level"), "info");
}

TEST_F(ConfigFileTest, MergeMissingFileReturnsFalse) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": 1})"));
    EXPECT_FALSE(cfg.mergeFromFile(localPath));
    EXPECT_EQ(cfg.getInt("a"), 1);
}

TEST_F(ConfigFileTest, MergeInvalidJsonKeepsData) {
    writeFile(localPath, "{not json");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": 1})"));
    EXPECT_FALSE(cfg.mergeFromFile(localPath));
    EXPECT_EQ(cfg.getInt("a"), 1);
}

TEST_F(ConfigFileTest, SaveOverridesWithoutChangesReturnsFalse) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": 1})"));
    EXPECT_FALSE(cfg.saveOverridesToFile(localPath));
    EXPECT_FALSE(std::filesystem::exists(localPath));
}

TEST_F(ConfigFileTest, SaveOverridesWritesOnlyChangedKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"window": {"width": 1280, "fullscreen": false}})"));
    cfg.setBool("window.fullscreen", true);
    ASSERT_TRUE(cfg.saveOverridesToFile(localPath));

    Config saved;
    ASSERT_TRUE(saved.loadFromFile(localPath));
    EXPECT_TRUE(saved.getBool("window.fullscreen"));
    EXPECT_FALSE(saved.hasKey("window.width"));
}

TEST_F(ConfigFileTest, SaveOverridesKeepsExistingLocalKeys) {
    writeFile(localPath, R"({"logging": {"level": "trace"}, "window": {"width": 1920}})");

    Config cfg;
    cfg.setBool("window.fullscreen", true);
    ASSERT_TRUE(cfg.saveOverridesToFile(localPath));

    Config saved;
    ASSERT_TRUE(saved.loadFromFile(localPath));
    EXPECT_EQ(saved.getString("logging.level"), "trace");
    EXPECT_EQ(saved.getInt("window.width"), 1920);
    EXPECT_TRUE(saved.getBool("window.fullscreen"));
}

TEST_F(ConfigFileTest, SaveMergeRoundTrip) {
    writeFile(basePath, R"({"window": {"fullscreen": false, "width": 1280}})");

    Config first;
    ASSERT_TRUE(first.loadFromFile(basePath));
    first.setBool("window.fullscreen", true);
    ASSERT_TRUE(first.saveOverridesToFile(localPath));

    Config second;
    ASSERT_TRUE(second.loadFromFile(basePath));
    ASSERT_TRUE(second.mergeFromFile(localPath));
    EXPECT_TRUE(second.getBool("window.fullscreen"));
    EXPECT_EQ(second.getInt("window.width"), 1280);
}

TEST_F(ConfigFileTest, SaveToInvalidPathFails) {
    Config cfg;
    cfg.setInt("a", 1);
    EXPECT_FALSE(cfg.saveOverridesToFile("/nonexistent_dir_neta/sub/config.json"));
}

TEST(ConfigDefaultsTest, ShippedConfigParses) {
    Config cfg;
    if (!cfg.loadFromFile("config.json")) {
        GTEST_SKIP() << "config.json not next to the test binary";
    }
    EXPECT_FALSE(cfg.getBool("window.vsync", true));
    EXPECT_TRUE(cfg.getBool("window.reactive", false));
    EXPECT_FLOAT_EQ(cfg.getFloat("canvas.zoom_step"), 1.1f);
}
