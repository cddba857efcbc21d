#include <gtest/gtest.h>
#include "engine/Log.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace neta;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::drop_all();
    }

    void TearDown() override {
        spdlog::drop_all();
    }
};

TEST_F(LogTest, InitCreatesBothLoggers) {
    ASSERT_NO_THROW(Log::init());
    ASSERT_NE(Log::getAppLogger(), nullptr);
    ASSERT_NE(Log::getAssetLogger(), nullptr);
    EXPECT_EQ(Log::getAppLogger()->name(), "NETA");
    EXPECT_EQ(Log::getAssetLogger()->name(), "ASSET");
}

TEST_F(LogTest, LevelAppliesToBothLoggers) {
    Log::init("", "warn");
    EXPECT_EQ(Log::getAppLogger()->level(), spdlog::level::warn);
    EXPECT_EQ(Log::getAssetLogger()->level(), spdlog::level::warn);
}

TEST_F(LogTest, ParseLevel) {
    EXPECT_EQ(Log::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Log::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Log::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Log::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Log::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Log::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(Log::parseLevel("off"), spdlog::level::off);
}

TEST_F(LogTest, UnknownLevelFallsBackToDebug) {
    EXPECT_EQ(Log::parseLevel("verbose"), spdlog::level::debug);
    EXPECT_EQ(Log::parseLevel(""), spdlog::level::debug);
}

TEST_F(LogTest, ReinitReplacesRegisteredLoggers) {
    Log::init("", "info");
    Log::init("", "error");
    EXPECT_EQ(spdlog::get("NETA"), Log::getAppLogger());
    EXPECT_EQ(spdlog::get("ASSET"), Log::getAssetLogger());
    EXPECT_EQ(spdlog::get("NETA")->level(), spdlog::level::err);
}

TEST_F(LogTest, InitWithCallSites) {
    ASSERT_NO_THROW(Log::init("", "debug", true));
    EXPECT_NO_THROW(LOG_DEBUG("with call site {}", 1));
}

TEST_F(LogTest, AllMacroLevels) {
    Log::init("", "trace");
    EXPECT_NO_THROW(LOG_TRACE("trace message"));
    EXPECT_NO_THROW(LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(LOG_INFO("info message"));
    EXPECT_NO_THROW(LOG_WARN("warn message"));
    EXPECT_NO_THROW(LOG_ERROR("error message"));
    EXPECT_NO_THROW(LOG_CRITICAL("critical message"));

    EXPECT_NO_THROW(ASSET_LOG_TRACE("trace message"));
    EXPECT_NO_THROW(ASSET_LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(ASSET_LOG_INFO("info message"));
    EXPECT_NO_THROW(ASSET_LOG_WARN("warn message"));
    EXPECT_NO_THROW(ASSET_LOG_ERROR("error message"));
}

TEST_F(LogTest, MacrosWithFormatArgs) {
    Log::init();
    EXPECT_NO_THROW(LOG_INFO("Frame {} at ({}, {})", "cat.png", 1.5f, -2.0f));
    EXPECT_NO_THROW(ASSET_LOG_WARN("'{}' changed {} times", "cat.png", 3));
}

TEST_F(LogTest, ShutdownWithoutInitSafe) {
    EXPECT_NO_THROW(Log::shutdown());
}

class LogFileTest : public ::testing::Test {
protected:
    std::string logPath;

    void SetUp() override {
        spdlog::drop_all();
        logPath = (std::filesystem::temp_directory_path() / "neta_test_log.txt").string();
        std::filesystem::remove(logPath);
    }

    void TearDown() override {
        spdlog::drop_all();
        std::filesystem::remove(logPath);
    }
};

TEST_F(LogFileTest, FileSinkReceivesBothLoggers) {
    Log::init(logPath, "debug");
    LOG_INFO("app line");
    ASSET_LOG_INFO("asset line");
    Log::getAppLogger()->flush();
    Log::getAssetLogger()->flush();

    std::ifstream f(logPath);
    ASSERT_TRUE(f.good()) << "Log file should have been created";
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("app line"), std::string::npos);
    EXPECT_NE(content.find("asset line"), std::string::npos);
    EXPECT_NE(content.find("[NETA]"), std::string::npos);
    EXPECT_NE(content.find("[ASSET]"), std::string::npos);
}
