#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace neta {

std::shared_ptr<spdlog::logger> Log::s_appLogger;
std::shared_ptr<spdlog::logger> Log::s_assetLogger;

void Log::init(const std::string& logFile, const std::string& level, bool trackLocation) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern(trackLocation
        ? "[%H:%M:%S] [%n] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%s:%#] %v");
        sinks.push_back(fileSink);
    }

    s_appLogger = std::make_shared<spdlog::logger>("NETA", sinks.begin(), sinks.end());
    s_assetLogger = std::make_shared<spdlog::logger>("ASSET", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_appLogger->set_level(spdLevel);
    s_assetLogger->set_level(spdLevel);

    // Re-initialization replaces the registered loggers
    spdlog::drop("NETA");
    spdlog::drop("ASSET");
    spdlog::register_logger(s_appLogger);
    spdlog::register_logger(s_assetLogger);
}

void Log::shutdown() {
    spdlog::shutdown();
}

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    return spdlog::level::debug;
}

std::shared_ptr<spdlog::logger>& Log::getAppLogger() {
    // Logging before init() (unit tests, early errors) goes to the console
    if (!s_appLogger) {
        init();
    }
    return s_appLogger;
}

std::shared_ptr<spdlog::logger>& Log::getAssetLogger() {
    if (!s_assetLogger) {
        init();
    }
    return s_assetLogger;
}

} // namespace neta
