#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace neta {

class Log {
public:
    /// Create the "NETA" and "ASSET" loggers.  An empty logFile disables the
    /// file sink.  With trackLocation the console pattern carries file:line.
    static void init(const std::string& logFile = "", const std::string& level = "debug",
                     bool trackLocation = false);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& getAppLogger();
    static std::shared_ptr<spdlog::logger>& getAssetLogger();

    /// Map a config string ("trace" ... "critical", "off") to a spdlog level.
    /// Unknown strings fall back to debug.
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static std::shared_ptr<spdlog::logger> s_assetLogger;
};

} // namespace neta

// Application logging macros.  SPDLOG_LOGGER_CALL records the call site so
// dev builds can print it.
#define NETA_LOG_CALL(logger, lvl, ...) \
    SPDLOG_LOGGER_CALL(logger, lvl, __VA_ARGS__)

#define LOG_TRACE(...)    NETA_LOG_CALL(::neta::Log::getAppLogger(), spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...)    NETA_LOG_CALL(::neta::Log::getAppLogger(), spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...)     NETA_LOG_CALL(::neta::Log::getAppLogger(), spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...)     NETA_LOG_CALL(::neta::Log::getAppLogger(), spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...)    NETA_LOG_CALL(::neta::Log::getAppLogger(), spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) NETA_LOG_CALL(::neta::Log::getAppLogger(), spdlog::level::critical, __VA_ARGS__)

// Asset pipeline logging macros
#define ASSET_LOG_TRACE(...)    NETA_LOG_CALL(::neta::Log::getAssetLogger(), spdlog::level::trace, __VA_ARGS__)
#define ASSET_LOG_DEBUG(...)    NETA_LOG_CALL(::neta::Log::getAssetLogger(), spdlog::level::debug, __VA_ARGS__)
#define ASSET_LOG_INFO(...)     NETA_LOG_CALL(::neta::Log::getAssetLogger(), spdlog::level::info, __VA_ARGS__)
#define ASSET_LOG_WARN(...)     NETA_LOG_CALL(::neta::Log::getAssetLogger(), spdlog::level::warn, __VA_ARGS__)
#define ASSET_LOG_ERROR(...)    NETA_LOG_CALL(::neta::Log::getAssetLogger(), spdlog::level::err, __VA_ARGS__)
