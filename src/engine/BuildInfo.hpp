#pragma once

#include <string>

// Compile definitions set by the build (see CMakeLists.txt):
//   NETA_DEV                developer tooling
//   NETA_DEV_NATIVE         developer tooling plus asset file watching
//   NETA_FILE_DIALOG_PORTAL desktop portal file dialog (Linux)
//   NETA_BUILD_PROFILE      "Debug", "Release", "ReleaseNative", "Web"

#ifndef NETA_BUILD_PROFILE
#define NETA_BUILD_PROFILE "Debug"
#endif

namespace neta {

/// Feature set compiled into this binary
struct BuildInfo {
    static constexpr const char* VERSION = "0.1.0";
    static constexpr const char* PROFILE = NETA_BUILD_PROFILE;

#if defined(NETA_DEV) || defined(NETA_DEV_NATIVE)
    static constexpr bool DEV_TOOLS = true;
#else
    static constexpr bool DEV_TOOLS = false;
#endif

#if defined(NETA_DEV_NATIVE) && !defined(__EMSCRIPTEN__)
    static constexpr bool FILE_WATCHER = true;
#else
    static constexpr bool FILE_WATCHER = false;
#endif

#if defined(NETA_FILE_DIALOG_PORTAL) && defined(__linux__)
    static constexpr const char* DIALOG_BACKEND = "portal";
#else
    static constexpr const char* DIALOG_BACKEND = "none";
#endif

    /// One-line description for the startup log
    static std::string summary() {
        return std::string("neta ") + VERSION + " [" + PROFILE + "]"
            + " dev=" + (DEV_TOOLS ? "on" : "off")
            + " watcher=" + (FILE_WATCHER ? "on" : "off")
            + " dialog=" + DIALOG_BACKEND;
    }
};

} // namespace neta
