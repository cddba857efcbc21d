#pragma once

#include <cstddef>

namespace neta {

/// How the main loop waits between frames
enum class FramePacing {
    Continuous,    // draw as fast as vsync allows
    WaitForEvents, // sleep until input arrives
    Ticking,       // keep drawing at the window's tick rate
};

/// Work that has to advance while the user is idle
struct TimedWork {
    size_t watchedFiles = 0;
    size_t liveGizmos = 0;

    bool pending() const { return watchedFiles > 0 || liveGizmos > 0; }
};

/// Pacing for the next frame.  A reactive window only sleeps on input
/// when nothing is polling or counting down.
FramePacing choosePacing(bool reactive, const TimedWork& work);

const char* framePacingName(FramePacing pacing);

} // namespace neta
