#include "engine/FramePacing.hpp"

namespace neta {

FramePacing choosePacing(bool reactive, const TimedWork& work) {
    if (!reactive) return FramePacing::Continuous;
    return work.pending() ? FramePacing::Ticking : FramePacing::WaitForEvents;
}

const char* framePacingName(FramePacing pacing) {
    switch (pacing) {
        case FramePacing::Continuous:    return "continuous";
        case FramePacing::WaitForEvents: return "wait-for-events";
        case FramePacing::Ticking:       return "ticking";
    }
    return "unknown";
}

} // namespace neta
