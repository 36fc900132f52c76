#pragma once

#include <shaderpad/error.hpp>

namespace shaderpad {

// What the event loop should do about a failed frame.
enum class FrameFailure {
    SurfaceLost, // out of date or lost surface: reconfigure at the current size, skip the frame
    Fatal,       // out of memory or device lost: stop the loop
    Transient,   // anything else: log, try again next frame
};

[[nodiscard]] FrameFailure classifyFrameError(const Error& error);

[[nodiscard]] const char* frameFailureName(FrameFailure failure);

} // namespace shaderpad
