#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/render_state.hpp>
#include <shaderpad/window.hpp>

namespace shaderpad {

// Event-loop policy on top of RenderState. Each function returns false
// when the loop should stop.

// For events RenderState::input() did not consume. Quit, CloseRequested
// and Escape stop. Enter reloads the shader unless it is key auto-repeat;
// a failed reload is logged and the loop goes on. Resized and
// ScaleChanged resize, ignoring zero sizes.
[[nodiscard]] bool handleEvent(RenderState& state, const Event& event);

// update() then render(). A failure goes to handleFrameError(); the frame
// is not retried within the same iteration.
[[nodiscard]] bool drawFrame(RenderState& state);

// SurfaceLost reconfigures at the current size and skips the frame, Fatal
// stops, Transient is logged and the next iteration tries again.
[[nodiscard]] bool handleFrameError(RenderState& state, const Error& error);

} // namespace shaderpad
