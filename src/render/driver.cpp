#include <shaderpad/driver.hpp>
#include <shaderpad/frame_error.hpp>

#include <cstdio>

namespace shaderpad {

bool handleEvent(RenderState& state, const Event& event) {
    switch (event.type) {
    case EventType::Quit:
    case EventType::CloseRequested:
        return false;

    case EventType::KeyDown:
        if (event.keyCode == Key::Escape) {
            return false;
        }
        if (event.keyCode == Key::Enter && !event.repeat) {
            // Already logged; the old pipeline stays live.
            (void)state.reloadShader();
        }
        return true;

    case EventType::Resized:
    case EventType::ScaleChanged: {
        auto r = state.resize(event.size);
        if (!r.ok()) {
            std::fprintf(stderr, "[shaderpad] resize failed: %s\n", r.error().format().c_str());
        }
        return true;
    }

    default:
        return true;
    }
}

bool drawFrame(RenderState& state) {
    auto r = state.update();
    if (r.ok()) {
        r = state.render();
    }
    if (r.ok()) {
        return true;
    }
    return handleFrameError(state, r.error());
}

bool handleFrameError(RenderState& state, const Error& error) {
    const FrameFailure failure = classifyFrameError(error);
    std::fprintf(stderr, "[shaderpad] frame failed (%s): %s\n",
                 frameFailureName(failure), error.format().c_str());

    switch (failure) {
    case FrameFailure::SurfaceLost: {
        auto resized = state.resize(state.currentSize());
        if (!resized.ok()) {
            std::fprintf(stderr, "[shaderpad] %s\n", resized.error().format().c_str());
        }
        return true;
    }
    case FrameFailure::Fatal:
        return false;
    case FrameFailure::Transient:
        return true;
    }
    return true;
}

} // namespace shaderpad
