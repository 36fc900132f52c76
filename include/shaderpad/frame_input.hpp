#pragma once

#include <shaderpad/uniforms.hpp>
#include <shaderpad/window.hpp>

#include <glm/vec4.hpp>

namespace shaderpad {

inline const glm::vec4 kDefaultBackground{0.1f, 0.2f, 0.3f, 1.0f};

// Per-window input state that feeds a frame: drawable size, clear color
// and the mouse uniform value. No GPU objects, so RenderState owns one and
// tests drive it directly.
//
// Thread safety: thread-confined.
class FrameInput {
public:
    explicit FrameInput(Size size) : size_(size) {}

    // px, py are pixel coordinates. Sets the clear color's red and green to
    // the normalized position and the mouse uniform to it with y flipped.
    // Ignored while the size has a zero dimension.
    void cursorMoved(float px, float py) {
        if (size_.empty()) return;
        const float x = px / static_cast<float>(size_.width);
        const float y = py / static_cast<float>(size_.height);
        mouse_.updatePosition(x, y);
        background_.r = x;
        background_.g = y;
    }

    // Returns false, storing nothing, when either dimension is zero.
    bool resize(Size size) {
        if (size.empty()) return false;
        size_ = size;
        return true;
    }

    [[nodiscard]] Size                size()       const { return size_; }
    [[nodiscard]] glm::vec4           background() const { return background_; }
    [[nodiscard]] const MouseUniform& mouse()      const { return mouse_; }

private:
    Size         size_;
    glm::vec4    background_ = kDefaultBackground;
    MouseUniform mouse_;
};

} // namespace shaderpad
