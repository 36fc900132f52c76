#pragma once

#include <glm/vec2.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace shaderpad {

using Clock = std::chrono::steady_clock;

// Bytes reserved for a uniform block: sizeof(T) rounded up to 16, the
// std140 base alignment reflection tools pad a block to.
template <typename T>
inline constexpr std::uint32_t kUniformBlockBytes =
    static_cast<std::uint32_t>((sizeof(T) + 15) & ~std::size_t{15});

// std140 block at set 0, binding 0: uniform Time { uint milliseconds; }
struct TimeUniform {
    std::uint32_t milliseconds = 0;

    // Whole milliseconds from start to now. Zero if now precedes start;
    // holds at UINT32_MAX (about 49.7 days) instead of wrapping.
    void update(Clock::time_point start, Clock::time_point now) {
        if (now <= start) {
            milliseconds = 0;
            return;
        }
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
        if (ms >= static_cast<decltype(ms)>(std::numeric_limits<std::uint32_t>::max())) {
            milliseconds = std::numeric_limits<std::uint32_t>::max();
            return;
        }
        milliseconds = static_cast<std::uint32_t>(ms);
    }
};
static_assert(sizeof(TimeUniform) == 4, "Time block layout changed -- update shaders");
static_assert(std::is_trivially_copyable_v<TimeUniform>);

// std140 block at set 1, binding 0: uniform Mouse { vec2 cursor; }
// cursor is normalized with y up: (0,0) bottom-left, (1,1) top-right.
struct MouseUniform {
    glm::vec2 cursor{0.0f, 0.0f};

    // x and y are normalized window coordinates with y down.
    void updatePosition(float x, float y) {
        cursor = glm::vec2(x, 1.0f - y);
    }
};
static_assert(sizeof(MouseUniform) == 8, "Mouse block layout changed -- update shaders");
static_assert(std::is_trivially_copyable_v<MouseUniform>);

} // namespace shaderpad
