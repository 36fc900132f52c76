#pragma once

#include <vulkan/vulkan.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace shaderpad {

// Interleaved quad vertex. 20 bytes, no padding.
// Location 0 is position, location 1 is texCoord.
struct Vertex {
    float position[3];
    float texCoord[2];
};
static_assert(sizeof(Vertex) == 20, "Vertex layout changed -- update shaders");

// Full-viewport quad, texCoord (0,0) at the bottom-left corner.
inline constexpr std::array<Vertex, 4> kQuadVertices = {{
    {{-1.0f, -1.0f, 0.0f}, {0.0f, 0.0f}},
    {{ 1.0f, -1.0f, 0.0f}, {1.0f, 0.0f}},
    {{ 1.0f,  1.0f, 0.0f}, {1.0f, 1.0f}},
    {{-1.0f,  1.0f, 0.0f}, {0.0f, 1.0f}},
}};

// Counter-clockwise with y up. The render pass flips the viewport
// (negative height) so this holds on screen and back-face culling keeps
// both triangles.
inline constexpr std::array<std::uint16_t, 6> kQuadIndices = {
    2, 3, 0,
    1, 2, 0,
};

inline constexpr VkIndexType kQuadIndexType = VK_INDEX_TYPE_UINT16;

struct VertexAttribute {
    std::uint32_t location;
    VkFormat      format;
    std::uint32_t offset;
};

inline constexpr std::uint32_t kVertexBinding = 0;
inline constexpr std::uint32_t kVertexStride  = sizeof(Vertex);

inline constexpr std::array<VertexAttribute, 2> kVertexAttributes = {{
    {0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<std::uint32_t>(offsetof(Vertex, position))},
    {1, VK_FORMAT_R32G32_SFLOAT,    static_cast<std::uint32_t>(offsetof(Vertex, texCoord))},
}};

[[nodiscard]] inline constexpr VkDeviceSize quadVertexBytes() {
    return sizeof(Vertex) * kQuadVertices.size();
}

[[nodiscard]] inline constexpr VkDeviceSize quadIndexBytes() {
    return sizeof(std::uint16_t) * kQuadIndices.size();
}

} // namespace shaderpad
