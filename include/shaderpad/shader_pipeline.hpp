#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/pipeline.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/shader_compiler.hpp>
#include <shaderpad/shader_reflect.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace shaderpad {

class Device;

inline constexpr std::uint32_t kTimeSet  = 0;
inline constexpr std::uint32_t kMouseSet = 1;

// Set 0 binding 0 time block, set 1 binding 0 mouse block, vertex inputs
// at locations 0 (vec3) and 1 (vec2). Nothing else.
[[nodiscard]] ShaderInterface quadShaderInterface();

// Compiles both stages of source, checks them against quadShaderInterface()
// and builds the quad pipeline against layout. Never throws; every failure
// (compile, interface, vkCreateGraphicsPipelines) comes back as an Error.
[[nodiscard]] Result<Pipeline> buildShaderPipeline(const Device& device,
                                                   const ShaderCompiler& compiler,
                                                   const PipelineLayout& layout,
                                                   VkFormat colorFormat,
                                                   std::string_view source,
                                                   const std::string& name);

// Reads path fresh, then builds as above.
[[nodiscard]] Result<Pipeline> buildShaderPipeline(const Device& device,
                                                   const ShaderCompiler& compiler,
                                                   const PipelineLayout& layout,
                                                   VkFormat colorFormat,
                                                   const std::filesystem::path& path);

} // namespace shaderpad
