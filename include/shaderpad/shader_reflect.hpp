#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace shaderpad {

// A descriptor binding found in a SPIR-V module.
struct ReflectedBinding {
    std::uint32_t      set       = 0;
    std::uint32_t      binding   = 0;
    VkDescriptorType   type      = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    std::uint32_t      blockSize = 0; // bytes, uniform/storage blocks only
    VkShaderStageFlags stages    = 0;
    std::string        name;
};

// A vertex-stage input. Built-ins are skipped.
struct ReflectedInput {
    std::uint32_t location = 0;
    VkFormat      format   = VK_FORMAT_UNDEFINED;
    std::string   name;
};

struct ReflectedLayout {
    std::vector<ReflectedBinding>    bindings;
    std::vector<VkPushConstantRange> pushConstants;
    std::vector<ReflectedInput>      inputs; // vertex stage only
};

[[nodiscard]] Result<ReflectedLayout> reflectSpv(const std::vector<std::uint32_t>& code,
                                                 VkShaderStageFlagBits stage);

// Same set+binding+type: stage flags OR'd. Same slot, different type: Error.
[[nodiscard]] Result<ReflectedLayout> mergeReflections(const ReflectedLayout& a,
                                                       const ReflectedLayout& b);

// What a shader may reference. Anything not listed is rejected.
struct ShaderInterface {
    struct UniformSlot {
        std::uint32_t set;
        std::uint32_t binding;
        std::uint32_t maxBlockSize; // size of the buffer bound there
    };
    struct InputSlot {
        std::uint32_t location;
        VkFormat      format;
    };
    std::vector<UniformSlot> uniforms;
    std::vector<InputSlot>   inputs;
};

// Checks a merged layout against the interface: only listed uniform
// slots, no block larger than its buffer, no push constants, and only
// listed vertex inputs with matching formats. Declaring fewer than the
// interface offers is fine.
[[nodiscard]] Result<void> checkShaderInterface(const ReflectedLayout& layout,
                                                const ShaderInterface& expected);

// Reflects both stages, merges them, then checks.
[[nodiscard]] Result<void> checkShaderInterface(const std::vector<std::uint32_t>& vertCode,
                                                const std::vector<std::uint32_t>& fragCode,
                                                const ShaderInterface& expected);

} // namespace shaderpad
