#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace shaderpad {

class Device;

// One descriptor set of uniform buffers with its own layout and a pool
// sized for exactly that set. The buffers are written when the set is
// built and never rebound: the uniforms are updated through their mapped
// memory instead.
//
// Must outlive every command buffer that binds it.
//
// Thread safety: immutable after build.
class DescriptorSet {
public:
    ~DescriptorSet();
    DescriptorSet(DescriptorSet&&) noexcept;
    DescriptorSet& operator=(DescriptorSet&&) noexcept;
    DescriptorSet(const DescriptorSet&) = delete;
    DescriptorSet& operator=(const DescriptorSet&) = delete;

    [[nodiscard]] VkDescriptorSet       vkDescriptorSet()       const { return set_; }
    [[nodiscard]] VkDescriptorSetLayout vkDescriptorSetLayout() const { return layout_; }

private:
    friend class DescriptorSetBuilder;
    DescriptorSet() = default;
    void destroy();

    VkDevice              device_ = VK_NULL_HANDLE;
    VkDescriptorSetLayout layout_ = VK_NULL_HANDLE;
    VkDescriptorPool      pool_   = VK_NULL_HANDLE;
    VkDescriptorSet       set_    = VK_NULL_HANDLE;
};

class DescriptorSetBuilder {
public:
    explicit DescriptorSetBuilder(const Device& device);

    // The first `range` bytes of buffer at `binding`, visible to `stages`.
    DescriptorSetBuilder& uniformBuffer(std::uint32_t binding, VkShaderStageFlags stages,
                                        VkBuffer buffer, VkDeviceSize range);

    // Fails on an empty builder, a null buffer, or a binding used twice.
    [[nodiscard]] Result<DescriptorSet> build();

private:
    struct UniformSlot {
        std::uint32_t      binding;
        VkShaderStageFlags stages;
        VkBuffer           buffer;
        VkDeviceSize       range;
    };

    VkDevice                 device_ = VK_NULL_HANDLE;
    std::vector<UniformSlot> slots_;
};

} // namespace shaderpad
