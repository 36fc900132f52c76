#pragma once

#include <shaderpad/allocator.hpp>
#include <shaderpad/buffer.hpp>
#include <shaderpad/descriptor_set.hpp>
#include <shaderpad/device.hpp>
#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/uniforms.hpp>

#include <vulkan/vulkan.h>

#include <type_traits>
#include <utility>

namespace shaderpad {

// A CPU-side uniform value, the host-mapped buffer it is copied into
// (kUniformBlockBytes<T> long), and a one-binding descriptor set
// (binding 0) pointing at that buffer.
//
// The buffer holds whatever the last upload() wrote. Setting value() alone
// does not reach the GPU.
//
// Thread safety: thread-confined. upload() must not race a frame still
// reading the buffer; wait on the frame fence first.
template <typename T>
class UniformBinding {
    static_assert(std::is_trivially_copyable_v<T>,
                  "UniformBinding requires a trivially copyable type");

public:
    [[nodiscard]] static Result<UniformBinding> create(const Device& device,
                                                       const Allocator& allocator,
                                                       const T& initial,
                                                       VkShaderStageFlags stages =
                                                           VK_SHADER_STAGE_VERTEX_BIT |
                                                           VK_SHADER_STAGE_FRAGMENT_BIT) {
        auto buffer = BufferBuilder(allocator)
            .size(kUniformBlockBytes<T>)
            .uniformBuffer()
            .build();
        if (!buffer.ok()) return std::move(buffer).error();

        auto set = DescriptorSetBuilder(device)
            .uniformBuffer(0, stages, buffer.value().vkBuffer(), kUniformBlockBytes<T>)
            .build();
        if (!set.ok()) return std::move(set).error();

        UniformBinding binding(initial, std::move(buffer).value(), std::move(set).value());

        auto written = binding.upload();
        if (!written.ok()) return std::move(written).error();

        return binding;
    }

    UniformBinding(UniformBinding&&) noexcept = default;
    UniformBinding& operator=(UniformBinding&&) noexcept = default;
    UniformBinding(const UniformBinding&) = delete;
    UniformBinding& operator=(const UniformBinding&) = delete;

    [[nodiscard]] T&       value()       { return value_; }
    [[nodiscard]] const T& value() const { return value_; }

    [[nodiscard]] const Buffer& buffer() const { return buffer_; }

    [[nodiscard]] VkDescriptorSet       vkDescriptorSet()       const { return set_.vkDescriptorSet(); }
    [[nodiscard]] VkDescriptorSetLayout vkDescriptorSetLayout() const { return set_.vkDescriptorSetLayout(); }

    // Copies value() into the buffer.
    [[nodiscard]] Result<void> upload() {
        return buffer_.write(&value_, sizeof(T));
    }

private:
    UniformBinding(const T& value, Buffer buffer, DescriptorSet set)
        : value_(value), buffer_(std::move(buffer)), set_(std::move(set)) {}

    T             value_;
    Buffer        buffer_;
    DescriptorSet set_;
};

} // namespace shaderpad
