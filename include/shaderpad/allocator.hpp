#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/vma_fwd.hpp>

#include <vulkan/vulkan.h>

namespace shaderpad {

class Instance;
class Device;

// Owns the VMA allocator every Buffer is carved from.
// Destroy after every Buffer and before the Device.
//
// Thread safety: thread-confined.
class Allocator {
public:
    [[nodiscard]] static Result<Allocator> create(const Instance& instance, const Device& device);

    ~Allocator();
    Allocator(Allocator&&) noexcept;
    Allocator& operator=(Allocator&&) noexcept;
    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    [[nodiscard]] VmaAllocator vmaAllocator() const { return allocator_; }
    [[nodiscard]] VkDevice     vkDevice()     const { return device_; }

private:
    Allocator() = default;
    void destroy();

    VmaAllocator allocator_ = nullptr;
    VkDevice     device_    = VK_NULL_HANDLE;
};

} // namespace shaderpad
