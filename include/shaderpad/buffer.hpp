#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>

namespace shaderpad {

class Allocator;
class Device;

// A VkBuffer and its VMA allocation.
//
// Thread safety: thread-confined. write() must not race a GPU read of the
// same range; callers fence first.
class Buffer {
public:
    ~Buffer();
    Buffer(Buffer&&) noexcept;
    Buffer& operator=(Buffer&&) noexcept;
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] VkBuffer     vkBuffer()   const { return buffer_; }
    [[nodiscard]] VkDeviceSize size()       const { return size_; }
    [[nodiscard]] void*        mappedData() const { return mapped_; }

    // Copies into a host-mapped buffer and flushes the range, so non-coherent
    // memory is visible to the next submit.
    [[nodiscard]] Result<void> write(const void* data, VkDeviceSize bytes,
                                     VkDeviceSize offset = 0);

private:
    friend class BufferBuilder;
    Buffer() = default;
    void destroy();

    VmaAllocator  allocator_  = nullptr;
    VkBuffer      buffer_     = VK_NULL_HANDLE;
    VmaAllocation allocation_ = nullptr;
    VkDeviceSize  size_       = 0;
    void*         mapped_     = nullptr;
};

class BufferBuilder {
public:
    explicit BufferBuilder(const Allocator& allocator);

    BufferBuilder& size(VkDeviceSize bytes);

    BufferBuilder& vertexBuffer();  // VERTEX_BUFFER | TRANSFER_DST, device-local
    BufferBuilder& indexBuffer();   // INDEX_BUFFER  | TRANSFER_DST, device-local
    BufferBuilder& uniformBuffer(); // UNIFORM_BUFFER, host-mapped
    BufferBuilder& stagingBuffer(); // TRANSFER_SRC, host-mapped

    [[nodiscard]] Result<Buffer> build();

private:
    VmaAllocator       allocator_ = nullptr;
    VkDeviceSize       size_      = 0;
    VkBufferUsageFlags usage_     = 0;
    bool               mapped_    = false;
};

// Staged copy into a device-local buffer. Blocks until the copy is done,
// so keep it to startup.
[[nodiscard]] Result<void> uploadToBuffer(const Allocator& allocator, const Device& device,
                                          const Buffer& dst, const void* data, VkDeviceSize size);

[[nodiscard]] Result<Buffer> uploadVertexBuffer(const Allocator& allocator, const Device& device,
                                                const void* data, VkDeviceSize size);

[[nodiscard]] Result<Buffer> uploadIndexBuffer(const Allocator& allocator, const Device& device,
                                               const void* data, VkDeviceSize size);

} // namespace shaderpad
