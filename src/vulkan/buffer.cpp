#include <shaderpad/allocator.hpp>
#include <shaderpad/buffer.hpp>
#include <shaderpad/device.hpp>
#include <shaderpad/frames.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstring>
#include <string>

namespace shaderpad {

void Buffer::destroy() {
    if (buffer_ != VK_NULL_HANDLE) {
        vmaDestroyBuffer(allocator_, buffer_, allocation_);
        buffer_     = VK_NULL_HANDLE;
        allocation_ = nullptr;
    }
    mapped_ = nullptr;
    size_   = 0;
}

Buffer::~Buffer() { destroy(); }

Buffer::Buffer(Buffer&& o) noexcept
    : allocator_(o.allocator_), buffer_(o.buffer_),
      allocation_(o.allocation_), size_(o.size_), mapped_(o.mapped_) {
    o.allocator_  = nullptr;
    o.buffer_     = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
    o.size_       = 0;
    o.mapped_     = nullptr;
}

Buffer& Buffer::operator=(Buffer&& o) noexcept {
    if (this != &o) {
        destroy();
        allocator_    = o.allocator_;
        buffer_       = o.buffer_;
        allocation_   = o.allocation_;
        size_         = o.size_;
        mapped_       = o.mapped_;
        o.allocator_  = nullptr;
        o.buffer_     = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
        o.size_       = 0;
        o.mapped_     = nullptr;
    }
    return *this;
}

Result<void> Buffer::write(const void* data, VkDeviceSize bytes, VkDeviceSize offset) {
    if (mapped_ == nullptr) {
        return Error{"write buffer", 0, "buffer is not host-mapped"};
    }
    if (offset + bytes > size_) {
        return Error{"write buffer", 0,
                     "write of " + std::to_string(bytes) + " bytes at offset " +
                     std::to_string(offset) + " overruns buffer of " + std::to_string(size_)};
    }

    std::memcpy(static_cast<char*>(mapped_) + offset, data, static_cast<std::size_t>(bytes));

    VkResult vr = vmaFlushAllocation(allocator_, allocation_, offset, bytes);
    if (vr != VK_SUCCESS) {
        return Error{"write buffer", static_cast<std::int32_t>(vr), "vmaFlushAllocation failed"};
    }
    return {};
}

BufferBuilder::BufferBuilder(const Allocator& allocator)
    : allocator_(allocator.vmaAllocator()) {}

BufferBuilder& BufferBuilder::size(VkDeviceSize bytes) {
    size_ = bytes;
    return *this;
}

BufferBuilder& BufferBuilder::vertexBuffer() {
    usage_  = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    mapped_ = false;
    return *this;
}

BufferBuilder& BufferBuilder::indexBuffer() {
    usage_  = VK_BUFFER_USAGE_INDEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    mapped_ = false;
    return *this;
}

BufferBuilder& BufferBuilder::uniformBuffer() {
    usage_  = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    mapped_ = true;
    return *this;
}

BufferBuilder& BufferBuilder::stagingBuffer() {
    usage_  = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
    mapped_ = true;
    return *this;
}

Result<Buffer> BufferBuilder::build() {
    if (size_ == 0) {
        return Error{"create buffer", 0, "buffer size is 0, call size(bytes)"};
    }
    if (usage_ == 0) {
        return Error{"create buffer", 0,
                     "no usage flags, call vertexBuffer(), uniformBuffer() or similar"};
    }

    VkBufferCreateInfo bufCI{};
    bufCI.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufCI.size  = size_;
    bufCI.usage = usage_;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;
    if (mapped_) {
        allocCI.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                        VMA_ALLOCATION_CREATE_MAPPED_BIT;
    }

    Buffer buf;
    buf.allocator_ = allocator_;

    VmaAllocationInfo allocInfo{};
    VkResult vr = vmaCreateBuffer(allocator_, &bufCI, &allocCI,
                                  &buf.buffer_, &buf.allocation_, &allocInfo);
    if (vr != VK_SUCCESS) {
        buf.buffer_     = VK_NULL_HANDLE;
        buf.allocation_ = nullptr;
        return Error{"create buffer", static_cast<std::int32_t>(vr), "vmaCreateBuffer failed"};
    }

    buf.size_ = size_;
    if (mapped_) {
        buf.mapped_ = allocInfo.pMappedData;
    }
    return buf;
}

Result<void> uploadToBuffer(const Allocator& allocator, const Device& device,
                            const Buffer& dst, const void* data, VkDeviceSize size) {
    auto staging = BufferBuilder(allocator).stagingBuffer().size(size).build();
    if (!staging.ok()) return staging.error();

    auto writeRes = staging.value().write(data, size);
    if (!writeRes.ok()) return writeRes;

    VkCommandPoolCreateInfo poolCI{};
    poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolCI.flags            = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    poolCI.queueFamilyIndex = device.queueFamilies().graphics;

    VkCommandPool cmdPool = VK_NULL_HANDLE;
    VkResult vr = vkCreateCommandPool(device.vkDevice(), &poolCI, nullptr, &cmdPool);
    if (vr != VK_SUCCESS) {
        return Error{"upload to buffer", static_cast<std::int32_t>(vr),
                     "failed to create command pool for transfer"};
    }

    VkCommandBufferAllocateInfo cmdAI{};
    cmdAI.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    cmdAI.commandPool        = cmdPool;
    cmdAI.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cmdAI.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    vr = vkAllocateCommandBuffers(device.vkDevice(), &cmdAI, &cmd);
    if (vr != VK_SUCCESS) {
        vkDestroyCommandPool(device.vkDevice(), cmdPool, nullptr);
        return Error{"upload to buffer", static_cast<std::int32_t>(vr),
                     "failed to allocate command buffer for transfer"};
    }

    beginOneTimeCommands(cmd);
    VkBufferCopy region{};
    region.size = size;
    vkCmdCopyBuffer(cmd, staging.value().vkBuffer(), dst.vkBuffer(), 1, &region);

    auto submitRes = endSubmitOneShotBlocking(device.graphicsQueue(), cmd);
    vkDestroyCommandPool(device.vkDevice(), cmdPool, nullptr);
    return submitRes;
}

Result<Buffer> uploadVertexBuffer(const Allocator& allocator, const Device& device,
                                  const void* data, VkDeviceSize size) {
    auto buf = BufferBuilder(allocator).vertexBuffer().size(size).build();
    if (!buf.ok()) return buf.error();
    auto r = uploadToBuffer(allocator, device, buf.value(), data, size);
    if (!r.ok()) return r.error();
    return buf;
}

Result<Buffer> uploadIndexBuffer(const Allocator& allocator, const Device& device,
                                 const void* data, VkDeviceSize size) {
    auto buf = BufferBuilder(allocator).indexBuffer().size(size).build();
    if (!buf.ok()) return buf.error();
    auto r = uploadToBuffer(allocator, device, buf.value(), data, size);
    if (!r.ok()) return r.error();
    return buf;
}

} // namespace shaderpad
