#include <shaderpad/frames.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace shaderpad {

void FrameSync::destroy() {
    if (device_ == VK_NULL_HANDLE) return;

    for (auto f : fences_) {
        if (f != VK_NULL_HANDLE) vkDestroyFence(device_, f, nullptr);
    }
    fences_.clear();

    // Frees the command buffers with it.
    if (pool_ != VK_NULL_HANDLE) {
        vkDestroyCommandPool(device_, pool_, nullptr);
        pool_ = VK_NULL_HANDLE;
    }
    cmds_.clear();

    device_ = VK_NULL_HANDLE;
}

FrameSync::~FrameSync() { destroy(); }

FrameSync::FrameSync(FrameSync&& o) noexcept
    : device_(o.device_), pool_(o.pool_), count_(o.count_), current_(o.current_),
      cmds_(std::move(o.cmds_)),
      fences_(std::move(o.fences_)) {
    o.device_ = VK_NULL_HANDLE;
    o.pool_   = VK_NULL_HANDLE;
}

FrameSync& FrameSync::operator=(FrameSync&& o) noexcept {
    if (this != &o) {
        destroy();
        device_   = o.device_;
        pool_     = o.pool_;
        count_    = o.count_;
        current_  = o.current_;
        cmds_     = std::move(o.cmds_);
        fences_   = std::move(o.fences_);
        o.device_ = VK_NULL_HANDLE;
        o.pool_   = VK_NULL_HANDLE;
    }
    return *this;
}

Result<FrameSync> FrameSync::create(const Device& device, std::uint32_t count) {
    if (count == 0) {
        return Error{"create frame sync", 0, "frame count must be at least 1"};
    }
    if (device.queueFamilies().graphics == UINT32_MAX) {
        return Error{"create command pool", 0, "Device has no graphics queue family"};
    }

    FrameSync fs;
    fs.device_ = device.vkDevice();
    fs.count_  = count;

    VkCommandPoolCreateInfo poolCI{};
    poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolCI.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    poolCI.queueFamilyIndex = device.queueFamilies().graphics;

    VkResult vr = vkCreateCommandPool(fs.device_, &poolCI, nullptr, &fs.pool_);
    if (vr != VK_SUCCESS) {
        fs.pool_ = VK_NULL_HANDLE;
        return Error{"create command pool", static_cast<std::int32_t>(vr),
                     "vkCreateCommandPool failed"};
    }

    fs.cmds_.resize(count);
    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool        = fs.pool_;
    allocInfo.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = count;

    vr = vkAllocateCommandBuffers(fs.device_, &allocInfo, fs.cmds_.data());
    if (vr != VK_SUCCESS) {
        return Error{"allocate command buffers", static_cast<std::int32_t>(vr),
                     "vkAllocateCommandBuffers failed"};
    }

    // Created signaled so the first nextFrame() does not block.
    VkFenceCreateInfo fenceCI{};
    fenceCI.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceCI.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    fs.fences_.assign(count, VK_NULL_HANDLE);
    for (std::uint32_t i = 0; i < count; ++i) {
        vr = vkCreateFence(fs.device_, &fenceCI, nullptr, &fs.fences_[i]);
        if (vr != VK_SUCCESS) {
            fs.fences_[i] = VK_NULL_HANDLE;
            return Error{"create fence", static_cast<std::int32_t>(vr),
                         "failed for fence[" + std::to_string(i) + "]"};
        }
    }

    return fs;
}

Result<Frame> FrameSync::nextFrame() {
    std::uint32_t i = current_;

    VkResult vr = vkWaitForFences(device_, 1, &fences_[i], VK_TRUE, UINT64_MAX);
    if (vr != VK_SUCCESS) {
        return Error{"wait for fence", static_cast<std::int32_t>(vr),
                     "vkWaitForFences failed for frame " + std::to_string(i)};
    }

    current_ = (current_ + 1) % count_;
    return Frame{cmds_[i], fences_[i], i};
}

Result<void> FrameSync::beginFrame(const Frame& frame) {
    VkResult vr = vkResetCommandBuffer(frame.cmd, 0);
    if (vr != VK_SUCCESS) {
        return Error{"reset command buffer", static_cast<std::int32_t>(vr),
                     "vkResetCommandBuffer failed"};
    }

    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vr = vkBeginCommandBuffer(frame.cmd, &beginInfo);
    if (vr != VK_SUCCESS) {
        return Error{"begin command buffer", static_cast<std::int32_t>(vr),
                     "vkBeginCommandBuffer failed"};
    }
    return {};
}

Result<void> FrameSync::recycle(const Frame& frame) {
    if (frame.index >= count_ || fences_[frame.index] != frame.fence) {
        return Error{"recycle frame", 0,
                     "frame " + std::to_string(frame.index) + " does not belong to this FrameSync"};
    }

    VkResult vr = vkResetCommandBuffer(frame.cmd, 0);
    if (vr != VK_SUCCESS) {
        return Error{"recycle frame", static_cast<std::int32_t>(vr),
                     "vkResetCommandBuffer failed"};
    }

    // A fence can only be signaled by the queue, so replace it.
    VkFenceCreateInfo fenceCI{};
    fenceCI.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceCI.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    VkFence fresh = VK_NULL_HANDLE;
    vr = vkCreateFence(device_, &fenceCI, nullptr, &fresh);
    if (vr != VK_SUCCESS) {
        return Error{"recycle frame", static_cast<std::int32_t>(vr), "vkCreateFence failed"};
    }
    vkDestroyFence(device_, fences_[frame.index], nullptr);
    fences_[frame.index] = fresh;
    return {};
}

void beginOneTimeCommands(VkCommandBuffer cmd) {
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vkBeginCommandBuffer(cmd, &beginInfo);
}

Result<void> endSubmitOneShotBlocking(VkQueue queue, VkCommandBuffer cmd) {
    VkResult vr = vkEndCommandBuffer(cmd);
    if (vr != VK_SUCCESS) {
        return Error{"end one-shot command buffer", static_cast<std::int32_t>(vr),
                     "vkEndCommandBuffer failed"};
    }

    VkCommandBufferSubmitInfo cmdInfo{};
    cmdInfo.sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmdInfo.commandBuffer = cmd;

    VkSubmitInfo2 submit{};
    submit.sType                  = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submit.commandBufferInfoCount = 1;
    submit.pCommandBufferInfos    = &cmdInfo;

    vr = vkQueueSubmit2(queue, 1, &submit, VK_NULL_HANDLE);
    if (vr != VK_SUCCESS) {
        return Error{"submit one-shot command buffer", static_cast<std::int32_t>(vr),
                     "vkQueueSubmit2 failed"};
    }

    vr = vkQueueWaitIdle(queue);
    if (vr != VK_SUCCESS) {
        return Error{"wait one-shot queue idle", static_cast<std::int32_t>(vr),
                     "vkQueueWaitIdle failed"};
    }
    return {};
}

Result<void> FrameSync::submit(VkQueue queue, const Frame& frame,
                              const SwapchainImage& image, VkPipelineStageFlags2 waitStage) {
    VkResult vr = vkEndCommandBuffer(frame.cmd);
    if (vr != VK_SUCCESS) {
        return Error{"end command buffer", static_cast<std::int32_t>(vr),
                     "vkEndCommandBuffer failed"};
    }

    // Reset as late as possible: every earlier exit leaves it signaled.
    vr = vkResetFences(device_, 1, &frame.fence);
    if (vr != VK_SUCCESS) {
        return Error{"reset fence", static_cast<std::int32_t>(vr), "vkResetFences failed"};
    }

    VkSemaphoreSubmitInfo waitInfo{};
    waitInfo.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    waitInfo.semaphore = image.imageReady;
    waitInfo.stageMask = waitStage;

    VkSemaphoreSubmitInfo signalInfo{};
    signalInfo.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    signalInfo.semaphore = image.renderDone;
    signalInfo.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;

    VkCommandBufferSubmitInfo cmdInfo{};
    cmdInfo.sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmdInfo.commandBuffer = frame.cmd;

    VkSubmitInfo2 submit{};
    submit.sType                    = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submit.waitSemaphoreInfoCount   = 1;
    submit.pWaitSemaphoreInfos      = &waitInfo;
    submit.commandBufferInfoCount   = 1;
    submit.pCommandBufferInfos      = &cmdInfo;
    submit.signalSemaphoreInfoCount = 1;
    submit.pSignalSemaphoreInfos    = &signalInfo;

    vr = vkQueueSubmit2(queue, 1, &submit, frame.fence);
    if (vr != VK_SUCCESS) {
        return Error{"submit frame", static_cast<std::int32_t>(vr), "vkQueueSubmit2 failed"};
    }
    return {};
}

} // namespace shaderpad
