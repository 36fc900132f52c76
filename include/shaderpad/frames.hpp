#pragma once

#include <shaderpad/device.hpp>
#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/swapchain.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace shaderpad {

// Per-frame handles returned by FrameSync::nextFrame().
// Plain data; FrameSync owns everything.
// The acquire and present semaphores live in SwapchainImage.
struct Frame {
    VkCommandBuffer cmd   = VK_NULL_HANDLE;
    VkFence         fence = VK_NULL_HANDLE; // CPU waits on it before reusing the slot
    std::uint32_t   index = 0;              // frame-in-flight slot (0..N-1)
};

// Command pool, one command buffer and one fence per frame in flight.
// Everything is allocated up front.
//
// Thread safety: thread-confined (render loop thread).
class FrameSync {
public:
    [[nodiscard]] static Result<FrameSync> create(const Device& device, std::uint32_t count = 1);

    ~FrameSync();
    FrameSync(FrameSync&&) noexcept;
    FrameSync& operator=(FrameSync&&) noexcept;
    FrameSync(const FrameSync&) = delete;
    FrameSync& operator=(const FrameSync&) = delete;

    // Waits until the GPU is done with the next slot. Leaves the fence
    // signaled; submitFrame() is the only place that resets it.
    [[nodiscard]] Result<Frame> nextFrame();

    // Resets the slot's command buffer and begins recording. Safe to call
    // before the swapchain image is acquired: an abandoned recording is
    // simply reset by the next call.
    [[nodiscard]] Result<void> beginFrame(const Frame& frame);

    // Puts a slot back into the state nextFrame() expects after a submit
    // failed: a fresh signaled fence and a reset command buffer. The caller
    // must have waited for the device to go idle.
    [[nodiscard]] Result<void> recycle(const Frame& frame);

    // Ends the frame's command buffer, resets frame.fence and submits. Waits
    // on image.imageReady at waitStage, signals image.renderDone, fences
    // frame.fence. A failure may leave the fence unsignaled; recover with
    // recycle().
    [[nodiscard]] Result<void> submit(VkQueue queue, const Frame& frame,
                                      const SwapchainImage& image,
                                      VkPipelineStageFlags2 waitStage);

private:
    FrameSync() = default;
    void destroy();

    VkDevice                     device_  = VK_NULL_HANDLE;
    VkCommandPool                pool_    = VK_NULL_HANDLE;
    std::uint32_t                count_   = 0;
    std::uint32_t                current_ = 0;
    std::vector<VkCommandBuffer> cmds_;
    std::vector<VkFence>         fences_;
};

// One-shot helpers for uploads. Blocks until the queue is idle.
void beginOneTimeCommands(VkCommandBuffer cmd);
[[nodiscard]] Result<void> endSubmitOneShotBlocking(VkQueue queue, VkCommandBuffer cmd);

} // namespace shaderpad
