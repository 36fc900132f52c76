#pragma once

#include <vulkan/vulkan.h>

namespace shaderpad {

// Color-image layout transition through VkImageMemoryBarrier2.
void transitionImage(VkCommandBuffer cmd, VkImage image,
                     VkImageLayout oldLayout, VkImageLayout newLayout,
                     VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess,
                     VkPipelineStageFlags2 dstStage, VkAccessFlags2 dstAccess);

// UNDEFINED -> COLOR_ATTACHMENT_OPTIMAL. Discards the previous contents,
// which is fine since the pass clears. Chains with an acquire semaphore
// waited at COLOR_ATTACHMENT_OUTPUT.
void transitionToColorAttachment(VkCommandBuffer cmd, VkImage image);

// COLOR_ATTACHMENT_OPTIMAL -> PRESENT_SRC_KHR.
void transitionToPresent(VkCommandBuffer cmd, VkImage image);

} // namespace shaderpad
