#include <shaderpad/frame_error.hpp>

#include <vulkan/vulkan.h>

namespace shaderpad {

FrameFailure classifyFrameError(const Error& error) {
    switch (static_cast<VkResult>(error.vkResult)) {
    case VK_ERROR_OUT_OF_DATE_KHR:
    case VK_ERROR_SURFACE_LOST_KHR:
        return FrameFailure::SurfaceLost;
    case VK_ERROR_OUT_OF_HOST_MEMORY:
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
    case VK_ERROR_DEVICE_LOST:
        return FrameFailure::Fatal;
    default:
        return FrameFailure::Transient;
    }
}

const char* frameFailureName(FrameFailure failure) {
    switch (failure) {
    case FrameFailure::SurfaceLost: return "surface lost";
    case FrameFailure::Fatal:       return "fatal";
    case FrameFailure::Transient:   return "transient";
    }
    return "unknown";
}

} // namespace shaderpad
