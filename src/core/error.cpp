#include <shaderpad/error.hpp>

#include <vulkan/vulkan.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

#ifndef SHADERPAD_ENABLE_EXCEPTIONS
#define SHADERPAD_ENABLE_EXCEPTIONS 1
#endif

namespace shaderpad {

const char* vkResultName(std::int32_t code) {
    // Only the codes the render loop and its setup can actually see.
    switch (static_cast<VkResult>(code)) {
    case VK_SUCCESS:                        return "VK_SUCCESS";
    case VK_NOT_READY:                      return "VK_NOT_READY";
    case VK_TIMEOUT:                        return "VK_TIMEOUT";
    case VK_SUBOPTIMAL_KHR:                 return "VK_SUBOPTIMAL_KHR";
    case VK_ERROR_OUT_OF_HOST_MEMORY:       return "VK_ERROR_OUT_OF_HOST_MEMORY";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:     return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
    case VK_ERROR_INITIALIZATION_FAILED:    return "VK_ERROR_INITIALIZATION_FAILED";
    case VK_ERROR_DEVICE_LOST:              return "VK_ERROR_DEVICE_LOST";
    case VK_ERROR_LAYER_NOT_PRESENT:        return "VK_ERROR_LAYER_NOT_PRESENT";
    case VK_ERROR_EXTENSION_NOT_PRESENT:    return "VK_ERROR_EXTENSION_NOT_PRESENT";
    case VK_ERROR_FEATURE_NOT_PRESENT:      return "VK_ERROR_FEATURE_NOT_PRESENT";
    case VK_ERROR_INCOMPATIBLE_DRIVER:      return "VK_ERROR_INCOMPATIBLE_DRIVER";
    case VK_ERROR_SURFACE_LOST_KHR:         return "VK_ERROR_SURFACE_LOST_KHR";
    case VK_ERROR_NATIVE_WINDOW_IN_USE_KHR: return "VK_ERROR_NATIVE_WINDOW_IN_USE_KHR";
    case VK_ERROR_OUT_OF_DATE_KHR:          return "VK_ERROR_OUT_OF_DATE_KHR";
    default:                                return nullptr;
    }
}

std::string Error::format() const {
    std::string out = "shaderpad: ";
    out += operation;
    out += " failed";

    if (vkResult != 0) {
        out += " (";
        if (const char* name = vkResultName(vkResult)) {
            out += name;
            out += ", ";
        }
        out += "VkResult ";
        out += std::to_string(vkResult);
        out += ")";
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

void throwError(const Error& e) {
#if SHADERPAD_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace shaderpad
