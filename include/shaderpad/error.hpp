#pragma once

#include <cstdint>
#include <string>

namespace shaderpad {

// What failed, what Vulkan returned (if anything), and a readable explanation.
// VkResult is kept as int32_t so this header stays free of <vulkan/vulkan.h>.
struct Error {
    std::string  operation; // e.g. "compile shader"
    std::int32_t vkResult;  // 0 when the failure did not come from Vulkan
    std::string  message;

    // "shaderpad: <operation> failed (<name>, VkResult N): <message>"
    // The name is left out for codes vkResultName() does not know.
    [[nodiscard]] std::string format() const;
};

// "VK_ERROR_OUT_OF_DATE_KHR" for -1000001004, nullptr for unknown codes.
[[nodiscard]] const char* vkResultName(std::int32_t code);

// Called by Result<T>::orThrow().
// SHADERPAD_ENABLE_EXCEPTIONS=1 throws std::runtime_error, 0 prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace shaderpad
