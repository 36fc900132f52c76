#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace shaderpad {

// Dynamic rendering and synchronization2 are core from here on.
inline constexpr std::uint32_t kVulkanApiVersion = VK_API_VERSION_1_3;

// Debug builds ask for VK_LAYER_KHRONOS_validation; missing layers are
// logged and skipped.
#ifdef NDEBUG
inline constexpr bool kValidateByDefault = false;
#else
inline constexpr bool kValidateByDefault = true;
#endif

// The VkInstance plus, when validation is on, the messenger that forwards
// warnings and errors to stderr.
//
// Thread safety: immutable after construction.
class Instance {
public:
    ~Instance();
    Instance(Instance&&) noexcept;
    Instance& operator=(Instance&&) noexcept;
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    [[nodiscard]] VkInstance vkInstance() const { return instance_; }

private:
    friend class InstanceBuilder;
    Instance() = default;
    void destroy();

    VkInstance               instance_  = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
};

class InstanceBuilder {
public:
    InstanceBuilder& appName(std::string_view name);
    InstanceBuilder& validation(bool enable);

    // Surface extensions as SDL3 reports them for this platform.
    InstanceBuilder& enableWindowSupport();

    [[nodiscard]] Result<Instance> build();

private:
    std::string appName_       = "shaderpad";
    bool        validate_      = kValidateByDefault;
    bool        windowSupport_ = false;
};

} // namespace shaderpad
