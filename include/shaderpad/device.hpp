#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace shaderpad {

class Instance;
class Surface;

struct QueueFamilies {
    std::uint32_t graphics = UINT32_MAX;
    std::uint32_t present  = UINT32_MAX;

    [[nodiscard]] bool valid() const {
        return graphics != UINT32_MAX && present != UINT32_MAX;
    }

    [[nodiscard]] bool shared() const {
        return graphics == present;
    }
};

// Thread safety: immutable after construction. Queues follow Vulkan's
// externally-synchronized rules.
class Device {
public:
    ~Device();
    Device(Device&&) noexcept;
    Device& operator=(Device&&) noexcept;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] VkDevice         vkDevice()         const { return device_; }
    [[nodiscard]] VkPhysicalDevice vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] VkQueue          graphicsQueue()    const { return graphicsQueue_; }
    [[nodiscard]] VkQueue          presentQueue()     const { return presentQueue_; }
    [[nodiscard]] QueueFamilies    queueFamilies()    const { return families_; }
    [[nodiscard]] const char*      gpuName()          const { return gpuName_.c_str(); }

    // Blocks until the GPU has finished everything submitted so far.
    void waitIdle() const;

private:
    friend class DeviceBuilder;
    Device() = default;
    void destroy();

    VkDevice         device_         = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkQueue          graphicsQueue_  = VK_NULL_HANDLE;
    VkQueue          presentQueue_   = VK_NULL_HANDLE;
    QueueFamilies    families_;
    std::string      gpuName_;
};

// What a GPU must offer before DeviceBuilder will pick it. Vulkan 1.3 and
// a graphics queue plus a queue that can present to the surface are always
// required.
struct DeviceRequirements {
    std::vector<const char*> extensions;
    bool dynamicRendering = false;
    bool sync2            = false;
    bool preferDiscrete   = false;
};

// Picks the best GPU meeting the requirements and creates the logical
// device with one graphics and one present queue. When nothing qualifies,
// the error lists every GPU with what it lacks.
class DeviceBuilder {
public:
    DeviceBuilder(const Instance& instance, const Surface& surface);

    DeviceBuilder& needSwapchain();
    DeviceBuilder& needDynamicRendering();
    DeviceBuilder& needSync2();
    DeviceBuilder& preferDiscreteGpu();

    [[nodiscard]] Result<Device> build();

private:
    VkInstance         instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR       surface_  = VK_NULL_HANDLE;
    DeviceRequirements req_;
};

} // namespace shaderpad
