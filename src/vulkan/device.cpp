#include <shaderpad/device.hpp>
#include <shaderpad/instance.hpp>
#include <shaderpad/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace shaderpad {

namespace {

// One physical device as DeviceBuilder sees it.
struct Candidate {
    VkPhysicalDevice           gpu = VK_NULL_HANDLE;
    VkPhysicalDeviceProperties props{};
    QueueFamilies              families;
    std::vector<std::string>   missing; // empty when the GPU qualifies
    int                        score = -1;
};

QueueFamilies FindQueueFamilies(VkPhysicalDevice gpu, VkSurfaceKHR surface) {
    std::uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, nullptr);
    std::vector<VkQueueFamilyProperties> props(count);
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, props.data());

    QueueFamilies found;
    for (std::uint32_t i = 0; i < count; ++i) {
        const bool graphics = (props[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
        VkBool32 present = VK_FALSE;
        if (vkGetPhysicalDeviceSurfaceSupportKHR(gpu, i, surface, &present) != VK_SUCCESS) {
            present = VK_FALSE;
        }

        if (graphics && present) {
            return QueueFamilies{i, i};
        }
        if (graphics && found.graphics == UINT32_MAX) found.graphics = i;
        if (present && found.present == UINT32_MAX)   found.present  = i;
    }
    return found;
}

bool HasExtension(const std::vector<VkExtensionProperties>& available, const char* name) {
    for (const auto& e : available) {
        if (std::strcmp(e.extensionName, name) == 0) return true;
    }
    return false;
}

Candidate Evaluate(VkPhysicalDevice gpu, VkSurfaceKHR surface, const DeviceRequirements& req) {
    Candidate c;
    c.gpu = gpu;
    vkGetPhysicalDeviceProperties(gpu, &c.props);

    if (c.props.apiVersion < VK_API_VERSION_1_3) {
        c.missing.push_back("Vulkan 1.3");
    } else {
        VkPhysicalDeviceVulkan13Features f13{};
        f13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        VkPhysicalDeviceFeatures2 f2{};
        f2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        f2.pNext = &f13;
        vkGetPhysicalDeviceFeatures2(gpu, &f2);

        if (req.dynamicRendering && !f13.dynamicRendering) c.missing.push_back("dynamicRendering");
        if (req.sync2 && !f13.synchronization2)            c.missing.push_back("synchronization2");
    }

    std::uint32_t extCount = 0;
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &extCount, nullptr);
    std::vector<VkExtensionProperties> available(extCount);
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &extCount, available.data());
    for (const char* ext : req.extensions) {
        if (!HasExtension(available, ext)) c.missing.push_back(ext);
    }

    c.families = FindQueueFamilies(gpu, surface);
    if (c.families.graphics == UINT32_MAX) c.missing.push_back("graphics queue");
    if (c.families.present == UINT32_MAX)  c.missing.push_back("present queue for this surface");

    if (!c.missing.empty()) return c;

    c.score = 0;
    if (req.preferDiscrete && c.props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
        c.score += 1000;
    }
    // One family for both saves the ownership dance on every image.
    if (c.families.shared()) c.score += 100;
    return c;
}

std::string DescribeRejections(const std::vector<Candidate>& candidates) {
    std::string msg = "no GPU meets the requirements";
    for (const auto& c : candidates) {
        msg += "\n  - ";
        msg += c.props.deviceName;
        msg += ": missing ";
        for (std::size_t i = 0; i < c.missing.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += c.missing[i];
        }
    }
    return msg;
}

} // namespace

void Device::destroy() {
    if (device_ == VK_NULL_HANDLE) return;
    vkDestroyDevice(device_, nullptr);
    device_ = VK_NULL_HANDLE;
}

Device::~Device() { destroy(); }

Device::Device(Device&& o) noexcept
    : device_(std::exchange(o.device_, VK_NULL_HANDLE)),
      physicalDevice_(std::exchange(o.physicalDevice_, VK_NULL_HANDLE)),
      graphicsQueue_(std::exchange(o.graphicsQueue_, VK_NULL_HANDLE)),
      presentQueue_(std::exchange(o.presentQueue_, VK_NULL_HANDLE)),
      families_(std::exchange(o.families_, QueueFamilies{})),
      gpuName_(std::move(o.gpuName_)) {}

Device& Device::operator=(Device&& o) noexcept {
    if (this == &o) return *this;
    destroy();
    device_         = std::exchange(o.device_, VK_NULL_HANDLE);
    physicalDevice_ = std::exchange(o.physicalDevice_, VK_NULL_HANDLE);
    graphicsQueue_  = std::exchange(o.graphicsQueue_, VK_NULL_HANDLE);
    presentQueue_   = std::exchange(o.presentQueue_, VK_NULL_HANDLE);
    families_       = std::exchange(o.families_, QueueFamilies{});
    gpuName_        = std::move(o.gpuName_);
    return *this;
}

void Device::waitIdle() const {
    if (device_ == VK_NULL_HANDLE) return;
    VkResult vr = vkDeviceWaitIdle(device_);
    if (vr != VK_SUCCESS) {
        Error e{"wait for device idle", static_cast<std::int32_t>(vr), ""};
        std::fprintf(stderr, "[shaderpad] %s\n", e.format().c_str());
    }
}

DeviceBuilder::DeviceBuilder(const Instance& instance, const Surface& surface)
    : instance_(instance.vkInstance()), surface_(surface.vkSurface()) {}

DeviceBuilder& DeviceBuilder::needSwapchain() {
    req_.extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    return *this;
}

DeviceBuilder& DeviceBuilder::needDynamicRendering() {
    req_.dynamicRendering = true;
    return *this;
}

DeviceBuilder& DeviceBuilder::needSync2() {
    req_.sync2 = true;
    return *this;
}

DeviceBuilder& DeviceBuilder::preferDiscreteGpu() {
    req_.preferDiscrete = true;
    return *this;
}

Result<Device> DeviceBuilder::build() {
    std::uint32_t gpuCount = 0;
    VkResult vr = vkEnumeratePhysicalDevices(instance_, &gpuCount, nullptr);
    if (vr != VK_SUCCESS || gpuCount == 0) {
        return Error{"select GPU", static_cast<std::int32_t>(vr),
                     "no Vulkan-capable GPU found (is a Vulkan driver installed?)"};
    }
    std::vector<VkPhysicalDevice> gpus(gpuCount);
    vkEnumeratePhysicalDevices(instance_, &gpuCount, gpus.data());

    std::vector<Candidate> candidates;
    const Candidate* best = nullptr;
    candidates.reserve(gpus.size());
    for (auto gpu : gpus) {
        candidates.push_back(Evaluate(gpu, surface_, req_));
    }
    for (const auto& c : candidates) {
        if (c.score >= 0 && (best == nullptr || c.score > best->score)) best = &c;
    }
    if (best == nullptr) {
        return Error{"select GPU", 0, DescribeRejections(candidates)};
    }

    const QueueFamilies families = best->families;
    const float priority = 1.0f;

    VkDeviceQueueCreateInfo queueCIs[2]{};
    std::uint32_t queueCount = families.shared() ? 1 : 2;
    const std::uint32_t familyIndex[2] = {families.graphics, families.present};
    for (std::uint32_t i = 0; i < queueCount; ++i) {
        queueCIs[i].sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCIs[i].queueFamilyIndex = familyIndex[i];
        queueCIs[i].queueCount       = 1;
        queueCIs[i].pQueuePriorities = &priority;
    }

    VkPhysicalDeviceVulkan13Features enable13{};
    enable13.sType            = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    enable13.dynamicRendering = req_.dynamicRendering ? VK_TRUE : VK_FALSE;
    enable13.synchronization2 = req_.sync2 ? VK_TRUE : VK_FALSE;

    VkPhysicalDeviceFeatures2 enable{};
    enable.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    enable.pNext = &enable13;

    VkDeviceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.pNext                   = &enable;
    ci.queueCreateInfoCount    = queueCount;
    ci.pQueueCreateInfos       = queueCIs;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(req_.extensions.size());
    ci.ppEnabledExtensionNames = req_.extensions.data();

    Device dev;
    vr = vkCreateDevice(best->gpu, &ci, nullptr, &dev.device_);
    if (vr != VK_SUCCESS) {
        dev.device_ = VK_NULL_HANDLE;
        return Error{"create device", static_cast<std::int32_t>(vr),
                     std::string("vkCreateDevice failed on ") + best->props.deviceName};
    }

    dev.physicalDevice_ = best->gpu;
    dev.families_       = families;
    dev.gpuName_        = best->props.deviceName;
    vkGetDeviceQueue(dev.device_, families.graphics, 0, &dev.graphicsQueue_);
    vkGetDeviceQueue(dev.device_, families.present, 0, &dev.presentQueue_);

#ifndef NDEBUG
    std::fprintf(stderr, "[shaderpad] %zu GPU(s), picked %s (graphics family %u, present family %u)\n",
                 candidates.size(), dev.gpuName_.c_str(), families.graphics, families.present);
#endif
    return dev;
}

} // namespace shaderpad
