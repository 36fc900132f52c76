#include <shaderpad/instance.hpp>
#include <shaderpad/surface.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace shaderpad {

static constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

static VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/) {
    const char* level =
        (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) ? "ERROR" : "WARN";
    std::fprintf(stderr, "shaderpad [%s]: %s\n", level, data->pMessage);
    return VK_FALSE;
}

static VkDebugUtilsMessengerCreateInfoEXT MessengerInfo() {
    VkDebugUtilsMessengerCreateInfoEXT ci{};
    ci.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    ci.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    ci.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
    ci.pfnUserCallback = DebugCallback;
    return ci;
}

static bool HasLayer(const char* name) {
    std::uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    vkEnumerateInstanceLayerProperties(&count, layers.data());
    return std::any_of(layers.begin(), layers.end(), [&](const VkLayerProperties& l) {
        return std::strcmp(l.layerName, name) == 0;
    });
}

static bool HasExtension(const std::vector<VkExtensionProperties>& available, const char* name) {
    return std::any_of(available.begin(), available.end(), [&](const VkExtensionProperties& e) {
        return std::strcmp(e.extensionName, name) == 0;
    });
}

void Instance::destroy() {
    if (messenger_ != VK_NULL_HANDLE) {
        auto destroyFn = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroyFn) destroyFn(instance_, messenger_, nullptr);
        messenger_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
}

Instance::~Instance() { destroy(); }

Instance::Instance(Instance&& o) noexcept
    : instance_(std::exchange(o.instance_, VK_NULL_HANDLE)),
      messenger_(std::exchange(o.messenger_, VK_NULL_HANDLE)) {}

Instance& Instance::operator=(Instance&& o) noexcept {
    if (this == &o) return *this;
    destroy();
    instance_  = std::exchange(o.instance_, VK_NULL_HANDLE);
    messenger_ = std::exchange(o.messenger_, VK_NULL_HANDLE);
    return *this;
}

InstanceBuilder& InstanceBuilder::appName(std::string_view name) {
    appName_ = name;
    return *this;
}

InstanceBuilder& InstanceBuilder::validation(bool enable) {
    validate_ = enable;
    return *this;
}

InstanceBuilder& InstanceBuilder::enableWindowSupport() {
    windowSupport_ = true;
    return *this;
}

Result<Instance> InstanceBuilder::build() {
    std::vector<const char*> extensions;
    if (windowSupport_) {
        extensions = wsi::requiredInstanceExtensions();
    }

    std::uint32_t extCount = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &extCount, nullptr);
    std::vector<VkExtensionProperties> available(extCount);
    vkEnumerateInstanceExtensionProperties(nullptr, &extCount, available.data());

    for (auto* name : extensions) {
        if (!HasExtension(available, name)) {
            return Error{"create instance", 0,
                         "instance extension '" + std::string(name) + "' is not available. "
                         "Check that a Vulkan driver with window-system support is installed."};
        }
    }

    // Without the layer (release drivers, CI) we run unvalidated rather than fail.
    bool validate = validate_ && HasLayer(kValidationLayer) &&
                    HasExtension(available, VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    std::vector<const char*> layers;
    if (validate) {
        layers.push_back(kValidationLayer);
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    } else if (validate_) {
        std::fprintf(stderr, "[shaderpad] validation layer not found, continuing without it\n");
    }

    VkApplicationInfo appInfo{};
    appInfo.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName   = appName_.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.pEngineName        = "shaderpad";
    appInfo.apiVersion         = kVulkanApiVersion;

    VkInstanceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo        = &appInfo;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();
    ci.enabledLayerCount       = static_cast<std::uint32_t>(layers.size());
    ci.ppEnabledLayerNames     = layers.data();

    // Chained so vkCreateInstance/vkDestroyInstance are validated too.
    VkDebugUtilsMessengerCreateInfoEXT debugCI = MessengerInfo();
    if (validate) {
        ci.pNext = &debugCI;
    }

    Instance inst;
    VkResult vr = vkCreateInstance(&ci, nullptr, &inst.instance_);
    if (vr != VK_SUCCESS) {
        std::string msg = "vkCreateInstance failed";
        if (vr == VK_ERROR_INCOMPATIBLE_DRIVER) {
            msg = "the installed driver does not support Vulkan 1.3, try updating it";
        }
        return Error{"create instance", static_cast<std::int32_t>(vr), msg};
    }

    if (validate) {
        auto createFn = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(inst.instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (createFn) {
            vr = createFn(inst.instance_, &debugCI, nullptr, &inst.messenger_);
            if (vr != VK_SUCCESS) {
                inst.messenger_ = VK_NULL_HANDLE;
                Error e{"create debug messenger", static_cast<std::int32_t>(vr), ""};
                std::fprintf(stderr, "[shaderpad] %s, continuing without it\n",
                             e.format().c_str());
            }
        }
    }

    return inst;
}

} // namespace shaderpad
