#include <shaderpad/swapchain.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace shaderpad {

static VkExtent2D ClampExtent(const VkSurfaceCapabilitiesKHR& caps, Size size) {
    // currentExtent is authoritative unless the surface lets us choose.
    if (caps.currentExtent.width != UINT32_MAX) {
        return caps.currentExtent;
    }
    VkExtent2D extent;
    extent.width  = std::clamp(size.width, caps.minImageExtent.width, caps.maxImageExtent.width);
    extent.height = std::clamp(size.height, caps.minImageExtent.height, caps.maxImageExtent.height);
    return extent;
}

// First sRGB format with the nonlinear sRGB color space, else whatever the
// surface lists first.
static VkSurfaceFormatKHR ChooseFormat(const std::vector<VkSurfaceFormatKHR>& formats) {
    for (const auto& f : formats) {
        bool srgb = f.format == VK_FORMAT_B8G8R8A8_SRGB || f.format == VK_FORMAT_R8G8B8A8_SRGB;
        if (srgb && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
            return f;
        }
    }
    return formats.front();
}

static void FillSharing(VkSwapchainCreateInfoKHR& ci, const QueueFamilies& families,
                        std::uint32_t (&indices)[2]) {
    indices[0] = families.graphics;
    indices[1] = families.present;
    if (families.shared()) {
        ci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    } else {
        ci.imageSharingMode      = VK_SHARING_MODE_CONCURRENT;
        ci.queueFamilyIndexCount = 2;
        ci.pQueueFamilyIndices   = indices;
    }
}

void Swapchain::destroy() {
    destroySemaphores();
    destroyViews();
    if (swapchain_ != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device_, swapchain_, nullptr);
        swapchain_ = VK_NULL_HANDLE;
    }
}

Swapchain::~Swapchain() { destroy(); }

Swapchain::Swapchain(Swapchain&& o) noexcept
    : device_(o.device_), gpu_(o.gpu_), surface_(o.surface_),
      swapchain_(o.swapchain_), format_(o.format_),
      colorSpace_(o.colorSpace_), extent_(o.extent_),
      presentMode_(o.presentMode_),
      imageCountRequested_(o.imageCountRequested_),
      families_(o.families_),
      images_(std::move(o.images_)), views_(std::move(o.views_)),
      imageReadySems_(std::move(o.imageReadySems_)),
      renderDoneSems_(std::move(o.renderDoneSems_)),
      semIndex_(o.semIndex_) {
    o.swapchain_ = VK_NULL_HANDLE;
    o.device_    = VK_NULL_HANDLE;
}

Swapchain& Swapchain::operator=(Swapchain&& o) noexcept {
    if (this != &o) {
        destroy();
        device_              = o.device_;
        gpu_                 = o.gpu_;
        surface_             = o.surface_;
        swapchain_           = o.swapchain_;
        format_              = o.format_;
        colorSpace_          = o.colorSpace_;
        extent_              = o.extent_;
        presentMode_         = o.presentMode_;
        imageCountRequested_ = o.imageCountRequested_;
        families_            = o.families_;
        images_              = std::move(o.images_);
        views_               = std::move(o.views_);
        imageReadySems_      = std::move(o.imageReadySems_);
        renderDoneSems_      = std::move(o.renderDoneSems_);
        semIndex_            = o.semIndex_;
        o.swapchain_ = VK_NULL_HANDLE;
        o.device_    = VK_NULL_HANDLE;
    }
    return *this;
}

void Swapchain::destroyViews() {
    for (auto v : views_) {
        if (v != VK_NULL_HANDLE) {
            vkDestroyImageView(device_, v, nullptr);
        }
    }
    views_.clear();
}

Result<void> Swapchain::createViews() {
    views_.assign(images_.size(), VK_NULL_HANDLE);
    for (std::size_t i = 0; i < images_.size(); ++i) {
        VkImageViewCreateInfo ci{};
        ci.sType    = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        ci.image    = images_[i];
        ci.viewType = VK_IMAGE_VIEW_TYPE_2D;
        ci.format   = format_;
        ci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        ci.subresourceRange.levelCount = 1;
        ci.subresourceRange.layerCount = 1;

        VkResult vr = vkCreateImageView(device_, &ci, nullptr, &views_[i]);
        if (vr != VK_SUCCESS) {
            views_[i] = VK_NULL_HANDLE;
            destroyViews();
            return Error{"create swapchain image view", static_cast<std::int32_t>(vr),
                         "vkCreateImageView failed for swapchain image " + std::to_string(i)};
        }
    }
    return {};
}

void Swapchain::destroySemaphores() {
    for (auto* sems : {&imageReadySems_, &renderDoneSems_}) {
        for (auto s : *sems) {
            if (s != VK_NULL_HANDLE) {
                vkDestroySemaphore(device_, s, nullptr);
            }
        }
        sems->clear();
    }
}

Result<void> Swapchain::createSemaphores() {
    destroySemaphores();
    imageReadySems_.assign(images_.size(), VK_NULL_HANDLE);
    renderDoneSems_.assign(images_.size(), VK_NULL_HANDLE);

    VkSemaphoreCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    for (std::size_t i = 0; i < images_.size(); ++i) {
        VkResult vr = vkCreateSemaphore(device_, &ci, nullptr, &imageReadySems_[i]);
        if (vr == VK_SUCCESS) {
            vr = vkCreateSemaphore(device_, &ci, nullptr, &renderDoneSems_[i]);
        }
        if (vr != VK_SUCCESS) {
            destroySemaphores();
            return Error{"create swapchain semaphore", static_cast<std::int32_t>(vr),
                         "vkCreateSemaphore failed for image " + std::to_string(i)};
        }
    }
    semIndex_ = 0;
    return {};
}

Result<void> Swapchain::fetchImages() {
    std::uint32_t count = 0;
    VkResult vr = vkGetSwapchainImagesKHR(device_, swapchain_, &count, nullptr);
    if (vr == VK_SUCCESS) {
        images_.resize(count);
        vr = vkGetSwapchainImagesKHR(device_, swapchain_, &count, images_.data());
    }
    if (vr != VK_SUCCESS) {
        return Error{"get swapchain images", static_cast<std::int32_t>(vr),
                     "vkGetSwapchainImagesKHR failed"};
    }
    return {};
}

Result<SwapchainImage> Swapchain::nextImage() {
    VkSemaphore sem = imageReadySems_[semIndex_];

    std::uint32_t index = 0;
    VkResult vr = vkAcquireNextImageKHR(device_, swapchain_, UINT64_MAX,
                                        sem, VK_NULL_HANDLE, &index);

    if (vr == VK_ERROR_OUT_OF_DATE_KHR) {
        return Error{"acquire image", static_cast<std::int32_t>(vr),
                     "swapchain out of date, recreate it"};
    }
    if (vr != VK_SUCCESS && vr != VK_SUBOPTIMAL_KHR) {
        return Error{"acquire image", static_cast<std::int32_t>(vr),
                     "vkAcquireNextImageKHR failed"};
    }

    // Only advance once the semaphore is actually pending a signal.
    semIndex_ = (semIndex_ + 1) % static_cast<std::uint32_t>(imageReadySems_.size());
    return SwapchainImage{index, images_[index], views_[index], sem, renderDoneSems_[index]};
}

VkResult Swapchain::present(VkQueue presentQueue, const SwapchainImage& img) {
    VkPresentInfoKHR pi{};
    pi.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = 1;
    pi.pWaitSemaphores    = &img.renderDone;
    pi.swapchainCount     = 1;
    pi.pSwapchains        = &swapchain_;
    pi.pImageIndices      = &img.index;
    return vkQueuePresentKHR(presentQueue, &pi);
}

Result<void> Swapchain::recreate(Size newSize) {
    if (newSize.empty()) {
        return {};
    }

    VkSurfaceCapabilitiesKHR caps;
    VkResult vr = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu_, surface_, &caps);
    if (vr != VK_SUCCESS) {
        return Error{"recreate swapchain", static_cast<std::int32_t>(vr),
                     "vkGetPhysicalDeviceSurfaceCapabilitiesKHR failed"};
    }

    // Check before tearing anything down so a minimized window keeps a
    // usable swapchain.
    VkExtent2D extent = ClampExtent(caps, newSize);
    if (extent.width == 0 || extent.height == 0) {
        return {};
    }

    VkSwapchainCreateInfoKHR ci{};
    ci.sType            = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    ci.surface          = surface_;
    ci.minImageCount    = imageCountRequested_;
    ci.imageFormat      = format_;
    ci.imageColorSpace  = colorSpace_;
    ci.imageExtent      = extent;
    ci.imageArrayLayers = 1;
    ci.imageUsage       = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    ci.preTransform     = caps.currentTransform;
    ci.compositeAlpha   = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode      = presentMode_;
    ci.clipped          = VK_TRUE;
    ci.oldSwapchain     = swapchain_;

    std::uint32_t familyIndices[2];
    FillSharing(ci, families_, familyIndices);

    VkSwapchainKHR newSwapchain = VK_NULL_HANDLE;
    vr = vkCreateSwapchainKHR(device_, &ci, nullptr, &newSwapchain);
    if (vr != VK_SUCCESS) {
        return Error{"recreate swapchain", static_cast<std::int32_t>(vr),
                     "vkCreateSwapchainKHR failed during recreate"};
    }

    destroySemaphores();
    destroyViews();
    vkDestroySwapchainKHR(device_, swapchain_, nullptr);
    swapchain_ = newSwapchain;
    extent_    = extent;

    auto imgRes = fetchImages();
    if (!imgRes.ok()) return imgRes;

    auto viewRes = createViews();
    if (!viewRes.ok()) return viewRes;

    return createSemaphores();
}

SwapchainBuilder::SwapchainBuilder(const Device& device, const Surface& surface)
    : device_(device.vkDevice()),
      gpu_(device.vkPhysicalDevice()),
      surface_(surface.vkSurface()),
      families_(device.queueFamilies()) {}

SwapchainBuilder& SwapchainBuilder::size(Size windowPixelSize) {
    size_ = windowPixelSize;
    return *this;
}

SwapchainBuilder& SwapchainBuilder::forWindow(const Window& window) {
    return size(window.pixelSize());
}

Result<Swapchain> SwapchainBuilder::build() {
    VkSurfaceCapabilitiesKHR caps;
    VkResult vr = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu_, surface_, &caps);
    if (vr != VK_SUCCESS) {
        return Error{"create swapchain", static_cast<std::int32_t>(vr),
                     "vkGetPhysicalDeviceSurfaceCapabilitiesKHR failed"};
    }

    std::uint32_t formatCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(gpu_, surface_, &formatCount, nullptr);
    if (formatCount == 0) {
        return Error{"create swapchain", 0, "No surface formats available"};
    }
    std::vector<VkSurfaceFormatKHR> formats(formatCount);
    vkGetPhysicalDeviceSurfaceFormatsKHR(gpu_, surface_, &formatCount, formats.data());

    VkSurfaceFormatKHR chosen = ChooseFormat(formats);

    VkExtent2D extent = ClampExtent(caps, size_);
    if (extent.width == 0 || extent.height == 0) {
        return Error{"create swapchain", 0,
                     "window has no drawable area (" + std::to_string(size_.width) + "x" +
                     std::to_string(size_.height) + ")"};
    }

    std::uint32_t imgCount = caps.minImageCount + 1;
    if (caps.maxImageCount > 0 && imgCount > caps.maxImageCount) {
        imgCount = caps.maxImageCount;
    }

    VkSwapchainCreateInfoKHR ci{};
    ci.sType            = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    ci.surface          = surface_;
    ci.minImageCount    = imgCount;
    ci.imageFormat      = chosen.format;
    ci.imageColorSpace  = chosen.colorSpace;
    ci.imageExtent      = extent;
    ci.imageArrayLayers = 1;
    ci.imageUsage       = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    ci.preTransform     = caps.currentTransform;
    ci.compositeAlpha   = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode      = VK_PRESENT_MODE_FIFO_KHR;
    ci.clipped          = VK_TRUE;

    std::uint32_t familyIndices[2];
    FillSharing(ci, families_, familyIndices);

    Swapchain sc;
    sc.device_              = device_;
    sc.gpu_                 = gpu_;
    sc.surface_             = surface_;
    sc.format_              = chosen.format;
    sc.colorSpace_          = chosen.colorSpace;
    sc.extent_              = extent;
    sc.presentMode_         = VK_PRESENT_MODE_FIFO_KHR;
    sc.imageCountRequested_ = imgCount;
    sc.families_            = families_;

    vr = vkCreateSwapchainKHR(device_, &ci, nullptr, &sc.swapchain_);
    if (vr != VK_SUCCESS) {
        sc.swapchain_ = VK_NULL_HANDLE;
        return Error{"create swapchain", static_cast<std::int32_t>(vr),
                     "vkCreateSwapchainKHR failed"};
    }

    auto imgRes = sc.fetchImages();
    if (!imgRes.ok()) return imgRes.error();

    auto viewResult = sc.createViews();
    if (!viewResult.ok()) return viewResult.error();

    auto semResult = sc.createSemaphores();
    if (!semResult.ok()) return semResult.error();

    return sc;
}

} // namespace shaderpad
