#pragma once

#include <shaderpad/device.hpp>
#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/surface.hpp>
#include <shaderpad/window.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace shaderpad {

// Image returned by nextImage().
struct SwapchainImage {
    std::uint32_t index      = 0;
    VkImage       image      = VK_NULL_HANDLE;
    VkImageView   view       = VK_NULL_HANDLE;
    VkSemaphore   imageReady = VK_NULL_HANDLE; // signaled when the image is acquired
    VkSemaphore   renderDone = VK_NULL_HANDLE; // signal on submit, present waits on it
};

// RAII swapchain: the VkSwapchainKHR, its image views and the semaphores
// that pace acquire and present. Always FIFO (vsync), the one mode every
// surface supports; an sRGB format is picked when the surface offers one.
//
// renderDone semaphores are per image, not per frame: the presentation
// engine may still hold one after the frame fence signals, and it is only
// safe to reuse once the same image is acquired again.
//
// Thread safety: thread-confined (render loop thread).
class Swapchain {
public:
    ~Swapchain();
    Swapchain(Swapchain&&) noexcept;
    Swapchain& operator=(Swapchain&&) noexcept;
    Swapchain(const Swapchain&) = delete;
    Swapchain& operator=(const Swapchain&) = delete;

    [[nodiscard]] VkSwapchainKHR   vkSwapchain() const { return swapchain_; }
    [[nodiscard]] VkFormat         format()      const { return format_; }
    [[nodiscard]] VkExtent2D       extent()      const { return extent_; }
    [[nodiscard]] VkPresentModeKHR presentMode() const { return presentMode_; }

    // Error carries VK_ERROR_OUT_OF_DATE_KHR when the surface changed under us.
    [[nodiscard]] Result<SwapchainImage> nextImage();

    // Returns the raw VkResult so callers can tell SUBOPTIMAL from OUT_OF_DATE.
    [[nodiscard]] VkResult present(VkQueue presentQueue, const SwapchainImage& img);

    // Rebuilds for a new drawable size. Call after device.waitIdle().
    // A size the surface clamps to zero leaves the swapchain untouched.
    [[nodiscard]] Result<void> recreate(Size newSize);

private:
    friend class SwapchainBuilder;
    Swapchain() = default;

    void destroy();
    void destroyViews();
    void destroySemaphores();
    Result<void> createViews();
    Result<void> createSemaphores();
    Result<void> fetchImages();

    VkDevice                 device_      = VK_NULL_HANDLE;
    VkPhysicalDevice         gpu_         = VK_NULL_HANDLE;
    VkSurfaceKHR             surface_     = VK_NULL_HANDLE;
    VkSwapchainKHR           swapchain_   = VK_NULL_HANDLE;
    VkFormat                 format_      = VK_FORMAT_UNDEFINED;
    VkColorSpaceKHR          colorSpace_  = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    VkExtent2D               extent_      = {0, 0};
    VkPresentModeKHR         presentMode_ = VK_PRESENT_MODE_FIFO_KHR;
    std::uint32_t            imageCountRequested_ = 0;
    QueueFamilies            families_;
    std::vector<VkImage>     images_;
    std::vector<VkImageView> views_;
    std::vector<VkSemaphore> imageReadySems_; // round-robin, one per image
    std::vector<VkSemaphore> renderDoneSems_; // indexed by image index
    std::uint32_t            semIndex_ = 0;
};

class SwapchainBuilder {
public:
    SwapchainBuilder(const Device& device, const Surface& surface);

    SwapchainBuilder& size(Size windowPixelSize);
    SwapchainBuilder& forWindow(const Window& window);

    [[nodiscard]] Result<Swapchain> build();

private:
    VkDevice         device_  = VK_NULL_HANDLE;
    VkPhysicalDevice gpu_     = VK_NULL_HANDLE;
    VkSurfaceKHR     surface_ = VK_NULL_HANDLE;
    QueueFamilies    families_;
    Size             size_    = {0, 0};
};

} // namespace shaderpad
