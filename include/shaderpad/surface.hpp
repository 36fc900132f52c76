#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/instance.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/window.hpp>

#include <vulkan/vulkan.h>

#include <vector>

namespace shaderpad {

namespace wsi {

// Surface extensions SDL3 needs for this platform. Does not need a window.
[[nodiscard]] std::vector<const char*> requiredInstanceExtensions();

} // namespace wsi

// The drawable region of a Window as Vulkan sees it.
// Destroy before the Instance it came from.
//
// Thread safety: immutable after construction.
class Surface {
public:
    ~Surface();
    Surface(Surface&&) noexcept;
    Surface& operator=(Surface&&) noexcept;
    Surface(const Surface&) = delete;
    Surface& operator=(const Surface&) = delete;

    [[nodiscard]] static Result<Surface> create(const Instance& instance,
                                                 const Window& window);

    [[nodiscard]] VkSurfaceKHR vkSurface() const { return surface_; }

private:
    Surface() = default;
    void destroy();

    VkInstance   instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_  = VK_NULL_HANDLE;
};

} // namespace shaderpad
