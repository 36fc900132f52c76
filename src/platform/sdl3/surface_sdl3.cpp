#include <shaderpad/surface.hpp>

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_vulkan.h>

#include <string>

namespace shaderpad {

std::vector<const char*> wsi::requiredInstanceExtensions() {
    Uint32 count = 0;
    const char* const* names = SDL_Vulkan_GetInstanceExtensions(&count);
    if (!names || count == 0) {
        return {VK_KHR_SURFACE_EXTENSION_NAME};
    }
    return {names, names + count};
}

void Surface::destroy() {
    if (surface_ != VK_NULL_HANDLE) {
        SDL_Vulkan_DestroySurface(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    instance_ = VK_NULL_HANDLE;
}

Surface::~Surface() { destroy(); }

Surface::Surface(Surface&& o) noexcept : instance_(o.instance_), surface_(o.surface_) {
    o.instance_ = VK_NULL_HANDLE;
    o.surface_  = VK_NULL_HANDLE;
}

Surface& Surface::operator=(Surface&& o) noexcept {
    if (this != &o) {
        destroy();
        instance_   = o.instance_;
        surface_    = o.surface_;
        o.instance_ = VK_NULL_HANDLE;
        o.surface_  = VK_NULL_HANDLE;
    }
    return *this;
}

Result<Surface> Surface::create(const Instance& instance, const Window& window) {
    Surface s;
    s.instance_ = instance.vkInstance();
    if (!SDL_Vulkan_CreateSurface(window.sdlWindow(), s.instance_, nullptr, &s.surface_)) {
        s.surface_ = VK_NULL_HANDLE;
        return Error{"create surface", 0,
                     std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError()};
    }
    return s;
}

} // namespace shaderpad
