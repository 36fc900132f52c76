#include "window_impl.hpp"
#include <shaderpad/app.hpp>

#include <string>

namespace shaderpad {

Key keyFromScancode(int scancode) {
    switch (scancode) {
    case SDL_SCANCODE_ESCAPE:   return Key::Escape;
    case SDL_SCANCODE_RETURN:   return Key::Enter;
    case SDL_SCANCODE_KP_ENTER: return Key::Enter;
    default:                    return Key::Unknown;
    }
}

int scancodeFromKey(Key key) {
    switch (key) {
    case Key::Escape:  return SDL_SCANCODE_ESCAPE;
    case Key::Enter:   return SDL_SCANCODE_RETURN;
    case Key::Unknown: break;
    }
    return SDL_SCANCODE_UNKNOWN;
}

Window::Window(std::unique_ptr<WindowImpl> impl, App* app)
    : impl_(std::move(impl)), app_(app) {
    if (app_) app_->registerWindow(this);
}

Window::~Window() {
    if (app_) app_->unregisterWindow(this);
    if (impl_ && impl_->sdlWindow) {
        SDL_DestroyWindow(impl_->sdlWindow);
    }
}

Window::Window(Window&& o) noexcept : impl_(std::move(o.impl_)), app_(o.app_) {
    o.app_ = nullptr;
    if (app_) {
        app_->unregisterWindow(&o);
        app_->registerWindow(this);
    }
}

Window& Window::operator=(Window&& o) noexcept {
    if (this != &o) {
        if (app_) app_->unregisterWindow(this);
        if (impl_ && impl_->sdlWindow) {
            SDL_DestroyWindow(impl_->sdlWindow);
        }

        impl_  = std::move(o.impl_);
        app_   = o.app_;
        o.app_ = nullptr;

        if (app_) {
            app_->unregisterWindow(&o);
            app_->registerWindow(this);
        }
    }
    return *this;
}

bool Window::pollEvent(Event& event) {
    if (!impl_) {
        event.type = EventType::None;
        return false;
    }

    if (impl_->events.empty() && app_) {
        app_->pumpEvents();
    }

    if (impl_->events.empty()) {
        event.type = EventType::None;
        // Drained: the next poll starts a new cycle and pumps again.
        if (app_) app_->resetPump();
        return false;
    }

    event = impl_->events.front();
    impl_->events.pop();
    return true;
}

Size Window::pixelSize() const {
    int w = 0, h = 0;
    SDL_GetWindowSizeInPixels(impl_->sdlWindow, &w, &h);
    return Size{static_cast<std::uint32_t>(w < 0 ? 0 : w),
                static_cast<std::uint32_t>(h < 0 ? 0 : h)};
}

float Window::pixelDensity() const {
    float d = SDL_GetWindowPixelDensity(impl_->sdlWindow);
    return d > 0.0f ? d : 1.0f;
}

Result<void> Window::setTitle(std::string_view title) {
    std::string titleStr(title);
    if (!SDL_SetWindowTitle(impl_->sdlWindow, titleStr.c_str())) {
        return Error{"set window title", 0,
                     std::string("SDL_SetWindowTitle failed: ") + SDL_GetError()};
    }
    return {};
}

SDL_Window* Window::sdlWindow() const {
    return impl_->sdlWindow;
}

std::uint32_t Window::windowId() const {
    return impl_->windowId;
}

} // namespace shaderpad
