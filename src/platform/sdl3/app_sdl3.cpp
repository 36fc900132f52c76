#include "window_impl.hpp"
#include <shaderpad/app.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace shaderpad {

class AppImpl {
public:
    std::vector<Window*> windows; // non-owning, for event routing
    bool pumped = false;          // set by pumpEvents(), cleared by resetPump()
};

Result<App> App::create() {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        return Error{"initialize SDL", 0, std::string("SDL_Init failed: ") + SDL_GetError()};
    }
    App app;
    app.impl_ = std::make_unique<AppImpl>();
    return app;
}

App::~App() {
    if (impl_) {
        impl_.reset();
        SDL_Quit();
    }
}

App::App(App&&) noexcept = default;
App& App::operator=(App&&) noexcept = default;

Result<Window> App::createWindow(std::string_view title, std::uint32_t width,
                                 std::uint32_t height) {
    std::string titleStr(title);

    SDL_Window* sdlWin = SDL_CreateWindow(
        titleStr.c_str(), static_cast<int>(width), static_cast<int>(height),
        SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
    if (!sdlWin) {
        return Error{"create window", 0, std::string("SDL_CreateWindow failed: ") + SDL_GetError()};
    }

    auto impl = std::make_unique<WindowImpl>();
    impl->sdlWindow = sdlWin;
    impl->windowId  = SDL_GetWindowID(sdlWin);

    return Window(std::move(impl), this);
}

static Size clampedSize(int w, int h) {
    return Size{static_cast<std::uint32_t>(std::max(w, 0)),
                static_cast<std::uint32_t>(std::max(h, 0))};
}

void App::pumpEvents() {
    if (impl_->pumped) return;
    impl_->pumped = true;

    auto find = [this](SDL_WindowID id) -> WindowImpl* {
        for (auto* w : impl_->windows) {
            if (w->windowId() == id) return w->impl_.get();
        }
        return nullptr;
    };

    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        Event e{};
        WindowImpl* target = nullptr;

        switch (ev.type) {
        case SDL_EVENT_QUIT:
            e.type = EventType::Quit;
            for (auto* w : impl_->windows) w->impl_->events.push(e);
            continue;

        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            target = find(ev.window.windowID);
            e.type = EventType::CloseRequested;
            break;

        // Zero sizes are forwarded; the consumer decides what a degenerate size means.
        case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            target = find(ev.window.windowID);
            e.type = EventType::Resized;
            e.size = clampedSize(ev.window.data1, ev.window.data2);
            break;

        case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
            target = find(ev.window.windowID);
            if (target) {
                int w = 0, h = 0;
                SDL_GetWindowSizeInPixels(target->sdlWindow, &w, &h);
                e.type = EventType::ScaleChanged;
                e.size = clampedSize(w, h);
            }
            break;

        case SDL_EVENT_KEY_DOWN:
        case SDL_EVENT_KEY_UP:
            target    = find(ev.key.windowID);
            e.type    = ev.type == SDL_EVENT_KEY_DOWN ? EventType::KeyDown : EventType::KeyUp;
            e.key     = static_cast<int>(ev.key.scancode);
            e.keyCode = keyFromScancode(e.key);
            e.repeat  = ev.key.repeat;
            break;

        // SDL reports motion in window coordinates; convert to pixels so it
        // normalizes against the drawable size.
        case SDL_EVENT_MOUSE_MOTION:
            target = find(ev.motion.windowID);
            if (target) {
                float density = SDL_GetWindowPixelDensity(target->sdlWindow);
                if (density <= 0.0f) density = 1.0f;
                e.type   = EventType::MouseMoved;
                e.mouseX = ev.motion.x * density;
                e.mouseY = ev.motion.y * density;
            }
            break;

        default:
            break;
        }

        if (target && e.type != EventType::None) {
            target->events.push(e);
        }
    }
}

void App::registerWindow(Window* w) {
    impl_->windows.push_back(w);
}

void App::unregisterWindow(Window* w) {
    std::erase(impl_->windows, w);
}

void App::resetPump() {
    impl_->pumped = false;
}

} // namespace shaderpad
