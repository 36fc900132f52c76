#pragma once

// Shared by app_sdl3.cpp and window_sdl3.cpp. Not installed.

#include <shaderpad/window.hpp>

#include <SDL3/SDL.h>

#include <queue>

namespace shaderpad {

class WindowImpl {
public:
    SDL_Window*       sdlWindow = nullptr;
    SDL_WindowID      windowId  = 0;
    std::queue<Event> events;
};

} // namespace shaderpad
