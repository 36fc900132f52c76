#include <shaderpad/app.hpp>
#include <shaderpad/window.hpp>

#include <SDL3/SDL.h>

#include <cassert>
#include <cstdio>
#include <string>

int main() {
    auto appResult = shaderpad::App::create();
    assert(appResult.ok() && "App::create failed");
    auto app = std::move(appResult.value());

    auto result = app.createWindow("shaderpad test", 640, 480);
    assert(result.ok() && "window creation failed");
    auto window = std::move(result.value());

    assert(window.sdlWindow() != nullptr);
    assert(window.windowId() != 0);
    std::printf("  create: ok\n");

    {
        auto setTitle = window.setTitle("shaderpad - shader.glsl");
        assert(setTitle.ok());
        assert(std::string(SDL_GetWindowTitle(window.sdlWindow())) == "shaderpad - shader.glsl");
        std::printf("  title: ok\n");
    }

    // The keys the loop reacts to
    {
        int esc = shaderpad::scancodeFromKey(shaderpad::Key::Escape);
        assert(esc == SDL_SCANCODE_ESCAPE);
        assert(shaderpad::keyFromScancode(esc) == shaderpad::Key::Escape);

        int enter = shaderpad::scancodeFromKey(shaderpad::Key::Enter);
        assert(enter == SDL_SCANCODE_RETURN);
        assert(shaderpad::keyFromScancode(enter) == shaderpad::Key::Enter);
        assert(shaderpad::keyFromScancode(SDL_SCANCODE_KP_ENTER) == shaderpad::Key::Enter);

        assert(shaderpad::keyFromScancode(SDL_SCANCODE_A) == shaderpad::Key::Unknown);
        assert(shaderpad::keyFromScancode(0x7fffffff) == shaderpad::Key::Unknown);
        assert(shaderpad::scancodeFromKey(shaderpad::Key::Unknown) == SDL_SCANCODE_UNKNOWN);
        std::printf("  key mapping: ok\n");
    }

    {
        auto size = window.pixelSize();
        float density = window.pixelDensity();
        assert(density > 0.0f);
        assert(!size.empty());
        std::printf("  pixel size: %ux%u (density %.2f): ok\n", size.width, size.height, density);
    }

    // Synthetic motion comes back as a MouseMoved event in pixels
    {
        shaderpad::Event event{};
        while (window.pollEvent(event)) {}

        SDL_Event motion{};
        motion.type            = SDL_EVENT_MOUSE_MOTION;
        motion.motion.windowID = window.windowId();
        motion.motion.x        = 100.0f;
        motion.motion.y        = 50.0f;
        assert(SDL_PushEvent(&motion));

        bool seen = false;
        while (window.pollEvent(event)) {
            if (event.type == shaderpad::EventType::MouseMoved) {
                float density = window.pixelDensity();
                assert(event.mouseX == 100.0f * density);
                assert(event.mouseY == 50.0f * density);
                seen = true;
            }
        }
        assert(seen);
        std::printf("  mouse motion: ok\n");
    }

    // Synthetic key press
    {
        SDL_Event key{};
        key.type         = SDL_EVENT_KEY_DOWN;
        key.key.windowID = window.windowId();
        key.key.scancode = SDL_SCANCODE_RETURN;
        key.key.down     = true;
        assert(SDL_PushEvent(&key));

        shaderpad::Event event{};
        bool seen = false;
        while (window.pollEvent(event)) {
            if (event.type == shaderpad::EventType::KeyDown) {
                assert(event.keyCode == shaderpad::Key::Enter);
                assert(!event.repeat);
                seen = true;
            }
        }
        assert(seen);
        std::printf("  key down: ok\n");
    }

    std::printf("window test passed\n");
    return 0;
}
