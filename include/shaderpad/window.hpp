#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

struct SDL_Window; // no SDL.h in user code

namespace shaderpad {

struct Size {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;

    [[nodiscard]] bool empty() const { return width == 0 || height == 0; }
};

enum class Key {
    Unknown,
    Escape,
    Enter, // main Return key and keypad Enter
};

[[nodiscard]] Key keyFromScancode(int scancode);
[[nodiscard]] int scancodeFromKey(Key key);

enum class EventType {
    None,
    Quit,
    CloseRequested,
    Resized,      // drawable size changed, size may contain a zero dimension
    ScaleChanged, // display scale changed, size is the new pixel size
    KeyDown,
    KeyUp,
    MouseMoved,
};

struct Event {
    EventType type    = EventType::None;
    Size      size    = {};           // Resized, ScaleChanged
    int       key     = 0;            // raw scancode
    Key       keyCode = Key::Unknown; // KeyDown, KeyUp
    bool      repeat  = false;        // KeyDown from key auto-repeat
    float     mouseX  = 0.0f;         // MouseMoved, pixel coordinates
    float     mouseY  = 0.0f;
};

class App;
class WindowImpl;

class Window {
public:
    ~Window();
    Window(Window&&) noexcept;
    Window& operator=(Window&&) noexcept;
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Drain one event from this window's queue. Returns false when empty.
    // Pumps the SDL queue once per drain cycle.
    bool pollEvent(Event& event);

    // Drawable size in pixels (HiDPI aware).
    [[nodiscard]] Size pixelSize() const;

    // Pixels per logical unit, 1.0 on standard displays.
    [[nodiscard]] float pixelDensity() const;

    [[nodiscard]] Result<void> setTitle(std::string_view title);

    [[nodiscard]] SDL_Window*   sdlWindow() const;
    [[nodiscard]] std::uint32_t windowId() const;

private:
    friend class App;
    explicit Window(std::unique_ptr<WindowImpl> impl, App* app);

    std::unique_ptr<WindowImpl> impl_;
    App* app_ = nullptr;
};

} // namespace shaderpad
