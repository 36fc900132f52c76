#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace shaderpad {

class Window;
class AppImpl;

// Owns SDL video initialization. Create one App before any window.
// Translates SDL events and routes them to per-window queues.
class App {
public:
    [[nodiscard]] static Result<App> create();

    ~App();
    App(App&&) noexcept;
    App& operator=(App&&) noexcept;
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Resizable, Vulkan-capable, HiDPI-aware window.
    [[nodiscard]] Result<Window> createWindow(std::string_view title,
                                              std::uint32_t width,
                                              std::uint32_t height);

    void pumpEvents();

private:
    friend class Window;
    App() = default;
    void registerWindow(Window* w);
    void unregisterWindow(Window* w);
    void resetPump();

    std::unique_ptr<AppImpl> impl_;
};

} // namespace shaderpad
