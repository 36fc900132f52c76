#include <shaderpad/shaderpad.hpp>

#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitInit  = 1;
constexpr int kExitUsage = 2;

} // namespace

int main(int argc, char** argv) {
    const auto defaultShader = shaderpad::bundledShaderPath();

    auto config = shaderpad::parseArgs(argc, argv, defaultShader);
    if (!config.ok()) {
        std::fprintf(stderr, "shaderpad: %s\n\n%s", config.error().message.c_str(),
                     shaderpad::usage(argv[0], defaultShader).c_str());
        return kExitUsage;
    }
    if (config.value().showHelp) {
        std::printf("%s", shaderpad::usage(argv[0], defaultShader).c_str());
        return kExitOk;
    }

    auto app = shaderpad::App::create();
    if (!app.ok()) {
        std::fprintf(stderr, "%s\n", app.error().format().c_str());
        return kExitInit;
    }

    auto window = app.value().createWindow("shaderpad", 1280, 720);
    if (!window.ok()) {
        std::fprintf(stderr, "%s\n", window.error().format().c_str());
        return kExitInit;
    }

    auto state = shaderpad::RenderState::create(window.value(), config.value());
    if (!state.ok()) {
        std::fprintf(stderr, "%s\n", state.error().format().c_str());
        return kExitInit;
    }

    auto& win = window.value();
    auto& rs  = state.value();
    (void)win.setTitle("shaderpad - " + rs.shaderPath().filename().string());

    bool running = true;
    shaderpad::Event event;

    while (running) {
        while (running && win.pollEvent(event)) {
            if (rs.input(event)) {
                continue;
            }
            running = shaderpad::handleEvent(rs, event);
        }
        if (!running) {
            break;
        }

        // Minimized: nothing to present to.
        if (rs.currentSize().empty() || win.pixelSize().empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        running = shaderpad::drawFrame(rs);
    }

    rs.device().waitIdle();
    return kExitOk;
}
