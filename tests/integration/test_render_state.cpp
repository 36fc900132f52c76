#include <shaderpad/shaderpad.hpp>

#include <vulkan/vulkan.h>

#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#ifndef SHADERPAD_SHADER_DIR
#error "SHADERPAD_SHADER_DIR must point at the bundled shaders"
#endif
#ifndef SHADERPAD_TEST_SHADER_DIR
#error "SHADERPAD_TEST_SHADER_DIR must point at the test shaders"
#endif

namespace {

bool near(float a, float b) { return std::fabs(a - b) < 1e-5f; }

// Overwrites dst with src, the way an editor saves over the watched file.
void replaceFile(const std::filesystem::path& src, const std::filesystem::path& dst) {
    std::error_code ec;
    std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
    assert(!ec);
}

} // namespace

int main() {
    const std::filesystem::path shaderDir     = SHADERPAD_SHADER_DIR;
    const std::filesystem::path testShaderDir = SHADERPAD_TEST_SHADER_DIR;

    const auto workDir = std::filesystem::temp_directory_path() / "shaderpad_test_render_state";
    std::filesystem::create_directories(workDir);
    const auto livePath = workDir / "live.glsl";
    replaceFile(shaderDir / "shader.glsl", livePath);

    auto app = shaderpad::App::create();
    assert(app.ok());

    auto window = app.value().createWindow("render state test", 640, 480);
    assert(window.ok());

    // A shader that does not build is a startup failure
    {
        shaderpad::Config bad;
        bad.shaderPath = testShaderDir / "invalid.glsl";
        auto state = shaderpad::RenderState::create(window.value(), bad);
        assert(!state.ok());
        assert(state.error().operation == "compile shader");
        std::printf("  invalid startup shader: ok\n");
    }

    shaderpad::Config config;
    config.shaderPath = livePath;

    auto created = shaderpad::RenderState::create(window.value(), config);
    assert(created.ok() && "RenderState::create failed");
    auto& state = created.value();

    {
        assert(state.shaderPath() == livePath);
        assert(state.pipelineGeneration() == 0);
        assert(state.reconfigureCount() == 0);
        assert(state.pipeline().vkPipeline() != VK_NULL_HANDLE);

        auto cfg = state.surfaceConfig();
        assert(cfg.width > 0 && cfg.height > 0);
        assert(cfg.format != VK_FORMAT_UNDEFINED);
        assert(cfg.presentMode == VK_PRESENT_MODE_FIFO_KHR);

        auto bg = state.backgroundColor();
        assert(bg.r == 0.1f && bg.g == 0.2f && bg.b == 0.3f && bg.a == 1.0f);
        std::printf("  create: ok\n");
    }

    {
        assert(shaderpad::drawFrame(state));
        assert(shaderpad::drawFrame(state));
        std::printf("  first frames: ok\n");
    }

    // Cursor at normalized (0.5, 0.25)
    {
        auto size = state.currentSize();

        shaderpad::Event move{};
        move.type   = shaderpad::EventType::MouseMoved;
        move.mouseX = static_cast<float>(size.width) * 0.5f;
        move.mouseY = static_cast<float>(size.height) * 0.25f;
        assert(state.input(move));

        auto bg = state.backgroundColor();
        assert(near(bg.r, 0.5f) && near(bg.g, 0.25f));
        assert(bg.b == 0.3f && bg.a == 1.0f);

        assert(state.update().ok());
        assert(near(state.mouseUniform().cursor.x, 0.5f));
        assert(near(state.mouseUniform().cursor.y, 0.75f));
        auto rendered = state.render();
        assert(rendered.ok() || shaderpad::handleFrameError(state, rendered.error()));

        shaderpad::Event key{};
        key.type    = shaderpad::EventType::KeyDown;
        key.keyCode = shaderpad::Key::Enter;
        assert(!state.input(key));

        shaderpad::Event resized{};
        resized.type = shaderpad::EventType::Resized;
        resized.size = size;
        assert(!state.input(resized));
        std::printf("  input: ok\n");
    }

    // Time only moves forward
    {
        std::uint32_t last = state.timeUniform().milliseconds;
        for (int i = 0; i < 5; ++i) {
            assert(shaderpad::drawFrame(state));
            assert(state.timeUniform().milliseconds >= last);
            last = state.timeUniform().milliseconds;
        }
        std::printf("  time uniform: ok\n");
    }

    // Broken file on reload: old pipeline stays
    {
        VkPipeline before = state.pipeline().vkPipeline();
        auto generation   = state.pipelineGeneration();

        replaceFile(testShaderDir / "invalid.glsl", livePath);
        auto r = state.reloadShader();
        assert(!r.ok());
        assert(state.pipeline().vkPipeline() == before);
        assert(state.pipelineGeneration() == generation);
        assert(shaderpad::drawFrame(state));

        replaceFile(testShaderDir / "extra_binding.glsl", livePath);
        assert(!state.reloadShader().ok());
        assert(state.pipeline().vkPipeline() == before);

        std::filesystem::remove(livePath);
        assert(!state.reloadShader().ok());
        assert(state.pipeline().vkPipeline() == before);
        assert(state.pipelineGeneration() == generation);
        assert(shaderpad::drawFrame(state));
        std::printf("  reload failure keeps pipeline: ok\n");
    }

    // Fixed file on reload: new pipeline, read fresh from disk
    {
        VkPipeline before = state.pipeline().vkPipeline();
        auto generation   = state.pipelineGeneration();

        replaceFile(testShaderDir / "solid.glsl", livePath);
        auto r = state.reloadShader();
        assert(r.ok());
        assert(state.pipelineGeneration() == generation + 1);
        assert(state.pipeline().vkPipeline() != VK_NULL_HANDLE);
        assert(state.pipeline().vkPipeline() != before);
        assert(shaderpad::drawFrame(state));

        replaceFile(shaderDir / "shader.glsl", livePath);
        assert(state.reloadShader().ok());
        assert(state.pipelineGeneration() == generation + 2);
        assert(shaderpad::drawFrame(state));
        std::printf("  reload success replaces pipeline: ok\n");
    }

    // Driver: events that stop the loop
    {
        shaderpad::Event quit{};
        quit.type = shaderpad::EventType::Quit;
        assert(!shaderpad::handleEvent(state, quit));

        shaderpad::Event close{};
        close.type = shaderpad::EventType::CloseRequested;
        assert(!shaderpad::handleEvent(state, close));

        shaderpad::Event escape{};
        escape.type    = shaderpad::EventType::KeyDown;
        escape.keyCode = shaderpad::Key::Escape;
        assert(!shaderpad::handleEvent(state, escape));

        shaderpad::Event released{};
        released.type    = shaderpad::EventType::KeyUp;
        released.keyCode = shaderpad::Key::Escape;
        assert(shaderpad::handleEvent(state, released));
        std::printf("  driver stop events: ok\n");
    }

    // Driver: Enter reloads, auto-repeat does not
    {
        auto generation = state.pipelineGeneration();
        replaceFile(testShaderDir / "solid.glsl", livePath);

        shaderpad::Event held{};
        held.type    = shaderpad::EventType::KeyDown;
        held.keyCode = shaderpad::Key::Enter;
        held.repeat  = true;
        assert(shaderpad::handleEvent(state, held));
        assert(state.pipelineGeneration() == generation);

        shaderpad::Event enter = held;
        enter.repeat = false;
        assert(shaderpad::handleEvent(state, enter));
        assert(state.pipelineGeneration() == generation + 1);

        // A broken file keeps the loop and the pipeline.
        replaceFile(testShaderDir / "invalid.glsl", livePath);
        assert(shaderpad::handleEvent(state, enter));
        assert(state.pipelineGeneration() == generation + 1);

        replaceFile(shaderDir / "shader.glsl", livePath);
        assert(shaderpad::drawFrame(state));
        std::printf("  driver reload key: ok\n");
    }

    // Driver: size events reach resize()
    {
        auto size  = state.currentSize();
        auto count = state.reconfigureCount();

        shaderpad::Event minimized{};
        minimized.type = shaderpad::EventType::Resized;
        minimized.size = {0, 0};
        assert(shaderpad::handleEvent(state, minimized));
        assert(state.reconfigureCount() == count);

        shaderpad::Event resized{};
        resized.type = shaderpad::EventType::Resized;
        resized.size = {320, 240};
        assert(shaderpad::handleEvent(state, resized));
        assert(state.reconfigureCount() == count + 1);
        assert(state.currentSize().width == 320 && state.currentSize().height == 240);

        shaderpad::Event scaled{};
        scaled.type = shaderpad::EventType::ScaleChanged;
        scaled.size = size;
        assert(shaderpad::handleEvent(state, scaled));
        assert(state.reconfigureCount() == count + 2);
        assert(state.currentSize().width == size.width);
        std::printf("  driver size events: ok\n");
    }

    // Driver: each frame failure class picks its action
    {
        auto count = state.reconfigureCount();

        shaderpad::Error outOfDate{"acquire image", VK_ERROR_OUT_OF_DATE_KHR, "stale"};
        assert(shaderpad::handleFrameError(state, outOfDate));
        assert(state.reconfigureCount() == count + 1);

        shaderpad::Error surfaceLost{"present", VK_ERROR_SURFACE_LOST_KHR, ""};
        assert(shaderpad::handleFrameError(state, surfaceLost));
        assert(state.reconfigureCount() == count + 2);

        shaderpad::Error transient{"present", VK_ERROR_UNKNOWN, ""};
        assert(shaderpad::handleFrameError(state, transient));
        assert(state.reconfigureCount() == count + 2);

        shaderpad::Error deviceLost{"submit frame", VK_ERROR_DEVICE_LOST, ""};
        assert(!shaderpad::handleFrameError(state, deviceLost));
        shaderpad::Error noMemory{"acquire image", VK_ERROR_OUT_OF_DEVICE_MEMORY, ""};
        assert(!shaderpad::handleFrameError(state, noMemory));
        assert(state.reconfigureCount() == count + 2);

        // Still draws after the rebuilds.
        assert(shaderpad::drawFrame(state));
        std::printf("  driver frame failures: ok\n");
    }

    // Resize
    {
        auto size  = state.currentSize();
        auto count = state.reconfigureCount();

        assert(state.resize({0, 0}).ok());
        assert(state.resize({0, 480}).ok());
        assert(state.resize({640, 0}).ok());
        assert(state.currentSize().width == size.width);
        assert(state.currentSize().height == size.height);
        assert(state.reconfigureCount() == count);

        assert(state.resize({size.width, size.height}).ok());
        assert(state.reconfigureCount() == count + 1);
        assert(state.currentSize().width == size.width);

        assert(state.resize({320, 240}).ok());
        assert(state.reconfigureCount() == count + 2);
        assert(state.currentSize().width == 320 && state.currentSize().height == 240);

        assert(state.resize(size).ok());
        assert(shaderpad::drawFrame(state));
        std::printf("  resize: ok\n");
    }

    std::error_code ec;
    std::filesystem::remove_all(workDir, ec);

    std::printf("render state test passed\n");
    return 0;
}
