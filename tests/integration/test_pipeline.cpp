#include <shaderpad/shaderpad.hpp>

#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdio>
#include <filesystem>
#include <string>

#ifndef SHADERPAD_SHADER_DIR
#error "SHADERPAD_SHADER_DIR must point at the bundled shaders"
#endif
#ifndef SHADERPAD_TEST_SHADER_DIR
#error "SHADERPAD_TEST_SHADER_DIR must point at the test shaders"
#endif

int main() {
    const std::filesystem::path shaderDir     = SHADERPAD_SHADER_DIR;
    const std::filesystem::path testShaderDir = SHADERPAD_TEST_SHADER_DIR;

    auto app = shaderpad::App::create();
    assert(app.ok());

    auto window = app.value().createWindow("pipeline test", 640, 480);
    assert(window.ok());

    auto instance = shaderpad::InstanceBuilder{}
        .appName("test_pipeline")
        .validation(false)
        .enableWindowSupport()
        .build();
    assert(instance.ok());

    auto surface = shaderpad::Surface::create(instance.value(), window.value());
    assert(surface.ok());

    auto device = shaderpad::DeviceBuilder(instance.value(), surface.value())
        .needSwapchain()
        .needDynamicRendering()
        .needSync2()
        .build();
    assert(device.ok());

    auto swapchain = shaderpad::SwapchainBuilder(device.value(), surface.value())
        .forWindow(window.value())
        .build();
    assert(swapchain.ok());

    assert(swapchain.value().presentMode() == VK_PRESENT_MODE_FIFO_KHR);

    // Recording may start before an image is acquired and be abandoned
    {
        auto frames = shaderpad::FrameSync::create(device.value(), 1);
        assert(frames.ok());

        auto frame = frames.value().nextFrame();
        assert(frame.ok());
        assert(frames.value().beginFrame(frame.value()).ok());
        assert(frames.value().beginFrame(frame.value()).ok());

        // The fence is still signaled, so this does not block.
        VkDevice vkDevice = device.value().vkDevice();
        assert(vkGetFenceStatus(vkDevice, frame.value().fence) == VK_SUCCESS);
        auto again = frames.value().nextFrame();
        assert(again.ok());
        assert(again.value().fence == frame.value().fence);
        std::printf("  abandoned recording: ok\n");
    }

    // A slot whose submit failed after the fence reset is made usable again
    {
        auto frames = shaderpad::FrameSync::create(device.value(), 1);
        assert(frames.ok());
        VkDevice vkDevice = device.value().vkDevice();

        auto frame = frames.value().nextFrame();
        assert(frame.ok());
        assert(frames.value().beginFrame(frame.value()).ok());
        assert(vkResetFences(vkDevice, 1, &frame.value().fence) == VK_SUCCESS);
        assert(vkGetFenceStatus(vkDevice, frame.value().fence) == VK_NOT_READY);

        assert(frames.value().recycle(frame.value()).ok());

        auto next = frames.value().nextFrame();
        assert(next.ok());
        assert(vkGetFenceStatus(vkDevice, next.value().fence) == VK_SUCCESS);

        // Twice on a stale handle is rejected.
        auto stale = frames.value().recycle(frame.value());
        assert(!stale.ok());
        assert(stale.error().operation == "recycle frame");
        std::printf("  recycle after failed submit: ok\n");
    }

    auto allocator = shaderpad::Allocator::create(instance.value(), device.value());
    assert(allocator.ok());

    auto time = shaderpad::UniformBinding<shaderpad::TimeUniform>::create(
        device.value(), allocator.value(), shaderpad::TimeUniform{});
    auto mouse = shaderpad::UniformBinding<shaderpad::MouseUniform>::create(
        device.value(), allocator.value(), shaderpad::MouseUniform{});
    assert(time.ok() && mouse.ok());

    {
        assert(time.value().buffer().mappedData() != nullptr);
        assert(time.value().buffer().size() == shaderpad::kUniformBlockBytes<shaderpad::TimeUniform>);
        assert(time.value().vkDescriptorSet() != VK_NULL_HANDLE);

        mouse.value().value().updatePosition(0.25f, 0.5f);
        assert(mouse.value().upload().ok());
        const auto* mapped = static_cast<const shaderpad::MouseUniform*>(
            mouse.value().buffer().mappedData());
        assert(mapped->cursor.x == 0.25f && mapped->cursor.y == 0.5f);
        std::printf("  uniform binding: ok\n");
    }

    // Descriptor set builder preconditions
    {
        auto empty = shaderpad::DescriptorSetBuilder(device.value()).build();
        assert(!empty.ok());

        VkBuffer vb = time.value().buffer().vkBuffer();
        auto twice = shaderpad::DescriptorSetBuilder(device.value())
            .uniformBuffer(0, VK_SHADER_STAGE_FRAGMENT_BIT, vb, 16)
            .uniformBuffer(0, VK_SHADER_STAGE_FRAGMENT_BIT, vb, 16)
            .build();
        assert(!twice.ok());
        assert(twice.error().message.find("added twice") != std::string::npos);

        auto noBuffer = shaderpad::DescriptorSetBuilder(device.value())
            .uniformBuffer(0, VK_SHADER_STAGE_FRAGMENT_BIT, VK_NULL_HANDLE, 16)
            .build();
        assert(!noBuffer.ok());

        auto two = shaderpad::DescriptorSetBuilder(device.value())
            .uniformBuffer(0, VK_SHADER_STAGE_FRAGMENT_BIT, vb, 16)
            .uniformBuffer(1, VK_SHADER_STAGE_VERTEX_BIT, mouse.value().buffer().vkBuffer(), 16)
            .build();
        assert(two.ok());
        assert(two.value().vkDescriptorSet() != VK_NULL_HANDLE);
        std::printf("  descriptor set builder: ok\n");
    }

    // GPU selection
    {
        assert(device.value().queueFamilies().valid());
        assert(device.value().gpuName()[0] != '\0');
        assert(device.value().graphicsQueue() != VK_NULL_HANDLE);
        assert(device.value().presentQueue() != VK_NULL_HANDLE);
        std::printf("  device selection: ok\n");
    }

    auto layout = shaderpad::PipelineLayout::create(device.value(), {
        time.value().vkDescriptorSetLayout(),
        mouse.value().vkDescriptorSetLayout(),
    });
    assert(layout.ok());
    assert(layout.value().setCount() == 2);

    shaderpad::ShaderCompiler compiler;
    const VkFormat format = swapchain.value().format();

    {
        auto result = shaderpad::buildShaderPipeline(device.value(), compiler, layout.value(),
                                                     format, shaderDir / "shader.glsl");
        assert(result.ok() && "bundled shader failed to build");
        assert(result.value().vkPipeline() != VK_NULL_HANDLE);
        assert(result.value().vkPipelineLayout() == layout.value().vkPipelineLayout());
        std::printf("  bundled shader: ok\n");
    }

    {
        auto result = shaderpad::buildShaderPipeline(device.value(), compiler, layout.value(),
                                                     format, testShaderDir / "solid.glsl");
        assert(result.ok());
        std::printf("  solid shader: ok\n");
    }

    {
        auto result = shaderpad::buildShaderPipeline(device.value(), compiler, layout.value(),
                                                     format, testShaderDir / "invalid.glsl");
        assert(!result.ok());
        assert(result.error().operation == "compile shader");
        std::printf("  invalid shader: ok\n");
    }

    {
        auto result = shaderpad::buildShaderPipeline(device.value(), compiler, layout.value(),
                                                     format, testShaderDir / "extra_binding.glsl");
        assert(!result.ok());
        assert(result.error().operation == "check shader interface");
        assert(result.error().message.find("extra_binding.glsl") != std::string::npos);
        std::printf("  interface mismatch: ok\n");
    }

    {
        auto result = shaderpad::buildShaderPipeline(device.value(), compiler, layout.value(),
                                                     format, testShaderDir / "missing.glsl");
        assert(!result.ok());
        assert(result.error().operation == "read shader");
        std::printf("  missing file: ok\n");
    }

    // Builder preconditions
    {
        auto noCode = shaderpad::PipelineBuilder(device.value())
            .colorFormat(format)
            .pipelineLayout(layout.value())
            .build();
        assert(!noCode.ok());

        auto src = shaderpad::readShaderSource(shaderDir / "shader.glsl");
        assert(src.ok());
        auto program = compiler.compileProgram(src.value(), "shader.glsl");
        assert(program.ok());

        auto noFormat = shaderpad::PipelineBuilder(device.value())
            .vertexCode(program.value().vertex)
            .fragmentCode(program.value().fragment)
            .pipelineLayout(layout.value())
            .build();
        assert(!noFormat.ok());
        std::printf("  builder preconditions: ok\n");
    }

    device.value().waitIdle();
    std::printf("pipeline test passed\n");
    return 0;
}
