#pragma once

#include <shaderpad/allocator.hpp>
#include <shaderpad/buffer.hpp>
#include <shaderpad/config.hpp>
#include <shaderpad/device.hpp>
#include <shaderpad/error.hpp>
#include <shaderpad/frame_input.hpp>
#include <shaderpad/frames.hpp>
#include <shaderpad/instance.hpp>
#include <shaderpad/pipeline.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/shader_compiler.hpp>
#include <shaderpad/surface.hpp>
#include <shaderpad/swapchain.hpp>
#include <shaderpad/uniform_binding.hpp>
#include <shaderpad/uniforms.hpp>
#include <shaderpad/window.hpp>

#include <vulkan/vulkan.h>

#include <glm/vec4.hpp>

#include <cstdint>
#include <filesystem>

namespace shaderpad {

// Current surface configuration as the swapchain was last built.
struct SurfaceConfig {
    std::uint32_t    width       = 0;
    std::uint32_t    height      = 0;
    VkPresentModeKHR presentMode = VK_PRESENT_MODE_FIFO_KHR;
    VkFormat         format      = VK_FORMAT_UNDEFINED;
};

// Everything needed to draw the shader quad into one window.
//
// Members are declared in dependency order, so destruction releases the
// pipeline and buffers first and the device, surface and instance last.
// The window must outlive the RenderState.
//
// Per event-loop iteration: input() for each event, then update(), then
// render(). Exactly one frame is in flight; update() waits for it before
// writing the uniform buffers.
//
// Thread safety: thread-confined (event loop thread).
class RenderState {
public:
    // Blocking. Builds the instance, device, swapchain and buffers, then
    // compiles config.shaderPath. Any failure, including a shader that does
    // not build, is returned.
    [[nodiscard]] static Result<RenderState> create(const Window& window, const Config& config);

    ~RenderState();
    RenderState(RenderState&&) noexcept = default;
    // Member-wise assignment would destroy the old instance before the old
    // device. Construct a new state instead.
    RenderState& operator=(RenderState&&) = delete;
    RenderState(const RenderState&) = delete;
    RenderState& operator=(const RenderState&) = delete;

    // Consumes MouseMoved (updates the mouse uniform and the clear color).
    // Returns false for everything else.
    bool input(const Event& event);

    // No-op when either dimension is zero. Otherwise stores the size and
    // rebuilds the swapchain once.
    [[nodiscard]] Result<void> resize(Size newSize);

    // Reads the shader file again and builds a new pipeline against the
    // existing layout. The live pipeline is replaced only on success.
    [[nodiscard]] Result<void> reloadShader();

    // Waits for the in-flight frame, then refreshes and uploads the time
    // and mouse uniforms.
    [[nodiscard]] Result<void> update();

    // Acquire, record, submit, present. Errors carry the VkResult so
    // classifyFrameError() can pick the recovery.
    [[nodiscard]] Result<void> render();

    [[nodiscard]] Size                         currentSize()        const { return frameInput_.size(); }
    [[nodiscard]] SurfaceConfig                surfaceConfig()      const;
    [[nodiscard]] glm::vec4                    backgroundColor()    const { return frameInput_.background(); }
    [[nodiscard]] const Pipeline&              pipeline()           const { return pipeline_; }
    [[nodiscard]] std::uint64_t                pipelineGeneration() const { return generation_; }
    [[nodiscard]] std::uint64_t                reconfigureCount()   const { return reconfigures_; }
    [[nodiscard]] const std::filesystem::path& shaderPath()         const { return shaderPath_; }

    [[nodiscard]] const TimeUniform&  timeUniform()  const { return time_.value(); }
    [[nodiscard]] const MouseUniform& mouseUniform() const { return mouse_.value(); }

    [[nodiscard]] const Device& device() const { return device_; }

private:
    RenderState(Instance instance, Surface surface, Device device, Allocator allocator,
                Swapchain swapchain, FrameSync frames, Buffer vertexBuffer, Buffer indexBuffer,
                UniformBinding<TimeUniform> time, UniformBinding<MouseUniform> mouse,
                PipelineLayout layout, ShaderCompiler compiler, Pipeline pipeline,
                Size size, std::filesystem::path shaderPath);

    [[nodiscard]] Result<void> reconfigure(Size size);
    void discardAcquired();
    void record(VkCommandBuffer cmd, const SwapchainImage& img) const;

    Instance                     instance_;
    Surface                      surface_;
    Device                       device_;
    Allocator                    allocator_;
    Swapchain                    swapchain_;
    FrameSync                    frames_;
    Buffer                       vertexBuffer_;
    Buffer                       indexBuffer_;
    UniformBinding<TimeUniform>  time_;
    UniformBinding<MouseUniform> mouse_;
    PipelineLayout               layout_;
    ShaderCompiler               compiler_;
    Pipeline                     pipeline_;

    FrameInput            frameInput_;
    std::filesystem::path shaderPath_;
    Clock::time_point     start_;
    Frame                 frame_;
    bool                  frameWaited_  = false;
    std::uint64_t         generation_   = 0;
    std::uint64_t         reconfigures_ = 0;
};

} // namespace shaderpad
