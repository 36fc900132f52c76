#include <shaderpad/render_state.hpp>

#include <shaderpad/barriers.hpp>
#include <shaderpad/geometry.hpp>
#include <shaderpad/hot_swap.hpp>
#include <shaderpad/shader_pipeline.hpp>

#include <cstdio>
#include <utility>

namespace shaderpad {

Result<RenderState> RenderState::create(const Window& window, const Config& config) {
    Size size = window.pixelSize();
    if (size.empty()) {
        return Error{"create render state", 0, "window has a zero-sized drawable"};
    }

    auto instance = InstanceBuilder{}
        .appName("shaderpad")
        .enableWindowSupport()
        .build();
    if (!instance.ok()) return std::move(instance).error();

    auto surface = Surface::create(instance.value(), window);
    if (!surface.ok()) return std::move(surface).error();

    auto device = DeviceBuilder(instance.value(), surface.value())
        .needSwapchain()
        .needDynamicRendering()
        .needSync2()
        .preferDiscreteGpu()
        .build();
    if (!device.ok()) return std::move(device).error();

    std::fprintf(stderr, "[shaderpad] rendering on %s\n", device.value().gpuName());

    auto swapchain = SwapchainBuilder(device.value(), surface.value())
        .size(size)
        .build();
    if (!swapchain.ok()) return std::move(swapchain).error();

    auto frames = FrameSync::create(device.value(), 1);
    if (!frames.ok()) return std::move(frames).error();

    auto allocator = Allocator::create(instance.value(), device.value());
    if (!allocator.ok()) return std::move(allocator).error();

    auto vertexBuffer = uploadVertexBuffer(allocator.value(), device.value(),
                                           kQuadVertices.data(), quadVertexBytes());
    if (!vertexBuffer.ok()) return std::move(vertexBuffer).error();

    auto indexBuffer = uploadIndexBuffer(allocator.value(), device.value(),
                                         kQuadIndices.data(), quadIndexBytes());
    if (!indexBuffer.ok()) return std::move(indexBuffer).error();

    auto time = UniformBinding<TimeUniform>::create(device.value(), allocator.value(),
                                                    TimeUniform{});
    if (!time.ok()) return std::move(time).error();

    auto mouse = UniformBinding<MouseUniform>::create(device.value(), allocator.value(),
                                                      MouseUniform{});
    if (!mouse.ok()) return std::move(mouse).error();

    // Set numbers follow vector order: time is set 0, mouse is set 1.
    auto layout = PipelineLayout::create(device.value(), {
        time.value().vkDescriptorSetLayout(),
        mouse.value().vkDescriptorSetLayout(),
    });
    if (!layout.ok()) return std::move(layout).error();

    ShaderCompiler compiler;

    std::fprintf(stderr, "[shaderpad] shader: %s\n", config.shaderPath.string().c_str());
    auto pipeline = buildShaderPipeline(device.value(), compiler, layout.value(),
                                        swapchain.value().format(), config.shaderPath);
    if (!pipeline.ok()) return std::move(pipeline).error();

    return RenderState(std::move(instance).value(), std::move(surface).value(),
                       std::move(device).value(), std::move(allocator).value(),
                       std::move(swapchain).value(), std::move(frames).value(),
                       std::move(vertexBuffer).value(), std::move(indexBuffer).value(),
                       std::move(time).value(), std::move(mouse).value(),
                       std::move(layout).value(), std::move(compiler),
                       std::move(pipeline).value(), size, config.shaderPath);
}

RenderState::RenderState(Instance instance, Surface surface, Device device, Allocator allocator,
                         Swapchain swapchain, FrameSync frames, Buffer vertexBuffer,
                         Buffer indexBuffer, UniformBinding<TimeUniform> time,
                         UniformBinding<MouseUniform> mouse, PipelineLayout layout,
                         ShaderCompiler compiler, Pipeline pipeline, Size size,
                         std::filesystem::path shaderPath)
    : instance_(std::move(instance)),
      surface_(std::move(surface)),
      device_(std::move(device)),
      allocator_(std::move(allocator)),
      swapchain_(std::move(swapchain)),
      frames_(std::move(frames)),
      vertexBuffer_(std::move(vertexBuffer)),
      indexBuffer_(std::move(indexBuffer)),
      time_(std::move(time)),
      mouse_(std::move(mouse)),
      layout_(std::move(layout)),
      compiler_(std::move(compiler)),
      pipeline_(std::move(pipeline)),
      frameInput_(size),
      shaderPath_(std::move(shaderPath)),
      start_(Clock::now()) {}

RenderState::~RenderState() {
    // Nothing may still be executing when the members below start to go.
    device_.waitIdle();
}

SurfaceConfig RenderState::surfaceConfig() const {
    VkExtent2D extent = swapchain_.extent();
    return SurfaceConfig{extent.width, extent.height,
                         swapchain_.presentMode(), swapchain_.format()};
}

bool RenderState::input(const Event& event) {
    if (event.type != EventType::MouseMoved) {
        return false;
    }
    frameInput_.cursorMoved(event.mouseX, event.mouseY);
    return true;
}

Result<void> RenderState::reconfigure(Size size) {
    device_.waitIdle();
    auto r = swapchain_.recreate(size);
    if (!r.ok()) return r;

    ++reconfigures_;
    VkExtent2D extent = swapchain_.extent();
    std::fprintf(stderr, "[shaderpad] swapchain reconfigured: %ux%u\n",
                 extent.width, extent.height);
    return {};
}

Result<void> RenderState::resize(Size newSize) {
    if (!frameInput_.resize(newSize)) {
        return {};
    }
    return reconfigure(newSize);
}

Result<void> RenderState::reloadShader() {
    std::fprintf(stderr, "[shaderpad] reloading shader: %s\n", shaderPath_.string().c_str());

    auto candidate = buildShaderPipeline(device_, compiler_, layout_,
                                         swapchain_.format(), shaderPath_);

    // The old pipeline may still be referenced by the frame in flight.
    auto swapped = replaceIfOk(pipeline_, std::move(candidate),
                               [this] { device_.waitIdle(); });
    if (!swapped.ok()) {
        std::fprintf(stderr, "[shaderpad] shader reload failed: %s\n",
                     swapped.error().format().c_str());
        return swapped;
    }

    ++generation_;
    std::fprintf(stderr, "[shaderpad] shader reloaded (generation %llu)\n",
                 static_cast<unsigned long long>(generation_));
    return {};
}

Result<void> RenderState::update() {
    if (!frameWaited_) {
        auto frame = frames_.nextFrame();
        if (!frame.ok()) return std::move(frame).error();
        frame_       = frame.value();
        frameWaited_ = true;
    }

    time_.value().update(start_, Clock::now());
    mouse_.value() = frameInput_.mouse();

    auto r = time_.upload();
    if (!r.ok()) return r;
    return mouse_.upload();
}

void RenderState::record(VkCommandBuffer cmd, const SwapchainImage& img) const {
    VkExtent2D extent = swapchain_.extent();
    glm::vec4  bg     = frameInput_.background();

    transitionToColorAttachment(cmd, img.image);

    VkRenderingAttachmentInfo colorAttachment{};
    colorAttachment.sType       = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    colorAttachment.imageView   = img.view;
    colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    colorAttachment.loadOp      = VK_ATTACHMENT_LOAD_OP_CLEAR;
    colorAttachment.storeOp     = VK_ATTACHMENT_STORE_OP_STORE;
    colorAttachment.clearValue.color = {{bg.r, bg.g, bg.b, bg.a}};

    VkRenderingInfo renderInfo{};
    renderInfo.sType                = VK_STRUCTURE_TYPE_RENDERING_INFO;
    renderInfo.renderArea           = {{0, 0}, extent};
    renderInfo.layerCount           = 1;
    renderInfo.colorAttachmentCount = 1;
    renderInfo.pColorAttachments    = &colorAttachment;

    vkCmdBeginRendering(cmd, &renderInfo);

    // Negative height flips y so clip space is y up, matching the quad's
    // winding and the mouse uniform.
    VkViewport viewport{};
    viewport.x        = 0.0f;
    viewport.y        = static_cast<float>(extent.height);
    viewport.width    = static_cast<float>(extent.width);
    viewport.height   = -static_cast<float>(extent.height);
    viewport.maxDepth = 1.0f;
    vkCmdSetViewport(cmd, 0, 1, &viewport);

    VkRect2D scissor{{0, 0}, extent};
    vkCmdSetScissor(cmd, 0, 1, &scissor);

    pipeline_.bind(cmd);
    pipeline_.bindDescriptorSets(cmd, 0, {time_.vkDescriptorSet(), mouse_.vkDescriptorSet()});

    VkBuffer     vb     = vertexBuffer_.vkBuffer();
    VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(cmd, kVertexBinding, 1, &vb, &offset);
    vkCmdBindIndexBuffer(cmd, indexBuffer_.vkBuffer(), 0, kQuadIndexType);
    vkCmdDrawIndexed(cmd, static_cast<std::uint32_t>(kQuadIndices.size()), 1, 0, 0, 0);

    vkCmdEndRendering(cmd);

    transitionToPresent(cmd, img.image);
}

void RenderState::discardAcquired() {
    // The acquired image's semaphore has a signal pending that nothing will
    // wait on, and the slot's fence may be unsignaled. Rebuilding the
    // swapchain replaces its semaphores; recycling replaces the fence.
    device_.waitIdle();
    auto recycled = frames_.recycle(frame_);
    if (!recycled.ok()) {
        std::fprintf(stderr, "[shaderpad] %s\n", recycled.error().format().c_str());
    }
    auto rebuilt = reconfigure(frameInput_.size());
    if (!rebuilt.ok()) {
        std::fprintf(stderr, "[shaderpad] %s\n", rebuilt.error().format().c_str());
    }
}

Result<void> RenderState::render() {
    if (!frameWaited_) {
        auto waited = frames_.nextFrame();
        if (!waited.ok()) return std::move(waited).error();
        frame_ = waited.value();
    }
    // Whatever happens below, the next frame waits on the fence again.
    frameWaited_ = false;

    // Begin before acquiring, so nothing that can fail sits between a
    // successful acquire and the submit except the submit itself.
    auto begun = frames_.beginFrame(frame_);
    if (!begun.ok()) return begun;

    auto img = swapchain_.nextImage();
    if (!img.ok()) return std::move(img).error();

    record(frame_.cmd, img.value());

    auto submitted = frames_.submit(device_.graphicsQueue(), frame_, img.value(),
                                    VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
    if (!submitted.ok()) {
        discardAcquired();
        return submitted;
    }

    VkResult vr = swapchain_.present(device_.presentQueue(), img.value());
    if (vr == VK_ERROR_OUT_OF_DATE_KHR || vr == VK_SUBOPTIMAL_KHR) {
        auto r = reconfigure(frameInput_.size());
#ifndef NDEBUG
        if (!r.ok()) {
            std::fprintf(stderr, "[shaderpad] recreate after present failed: %s\n",
                         r.error().format().c_str());
        }
#endif
        return r;
    }
    if (vr != VK_SUCCESS) {
        return Error{"present", static_cast<std::int32_t>(vr), "vkQueuePresentKHR failed"};
    }
    return {};
}

} // namespace shaderpad
