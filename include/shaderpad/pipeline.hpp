#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <initializer_list>
#include <vector>

namespace shaderpad {

class Device;

// RAII VkPipelineLayout. Outlives every Pipeline built against it, so a
// rebuilt pipeline stays binding-compatible with the descriptor sets
// already in use.
//
// Thread safety: immutable after construction.
class PipelineLayout {
public:
    ~PipelineLayout();
    PipelineLayout(PipelineLayout&&) noexcept;
    PipelineLayout& operator=(PipelineLayout&&) noexcept;
    PipelineLayout(const PipelineLayout&) = delete;
    PipelineLayout& operator=(const PipelineLayout&) = delete;

    // setLayouts[i] becomes set i.
    [[nodiscard]] static Result<PipelineLayout> create(
        const Device& device, const std::vector<VkDescriptorSetLayout>& setLayouts);

    [[nodiscard]] VkPipelineLayout vkPipelineLayout() const { return layout_; }
    [[nodiscard]] std::uint32_t    setCount()         const { return setCount_; }

private:
    PipelineLayout() = default;
    void destroy();

    VkDevice         device_   = VK_NULL_HANDLE;
    VkPipelineLayout layout_   = VK_NULL_HANDLE;
    std::uint32_t    setCount_ = 0;
};

// RAII graphics pipeline. Does not own its layout.
//
// Thread safety: immutable after construction.
class Pipeline {
public:
    ~Pipeline();
    Pipeline(Pipeline&&) noexcept;
    Pipeline& operator=(Pipeline&&) noexcept;
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    [[nodiscard]] VkPipeline       vkPipeline()       const { return pipeline_; }
    [[nodiscard]] VkPipelineLayout vkPipelineLayout() const { return layout_; }

    void bind(VkCommandBuffer cmd) const;

    // Binds sets to consecutive set numbers starting at firstSet.
    void bindDescriptorSets(VkCommandBuffer cmd, std::uint32_t firstSet,
                            std::initializer_list<VkDescriptorSet> sets) const;

private:
    friend class PipelineBuilder;
    Pipeline() = default;
    void destroy();

    VkDevice         device_   = VK_NULL_HANDLE;
    VkPipeline       pipeline_ = VK_NULL_HANDLE;
    VkPipelineLayout layout_   = VK_NULL_HANDLE;
};

// Graphics pipeline for dynamic rendering (Vulkan 1.3, no VkRenderPass).
// Viewport and scissor are always dynamic.
class PipelineBuilder {
public:
    explicit PipelineBuilder(const Device& device);

    // SPIR-V words. The builder creates the modules and destroys them once
    // the pipeline exists.
    PipelineBuilder& vertexCode(std::vector<std::uint32_t> spirv);
    PipelineBuilder& fragmentCode(std::vector<std::uint32_t> spirv);

    PipelineBuilder& colorFormat(VkFormat format);

    PipelineBuilder& vertexBinding(std::uint32_t binding, std::uint32_t stride,
                                   VkVertexInputRate inputRate = VK_VERTEX_INPUT_RATE_VERTEX);
    PipelineBuilder& vertexAttribute(std::uint32_t location, std::uint32_t binding,
                                     VkFormat format, std::uint32_t offset);

    PipelineBuilder& topology(VkPrimitiveTopology t);
    PipelineBuilder& cullBack();
    PipelineBuilder& frontFace(VkFrontFace f);
    PipelineBuilder& pipelineLayout(const PipelineLayout& layout);

    [[nodiscard]] Result<Pipeline> build() const;

private:
    [[nodiscard]] Result<VkShaderModule> createModule(
        const std::vector<std::uint32_t>& code, const char* stage) const;

    VkDevice                  device_ = VK_NULL_HANDLE;
    std::vector<std::uint32_t> vertCode_;
    std::vector<std::uint32_t> fragCode_;
    VkFormat                  colorFormat_ = VK_FORMAT_UNDEFINED;

    std::vector<VkVertexInputBindingDescription>   vertexBindings_;
    std::vector<VkVertexInputAttributeDescription> vertexAttributes_;

    VkPrimitiveTopology topology_  = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    VkCullModeFlags     cullMode_  = VK_CULL_MODE_NONE;
    VkFrontFace         frontFace_ = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    VkPipelineLayout    layout_    = VK_NULL_HANDLE;
};

} // namespace shaderpad
