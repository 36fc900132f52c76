#include <shaderpad/device.hpp>
#include <shaderpad/pipeline.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace shaderpad {

void PipelineLayout::destroy() {
    if (layout_ != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(device_, layout_, nullptr);
        layout_ = VK_NULL_HANDLE;
    }
}

PipelineLayout::~PipelineLayout() { destroy(); }

PipelineLayout::PipelineLayout(PipelineLayout&& o) noexcept
    : device_(o.device_), layout_(o.layout_), setCount_(o.setCount_) {
    o.device_ = VK_NULL_HANDLE;
    o.layout_ = VK_NULL_HANDLE;
}

PipelineLayout& PipelineLayout::operator=(PipelineLayout&& o) noexcept {
    if (this != &o) {
        destroy();
        device_   = o.device_;
        layout_   = o.layout_;
        setCount_ = o.setCount_;
        o.device_ = VK_NULL_HANDLE;
        o.layout_ = VK_NULL_HANDLE;
    }
    return *this;
}

Result<PipelineLayout> PipelineLayout::create(
    const Device& device, const std::vector<VkDescriptorSetLayout>& setLayouts) {
    VkPipelineLayoutCreateInfo ci{};
    ci.sType          = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    ci.setLayoutCount = static_cast<std::uint32_t>(setLayouts.size());
    ci.pSetLayouts    = setLayouts.empty() ? nullptr : setLayouts.data();

    PipelineLayout pl;
    pl.device_   = device.vkDevice();
    pl.setCount_ = ci.setLayoutCount;

    VkResult vr = vkCreatePipelineLayout(pl.device_, &ci, nullptr, &pl.layout_);
    if (vr != VK_SUCCESS) {
        pl.layout_ = VK_NULL_HANDLE;
        return Error{"create pipeline layout", static_cast<std::int32_t>(vr),
                     "vkCreatePipelineLayout failed"};
    }
    return pl;
}

void Pipeline::destroy() {
    if (pipeline_ != VK_NULL_HANDLE) {
        vkDestroyPipeline(device_, pipeline_, nullptr);
        pipeline_ = VK_NULL_HANDLE;
    }
}

Pipeline::~Pipeline() { destroy(); }

Pipeline::Pipeline(Pipeline&& o) noexcept
    : device_(o.device_), pipeline_(o.pipeline_), layout_(o.layout_) {
    o.device_   = VK_NULL_HANDLE;
    o.pipeline_ = VK_NULL_HANDLE;
    o.layout_   = VK_NULL_HANDLE;
}

Pipeline& Pipeline::operator=(Pipeline&& o) noexcept {
    if (this != &o) {
        destroy();
        device_     = o.device_;
        pipeline_   = o.pipeline_;
        layout_     = o.layout_;
        o.device_   = VK_NULL_HANDLE;
        o.pipeline_ = VK_NULL_HANDLE;
        o.layout_   = VK_NULL_HANDLE;
    }
    return *this;
}

void Pipeline::bind(VkCommandBuffer cmd) const {
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline_);
}

void Pipeline::bindDescriptorSets(VkCommandBuffer cmd, std::uint32_t firstSet,
                                  std::initializer_list<VkDescriptorSet> sets) const {
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, layout_, firstSet,
                            static_cast<std::uint32_t>(sets.size()), sets.begin(),
                            0, nullptr);
}

PipelineBuilder::PipelineBuilder(const Device& device)
    : device_(device.vkDevice()) {}

PipelineBuilder& PipelineBuilder::vertexCode(std::vector<std::uint32_t> spirv) {
    vertCode_ = std::move(spirv);
    return *this;
}

PipelineBuilder& PipelineBuilder::fragmentCode(std::vector<std::uint32_t> spirv) {
    fragCode_ = std::move(spirv);
    return *this;
}

PipelineBuilder& PipelineBuilder::colorFormat(VkFormat format) {
    colorFormat_ = format;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexBinding(std::uint32_t binding, std::uint32_t stride,
                                                VkVertexInputRate inputRate) {
    vertexBindings_.push_back({binding, stride, inputRate});
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexAttribute(std::uint32_t location, std::uint32_t binding,
                                                  VkFormat format, std::uint32_t offset) {
    vertexAttributes_.push_back({location, binding, format, offset});
    return *this;
}

PipelineBuilder& PipelineBuilder::topology(VkPrimitiveTopology t) {
    topology_ = t;
    return *this;
}

PipelineBuilder& PipelineBuilder::cullBack() {
    cullMode_ = VK_CULL_MODE_BACK_BIT;
    return *this;
}

PipelineBuilder& PipelineBuilder::frontFace(VkFrontFace f) {
    frontFace_ = f;
    return *this;
}

PipelineBuilder& PipelineBuilder::pipelineLayout(const PipelineLayout& layout) {
    layout_ = layout.vkPipelineLayout();
    return *this;
}

Result<VkShaderModule> PipelineBuilder::createModule(
    const std::vector<std::uint32_t>& code, const char* stage) const {
    VkShaderModuleCreateInfo ci{};
    ci.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    ci.codeSize = code.size() * sizeof(std::uint32_t);
    ci.pCode    = code.data();

    VkShaderModule module = VK_NULL_HANDLE;
    VkResult vr = vkCreateShaderModule(device_, &ci, nullptr, &module);
    if (vr != VK_SUCCESS) {
        return Error{"create shader module", static_cast<std::int32_t>(vr),
                     std::string("vkCreateShaderModule failed for the ") + stage + " stage"};
    }
    return module;
}

Result<Pipeline> PipelineBuilder::build() const {
    if (vertCode_.empty()) {
        return Error{"create pipeline", 0, "no vertex shader set, call vertexCode(spirv)"};
    }
    if (fragCode_.empty()) {
        return Error{"create pipeline", 0, "no fragment shader set, call fragmentCode(spirv)"};
    }
    if (colorFormat_ == VK_FORMAT_UNDEFINED) {
        return Error{"create pipeline", 0,
                     "no color format set, call colorFormat(format)"};
    }
    if (layout_ == VK_NULL_HANDLE) {
        return Error{"create pipeline", 0, "no pipeline layout set, call pipelineLayout()"};
    }

    auto vertMod = createModule(vertCode_, "vertex");
    if (!vertMod.ok()) return std::move(vertMod).error();

    auto fragMod = createModule(fragCode_, "fragment");
    if (!fragMod.ok()) {
        vkDestroyShaderModule(device_, vertMod.value(), nullptr);
        return std::move(fragMod).error();
    }

    VkPipelineShaderStageCreateInfo stages[2]{};
    stages[0].sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[0].stage  = VK_SHADER_STAGE_VERTEX_BIT;
    stages[0].module = vertMod.value();
    stages[0].pName  = "main";
    stages[1].sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[1].stage  = VK_SHADER_STAGE_FRAGMENT_BIT;
    stages[1].module = fragMod.value();
    stages[1].pName  = "main";

    VkPipelineVertexInputStateCreateInfo vertexInput{};
    vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInput.vertexBindingDescriptionCount =
        static_cast<std::uint32_t>(vertexBindings_.size());
    vertexInput.pVertexBindingDescriptions =
        vertexBindings_.empty() ? nullptr : vertexBindings_.data();
    vertexInput.vertexAttributeDescriptionCount =
        static_cast<std::uint32_t>(vertexAttributes_.size());
    vertexInput.pVertexAttributeDescriptions =
        vertexAttributes_.empty() ? nullptr : vertexAttributes_.data();

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType    = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = topology_;

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType         = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount  = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType       = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth   = 1.0f;
    rasterizer.cullMode    = cullMode_;
    rasterizer.frontFace   = frontFace_;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    // Blending off: fragments replace what is in the attachment.
    VkPipelineColorBlendAttachmentState colorBlendAttachment{};
    colorBlendAttachment.colorWriteMask =
        VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
        VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

    VkPipelineColorBlendStateCreateInfo colorBlend{};
    colorBlend.sType           = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlend.attachmentCount = 1;
    colorBlend.pAttachments    = &colorBlendAttachment;

    VkDynamicState dynamicStates[] = {
        VK_DYNAMIC_STATE_VIEWPORT,
        VK_DYNAMIC_STATE_SCISSOR,
    };
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType             = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = 2;
    dynamicState.pDynamicStates    = dynamicStates;

    VkPipelineRenderingCreateInfo renderingInfo{};
    renderingInfo.sType                   = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    renderingInfo.colorAttachmentCount    = 1;
    renderingInfo.pColorAttachmentFormats = &colorFormat_;

    VkGraphicsPipelineCreateInfo pipelineCI{};
    pipelineCI.sType               = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineCI.pNext               = &renderingInfo;
    pipelineCI.stageCount          = 2;
    pipelineCI.pStages             = stages;
    pipelineCI.pVertexInputState   = &vertexInput;
    pipelineCI.pInputAssemblyState = &inputAssembly;
    pipelineCI.pViewportState      = &viewportState;
    pipelineCI.pRasterizationState = &rasterizer;
    pipelineCI.pMultisampleState   = &multisampling;
    pipelineCI.pColorBlendState    = &colorBlend;
    pipelineCI.pDynamicState       = &dynamicState;
    pipelineCI.layout              = layout_;

    Pipeline p;
    p.device_ = device_;
    p.layout_ = layout_;

    VkResult vr = vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pipelineCI,
                                            nullptr, &p.pipeline_);

    // Modules are only needed during creation.
    vkDestroyShaderModule(device_, vertMod.value(), nullptr);
    vkDestroyShaderModule(device_, fragMod.value(), nullptr);

    if (vr != VK_SUCCESS) {
        p.pipeline_ = VK_NULL_HANDLE;
        return Error{"create graphics pipeline", static_cast<std::int32_t>(vr),
                     "vkCreateGraphicsPipelines failed"};
    }
    return p;
}

} // namespace shaderpad
