#include <shaderpad/shader_pipeline.hpp>

#include <shaderpad/device.hpp>
#include <shaderpad/geometry.hpp>
#include <shaderpad/uniforms.hpp>

#include <utility>

namespace shaderpad {

ShaderInterface quadShaderInterface() {
    ShaderInterface iface;
    iface.uniforms.push_back({kTimeSet,  0, kUniformBlockBytes<TimeUniform>});
    iface.uniforms.push_back({kMouseSet, 0, kUniformBlockBytes<MouseUniform>});
    for (const auto& attr : kVertexAttributes) {
        iface.inputs.push_back({attr.location, attr.format});
    }
    return iface;
}

Result<Pipeline> buildShaderPipeline(const Device& device,
                                     const ShaderCompiler& compiler,
                                     const PipelineLayout& layout,
                                     VkFormat colorFormat,
                                     std::string_view source,
                                     const std::string& name) {
    auto program = compiler.compileProgram(source, name);
    if (!program.ok()) return std::move(program).error();

    auto& spv = program.value();
    auto iface = checkShaderInterface(spv.vertex, spv.fragment, quadShaderInterface());
    if (!iface.ok()) {
        Error e = std::move(iface).error();
        e.message = name + ": " + e.message;
        return e;
    }

    PipelineBuilder builder(device);
    builder.vertexCode(std::move(spv.vertex))
           .fragmentCode(std::move(spv.fragment))
           .colorFormat(colorFormat)
           .vertexBinding(kVertexBinding, kVertexStride)
           .topology(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST)
           .frontFace(VK_FRONT_FACE_COUNTER_CLOCKWISE)
           .cullBack()
           .pipelineLayout(layout);
    for (const auto& attr : kVertexAttributes) {
        builder.vertexAttribute(attr.location, kVertexBinding, attr.format, attr.offset);
    }
    return builder.build();
}

Result<Pipeline> buildShaderPipeline(const Device& device,
                                     const ShaderCompiler& compiler,
                                     const PipelineLayout& layout,
                                     VkFormat colorFormat,
                                     const std::filesystem::path& path) {
    auto source = readShaderSource(path);
    if (!source.ok()) return std::move(source).error();

    return buildShaderPipeline(device, compiler, layout, colorFormat,
                               source.value(), path.string());
}

} // namespace shaderpad
