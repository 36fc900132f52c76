#include <shaderpad/shader_compiler.hpp>
#include <shaderpad/shader_pipeline.hpp>
#include <shaderpad/shader_reflect.hpp>

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#ifndef SHADERPAD_SHADER_DIR
#error "SHADERPAD_SHADER_DIR must point at the bundled shaders"
#endif
#ifndef SHADERPAD_TEST_SHADER_DIR
#error "SHADERPAD_TEST_SHADER_DIR must point at the test shaders"
#endif

namespace {

const std::filesystem::path kShaderDir     = SHADERPAD_SHADER_DIR;
const std::filesystem::path kTestShaderDir = SHADERPAD_TEST_SHADER_DIR;

shaderpad::CompiledProgram compileFile(const shaderpad::ShaderCompiler& compiler,
                                       const std::filesystem::path& path) {
    auto src = shaderpad::readShaderSource(path);
    assert(src.ok());
    auto program = compiler.compileProgram(src.value(), path.filename().string());
    assert(program.ok());
    return std::move(program).value();
}

shaderpad::CompiledProgram compileInline(const shaderpad::ShaderCompiler& compiler,
                                         const char* source) {
    auto program = compiler.compileProgram(source, "inline");
    assert(program.ok());
    return std::move(program).value();
}

} // namespace

int main() {
    shaderpad::ShaderCompiler compiler;
    const auto iface = shaderpad::quadShaderInterface();

    {
        assert(iface.uniforms.size() == 2);
        assert(iface.uniforms[0].set == 0 && iface.uniforms[0].binding == 0);
        assert(iface.uniforms[1].set == 1 && iface.uniforms[1].binding == 0);
        assert(iface.inputs.size() == 2);
        assert(iface.inputs[0].location == 0 && iface.inputs[0].format == VK_FORMAT_R32G32B32_SFLOAT);
        assert(iface.inputs[1].location == 1 && iface.inputs[1].format == VK_FORMAT_R32G32_SFLOAT);
        std::printf("  quad interface: ok\n");
    }

    // Bundled shader: two uniform blocks and two vertex inputs
    {
        auto program = compileFile(compiler, kShaderDir / "shader.glsl");

        auto vert = shaderpad::reflectSpv(program.vertex, VK_SHADER_STAGE_VERTEX_BIT);
        auto frag = shaderpad::reflectSpv(program.fragment, VK_SHADER_STAGE_FRAGMENT_BIT);
        assert(vert.ok() && frag.ok());

        assert(vert.value().inputs.size() == 2);
        assert(frag.value().inputs.empty());

        auto merged = shaderpad::mergeReflections(vert.value(), frag.value());
        assert(merged.ok());

        const auto& bindings = merged.value().bindings;
        auto mouse = std::find_if(bindings.begin(), bindings.end(),
            [](const shaderpad::ReflectedBinding& b) { return b.set == 1 && b.binding == 0; });
        assert(mouse != bindings.end());
        assert(mouse->type == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
        assert(mouse->blockSize >= 8);
        assert(mouse->stages & VK_SHADER_STAGE_FRAGMENT_BIT);
        assert(merged.value().pushConstants.empty());

        assert(shaderpad::checkShaderInterface(merged.value(), iface).ok());
        assert(shaderpad::checkShaderInterface(program.vertex, program.fragment, iface).ok());
        std::printf("  bundled shader reflection: ok\n");
    }

    // Using fewer resources than offered is fine
    {
        auto program = compileFile(compiler, kTestShaderDir / "solid.glsl");
        assert(shaderpad::checkShaderInterface(program.vertex, program.fragment, iface).ok());
        std::printf("  subset interface: ok\n");
    }

    // A sampler the layout does not have
    {
        auto program = compileFile(compiler, kTestShaderDir / "extra_binding.glsl");
        auto r = shaderpad::checkShaderInterface(program.vertex, program.fragment, iface);
        assert(!r.ok());
        assert(r.error().message.find("set 0") != std::string::npos);
        assert(r.error().message.find("binding 1") != std::string::npos);
        std::printf("  unexpected binding: ok\n");
    }

    // Block larger than the buffer behind it
    {
        auto program = compileInline(compiler,
            "#version 450\n"
            "layout(set = 1, binding = 0) uniform Mouse { vec2 cursor; vec4 extra[4]; } mouse;\n"
            "#ifdef SHADERPAD_VERTEX\n"
            "layout(location = 0) in vec3 p;\n"
            "void main() { gl_Position = vec4(p, 1.0); }\n"
            "#endif\n"
            "#ifdef SHADERPAD_FRAGMENT\n"
            "layout(location = 0) out vec4 c;\n"
            "void main() { c = mouse.extra[1] + vec4(mouse.cursor, 0.0, 0.0); }\n"
            "#endif\n");
        auto r = shaderpad::checkShaderInterface(program.vertex, program.fragment, iface);
        assert(!r.ok());
        std::printf("  oversized block: ok\n");
    }

    // Push constants are not part of the layout
    {
        auto program = compileInline(compiler,
            "#version 450\n"
            "layout(push_constant) uniform Push { vec4 tint; } pc;\n"
            "#ifdef SHADERPAD_VERTEX\n"
            "layout(location = 0) in vec3 p;\n"
            "void main() { gl_Position = vec4(p, 1.0); }\n"
            "#endif\n"
            "#ifdef SHADERPAD_FRAGMENT\n"
            "layout(location = 0) out vec4 c;\n"
            "void main() { c = pc.tint; }\n"
            "#endif\n");
        auto r = shaderpad::checkShaderInterface(program.vertex, program.fragment, iface);
        assert(!r.ok());
        std::printf("  push constants: ok\n");
    }

    // Vertex input with the wrong type or an unknown location
    {
        auto wrongType = compileInline(compiler,
            "#version 450\n"
            "#ifdef SHADERPAD_VERTEX\n"
            "layout(location = 1) in vec4 uv;\n"
            "void main() { gl_Position = uv; }\n"
            "#endif\n"
            "#ifdef SHADERPAD_FRAGMENT\n"
            "layout(location = 0) out vec4 c;\n"
            "void main() { c = vec4(1.0); }\n"
            "#endif\n");
        assert(!shaderpad::checkShaderInterface(wrongType.vertex, wrongType.fragment, iface).ok());

        auto unknownLocation = compileInline(compiler,
            "#version 450\n"
            "#ifdef SHADERPAD_VERTEX\n"
            "layout(location = 0) in vec3 p;\n"
            "layout(location = 2) in vec3 n;\n"
            "void main() { gl_Position = vec4(p + n, 1.0); }\n"
            "#endif\n"
            "#ifdef SHADERPAD_FRAGMENT\n"
            "layout(location = 0) out vec4 c;\n"
            "void main() { c = vec4(1.0); }\n"
            "#endif\n");
        assert(!shaderpad::checkShaderInterface(unknownLocation.vertex, unknownLocation.fragment, iface).ok());
        std::printf("  vertex inputs: ok\n");
    }

    // Same slot, different type in the two stages
    {
        shaderpad::ReflectedLayout a;
        a.bindings.push_back({0, 0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 4,
                              VK_SHADER_STAGE_VERTEX_BIT, "time"});
        shaderpad::ReflectedLayout b;
        b.bindings.push_back({0, 0, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 4,
                              VK_SHADER_STAGE_FRAGMENT_BIT, "data"});
        assert(!shaderpad::mergeReflections(a, b).ok());

        b.bindings[0].type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        auto merged = shaderpad::mergeReflections(a, b);
        assert(merged.ok());
        assert(merged.value().bindings.size() == 1);
        assert(merged.value().bindings[0].stages ==
               (VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT));
        std::printf("  merge: ok\n");
    }

    // Garbage is not SPIR-V
    {
        std::vector<std::uint32_t> junk = {1, 2, 3, 4, 5};
        assert(!shaderpad::reflectSpv(junk, VK_SHADER_STAGE_VERTEX_BIT).ok());
        std::printf("  invalid SPIR-V: ok\n");
    }

    return 0;
}
