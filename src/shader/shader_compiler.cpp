#include <shaderpad/shader_compiler.hpp>

#include <shaderc/shaderc.hpp>

#include <fstream>
#include <sstream>
#include <utility>

namespace shaderpad {

const char* stageMacro(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::Vertex:   return "SHADERPAD_VERTEX";
    case ShaderStage::Fragment: return "SHADERPAD_FRAGMENT";
    }
    return "";
}

static shaderc_shader_kind ToKind(ShaderStage stage) {
    return stage == ShaderStage::Vertex ? shaderc_vertex_shader : shaderc_fragment_shader;
}

Result<std::string> readShaderSource(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error{"read shader", 0, "failed to open: " + path.string()};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error{"read shader", 0, "failed while reading: " + path.string()};
    }

    std::string source = ss.str();
    if (source.empty()) {
        return Error{"read shader", 0, "file is empty: " + path.string()};
    }
    return source;
}

struct ShaderCompiler::Impl {
    shaderc::Compiler compiler;
};

ShaderCompiler::ShaderCompiler() : impl_(std::make_unique<Impl>()) {}
ShaderCompiler::~ShaderCompiler() = default;
ShaderCompiler::ShaderCompiler(ShaderCompiler&&) noexcept = default;
ShaderCompiler& ShaderCompiler::operator=(ShaderCompiler&&) noexcept = default;

Result<std::vector<std::uint32_t>> ShaderCompiler::compile(std::string_view source,
                                                           ShaderStage stage,
                                                           const std::string& name) const {
    if (!impl_->compiler.IsValid()) {
        return Error{"compile shader", 0, "shaderc compiler failed to initialize"};
    }

    shaderc::CompileOptions opts;
    opts.SetSourceLanguage(shaderc_source_language_glsl);
    opts.SetTargetEnvironment(shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_3);
    opts.SetOptimizationLevel(shaderc_optimization_level_performance);
    opts.AddMacroDefinition(stageMacro(stage));

    auto result = impl_->compiler.CompileGlslToSpv(source.data(), source.size(),
                                                   ToKind(stage), name.c_str(), "main", opts);
    if (result.GetCompilationStatus() != shaderc_compilation_status_success) {
        return Error{"compile shader", 0,
                     std::string(stageMacro(stage)) + " pass of " + name + ":\n" +
                     result.GetErrorMessage()};
    }

    std::vector<std::uint32_t> spirv(result.cbegin(), result.cend());
    if (spirv.empty()) {
        return Error{"compile shader", 0, "compiled to empty SPIR-V: " + name};
    }
    return spirv;
}

Result<CompiledProgram> ShaderCompiler::compileProgram(std::string_view source,
                                                       const std::string& name) const {
    auto vert = compile(source, ShaderStage::Vertex, name);
    if (!vert.ok()) return std::move(vert).error();

    auto frag = compile(source, ShaderStage::Fragment, name);
    if (!frag.ok()) return std::move(frag).error();

    return CompiledProgram{std::move(vert).value(), std::move(frag).value()};
}

} // namespace shaderpad
