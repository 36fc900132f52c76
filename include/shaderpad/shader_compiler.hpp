#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shaderpad {

enum class ShaderStage {
    Vertex,   // compiled with SHADERPAD_VERTEX defined
    Fragment, // compiled with SHADERPAD_FRAGMENT defined
};

[[nodiscard]] const char* stageMacro(ShaderStage stage);

// Both stages of one shader file, as SPIR-V words.
struct CompiledProgram {
    std::vector<std::uint32_t> vertex;
    std::vector<std::uint32_t> fragment;
};

// Whole file as text. Read fresh on every call.
[[nodiscard]] Result<std::string> readShaderSource(const std::filesystem::path& path);

// GLSL -> SPIR-V through shaderc, targeting Vulkan 1.3. Both stages live
// in one source, split by the stage macros; the entry point is main.
//
// Thread safety: thread-confined. shaderc::Compiler is not reentrant.
class ShaderCompiler {
public:
    ShaderCompiler();
    ~ShaderCompiler();
    ShaderCompiler(ShaderCompiler&&) noexcept;
    ShaderCompiler& operator=(ShaderCompiler&&) noexcept;
    ShaderCompiler(const ShaderCompiler&) = delete;
    ShaderCompiler& operator=(const ShaderCompiler&) = delete;

    // name shows up in error messages (usually the file path).
    [[nodiscard]] Result<std::vector<std::uint32_t>> compile(std::string_view source,
                                                             ShaderStage stage,
                                                             const std::string& name) const;

    [[nodiscard]] Result<CompiledProgram> compileProgram(std::string_view source,
                                                         const std::string& name) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shaderpad
