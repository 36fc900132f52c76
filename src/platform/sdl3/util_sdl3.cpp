#include <shaderpad/util.hpp>

#include <SDL3/SDL.h>

#include <system_error>

namespace shaderpad {

std::filesystem::path exeDir() {
    const char* base = SDL_GetBasePath();
    if (base) {
        return std::filesystem::path(base);
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::filesystem::path bundledShaderPath() {
    return exeDir() / "shaders" / "shader.glsl";
}

} // namespace shaderpad
