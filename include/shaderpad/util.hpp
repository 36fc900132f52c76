#pragma once

#include <filesystem>

namespace shaderpad {

// Directory containing the running executable, via SDL_GetBasePath().
// Falls back to the current working directory when SDL cannot tell.
[[nodiscard]] std::filesystem::path exeDir();

// Location of the shader bundled next to the executable by the build.
[[nodiscard]] std::filesystem::path bundledShaderPath();

} // namespace shaderpad
