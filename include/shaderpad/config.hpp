#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>

#include <filesystem>
#include <string>

namespace shaderpad {

struct Config {
    std::filesystem::path shaderPath;
    bool                  showHelp = false;
};

// -p/--path <file> or --path=<file> selects the shader. -h/--help sets
// showHelp. Unknown flags, stray arguments and a missing value are errors.
[[nodiscard]] Result<Config> parseArgs(int argc, const char* const* argv,
                                       const std::filesystem::path& defaultShaderPath);

[[nodiscard]] std::string usage(const char* programName,
                                const std::filesystem::path& defaultShaderPath);

} // namespace shaderpad
