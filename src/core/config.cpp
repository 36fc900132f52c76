#include <shaderpad/config.hpp>

#include <string_view>

namespace shaderpad {

Result<Config> parseArgs(int argc, const char* const* argv,
                         const std::filesystem::path& defaultShaderPath) {
    Config cfg;
    cfg.shaderPath = defaultShaderPath;

    constexpr std::string_view kPathPrefix = "--path=";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.showHelp = true;
        } else if (arg == "-p" || arg == "--path") {
            if (i + 1 >= argc) {
                return Error{"parse arguments", 0,
                             std::string(arg) + " requires a value"};
            }
            cfg.shaderPath = argv[++i];
        } else if (arg.substr(0, kPathPrefix.size()) == kPathPrefix) {
            std::string_view value = arg.substr(kPathPrefix.size());
            if (value.empty()) {
                return Error{"parse arguments", 0, "--path= requires a value"};
            }
            cfg.shaderPath = std::string(value);
        } else if (!arg.empty() && arg.front() == '-') {
            return Error{"parse arguments", 0,
                         "unknown option: " + std::string(arg)};
        } else {
            return Error{"parse arguments", 0,
                         "unexpected argument: " + std::string(arg)};
        }
    }

    if (cfg.shaderPath.empty()) {
        return Error{"parse arguments", 0, "shader path is empty"};
    }
    return cfg;
}

std::string usage(const char* programName,
                  const std::filesystem::path& defaultShaderPath) {
    std::string name = (programName && *programName) ? programName : "shaderpad";
    return "usage: " + name + " [-p <path>] [-h]\n"
           "\n"
           "  -p, --path <path>  shader file to load (default: " +
           defaultShaderPath.string() + ")\n"
           "  -h, --help         show this help and exit\n"
           "\n"
           "keys: Enter reloads the shader, Escape quits\n";
}

} // namespace shaderpad
