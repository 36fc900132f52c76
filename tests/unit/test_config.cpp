#include <shaderpad/config.hpp>

#include <cassert>
#include <cstdio>
#include <filesystem>
#include <string>

namespace {

const std::filesystem::path kDefault = "/opt/shaderpad/shaders/shader.glsl";

template <int N>
shaderpad::Result<shaderpad::Config> parse(const char* (&args)[N]) {
    return shaderpad::parseArgs(N, args, kDefault);
}

} // namespace

int main() {
    {
        const char* args[] = {"shaderpad"};
        auto r = parse(args);
        assert(r.ok());
        assert(r.value().shaderPath == kDefault);
        assert(!r.value().showHelp);
        std::printf("  default path: ok\n");
    }

    {
        const char* args[] = {"shaderpad", "-p", "mine.glsl"};
        auto r = parse(args);
        assert(r.ok());
        assert(r.value().shaderPath == "mine.glsl");
        std::printf("  -p: ok\n");
    }

    {
        const char* args[] = {"shaderpad", "--path", "dir/other.glsl"};
        auto r = parse(args);
        assert(r.ok());
        assert(r.value().shaderPath == "dir/other.glsl");
        std::printf("  --path: ok\n");
    }

    {
        const char* args[] = {"shaderpad", "--path=a b.glsl"};
        auto r = parse(args);
        assert(r.ok());
        assert(r.value().shaderPath == "a b.glsl");
        std::printf("  --path=: ok\n");
    }

    // Last one wins
    {
        const char* args[] = {"shaderpad", "-p", "one.glsl", "--path=two.glsl"};
        auto r = parse(args);
        assert(r.ok());
        assert(r.value().shaderPath == "two.glsl");
        std::printf("  repeated flag: ok\n");
    }

    {
        const char* args[] = {"shaderpad", "--help"};
        auto r = parse(args);
        assert(r.ok());
        assert(r.value().showHelp);

        const char* shortArgs[] = {"shaderpad", "-h"};
        auto s = parse(shortArgs);
        assert(s.ok() && s.value().showHelp);
        std::printf("  help: ok\n");
    }

    {
        const char* args[] = {"shaderpad", "-p"};
        auto r = parse(args);
        assert(!r.ok());
        assert(r.error().operation == "parse arguments");
        assert(r.error().message.find("requires a value") != std::string::npos);

        const char* emptyEq[] = {"shaderpad", "--path="};
        assert(!parse(emptyEq).ok());
        std::printf("  missing value: ok\n");
    }

    {
        const char* args[] = {"shaderpad", "--fullscreen"};
        auto r = parse(args);
        assert(!r.ok());
        assert(r.error().message.find("--fullscreen") != std::string::npos);

        const char* stray[] = {"shaderpad", "shader.glsl"};
        assert(!parse(stray).ok());
        std::printf("  unknown argument: ok\n");
    }

    {
        std::string text = shaderpad::usage("shaderpad", kDefault);
        assert(text.rfind("usage: shaderpad", 0) == 0);
        assert(text.find("--path") != std::string::npos);
        assert(text.find(kDefault.string()) != std::string::npos);

        std::string fallback = shaderpad::usage(nullptr, kDefault);
        assert(fallback.rfind("usage: shaderpad", 0) == 0);
        std::printf("  usage: ok\n");
    }

    return 0;
}
