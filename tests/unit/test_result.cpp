#include <shaderpad/result.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#ifndef SHADERPAD_ENABLE_EXCEPTIONS
#define SHADERPAD_ENABLE_EXCEPTIONS 1
#endif
#if SHADERPAD_ENABLE_EXCEPTIONS
#include <stdexcept>
#endif
#include <memory>
#include <string>
#include <utility>
#include <vector>

int main() {
    // SPIR-V shaped value
    {
        shaderpad::Result<std::vector<std::uint32_t>> r =
            std::vector<std::uint32_t>{0x07230203u, 0x00010600u};
        assert(r.ok());
        assert(r);
        assert(r.value().size() == 2);
        assert(r.value()[0] == 0x07230203u);

        std::vector<std::uint32_t> moved = std::move(r).value();
        assert(moved.size() == 2);
        std::printf("  value: ok\n");
    }

    // Error keeps all three fields
    {
        shaderpad::Result<std::string> r = shaderpad::Error{"read shader", 0, "failed to open: x.glsl"};
        assert(!r.ok());
        assert(!r);
        assert(r.error().operation == "read shader");
        assert(r.error().vkResult == 0);
        assert(r.error().message == "failed to open: x.glsl");
        std::printf("  error: ok\n");
    }

    // Move-only payload, the way RAII wrappers come back from builders
    {
        auto make = [](bool succeed) -> shaderpad::Result<std::unique_ptr<int>> {
            if (succeed)
                return std::make_unique<int>(7);
            return shaderpad::Error{"create buffer", -2, "out of device memory"};
        };

        auto good = make(true);
        auto bad  = make(false);
        assert(good.ok() && *good.value() == 7);
        assert(!bad.ok() && bad.error().vkResult == -2);

        std::unique_ptr<int> p = std::move(good).value();
        assert(p && *p == 7);
        std::printf("  move-only value: ok\n");
    }

    // Forwarding an error across types
    {
        auto inner = []() -> shaderpad::Result<int> {
            return shaderpad::Error{"compile shader", 0, "syntax error"};
        };
        auto outer = [&]() -> shaderpad::Result<std::string> {
            auto r = inner();
            if (!r.ok()) return std::move(r).error();
            return std::to_string(r.value());
        };
        auto r = outer();
        assert(!r.ok());
        assert(r.error().operation == "compile shader");
        std::printf("  error forwarding: ok\n");
    }

    // Result<void>
    {
        shaderpad::Result<void> ok;
        assert(ok.ok());
        assert(ok);

        shaderpad::Result<void> bad = shaderpad::Error{"present", -4, "device lost"};
        assert(!bad.ok());
        assert(bad.error().vkResult == -4);

        // Reassignment, as a loop does when it chains update() and render()
        bad = shaderpad::Result<void>{};
        assert(bad.ok());
        std::printf("  Result<void>: ok\n");
    }

    // orThrow on success
    {
        auto make = []() -> shaderpad::Result<int> { return 99; };
        int val = make().orThrow();
        assert(val == 99);

        shaderpad::Result<void> r;
        std::move(r).orThrow();
        std::printf("  orThrow success: ok\n");
    }

#if SHADERPAD_ENABLE_EXCEPTIONS
    {
        auto make = []() -> shaderpad::Result<int> {
            return shaderpad::Error{"create device", -9, "no Vulkan 1.3 GPU"};
        };
        bool caught = false;
        try {
            (void)make().orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            std::string msg = e.what();
            assert(msg.find("create device") != std::string::npos);
            assert(msg.find("VkResult -9") != std::string::npos);
        }
        assert(caught);

        shaderpad::Result<void> r = shaderpad::Error{"compile shader", 0, "bad"};
        caught = false;
        try {
            std::move(r).orThrow();
        } catch (const std::runtime_error&) {
            caught = true;
        }
        assert(caught);
        std::printf("  orThrow throws: ok\n");
    }
#endif

    return 0;
}
