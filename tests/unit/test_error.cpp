#include <shaderpad/error.hpp>

#include <cassert>
#include <cstdio>
#include <string>

int main() {
    // Vulkan failure carries the VkResult
    {
        shaderpad::Error e{"acquire image", -1000001004, "swapchain out of date, recreate it"};
        std::string s = e.format();
        assert(s.rfind("shaderpad: acquire image failed", 0) == 0);
        assert(s.find("(VK_ERROR_OUT_OF_DATE_KHR, VkResult -1000001004)") != std::string::npos);
        assert(s.find("swapchain out of date") != std::string::npos);
        std::printf("  vulkan error format: ok\n");
    }

    // Shader errors have no VkResult
    {
        shaderpad::Error e{"compile shader", 0, "shader.glsl:12: error: 'foo' : undeclared identifier"};
        std::string s = e.format();
        assert(s == "shaderpad: compile shader failed: shader.glsl:12: error: 'foo' : undeclared identifier");
        assert(s.find("VkResult") == std::string::npos);
        std::printf("  non-vulkan error format: ok\n");
    }

    // No message, no trailing colon
    {
        shaderpad::Error e{"create pipeline", -3, ""};
        std::string s = e.format();
        assert(s == "shaderpad: create pipeline failed (VK_ERROR_INITIALIZATION_FAILED, VkResult -3)");
        std::printf("  empty message: ok\n");
    }

    // Codes without a name still show the number
    {
        assert(shaderpad::vkResultName(-4) != nullptr);
        assert(std::string(shaderpad::vkResultName(-4)) == "VK_ERROR_DEVICE_LOST");
        assert(shaderpad::vkResultName(12345) == nullptr);

        shaderpad::Error e{"present", 12345, "odd driver"};
        assert(e.format() == "shaderpad: present failed (VkResult 12345): odd driver");
        std::printf("  unnamed result code: ok\n");
    }

    return 0;
}
