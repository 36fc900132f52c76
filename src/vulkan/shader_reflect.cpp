#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#endif

#include <spirv_reflect.h>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include <shaderpad/shader_reflect.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace shaderpad {

static const char* StageName(VkShaderStageFlags stage) {
    if (stage & VK_SHADER_STAGE_VERTEX_BIT)   return "vertex";
    if (stage & VK_SHADER_STAGE_FRAGMENT_BIT) return "fragment";
    return "shader";
}

static std::string SlotName(std::uint32_t set, std::uint32_t binding) {
    return "set " + std::to_string(set) + " binding " + std::to_string(binding);
}

// Owns the SpvReflectShaderModule for the duration of one reflectSpv() call.
namespace {
struct ReflectModule {
    SpvReflectShaderModule module{};
    bool                   valid = false;

    ~ReflectModule() {
        if (valid) spvReflectDestroyShaderModule(&module);
    }
};
} // namespace

Result<ReflectedLayout> reflectSpv(const std::vector<std::uint32_t>& code,
                                   VkShaderStageFlagBits stage) {
    ReflectModule rm;
    SpvReflectResult result = spvReflectCreateShaderModule(
        code.size() * sizeof(std::uint32_t), code.data(), &rm.module);
    if (result != SPV_REFLECT_RESULT_SUCCESS) {
        return Error{"reflect SPIR-V", 0,
                     std::string("spvReflectCreateShaderModule failed for the ") +
                     StageName(stage) + " stage (SpvReflectResult " +
                     std::to_string(static_cast<int>(result)) + ")"};
    }
    rm.valid = true;

    ReflectedLayout layout;

    std::uint32_t bindingCount = 0;
    result = spvReflectEnumerateDescriptorBindings(&rm.module, &bindingCount, nullptr);
    if (result == SPV_REFLECT_RESULT_SUCCESS && bindingCount > 0) {
        std::vector<SpvReflectDescriptorBinding*> bindings(bindingCount);
        spvReflectEnumerateDescriptorBindings(&rm.module, &bindingCount, bindings.data());

        for (auto* b : bindings) {
            ReflectedBinding rb;
            rb.set       = b->set;
            rb.binding   = b->binding;
            // SpvReflect enums mirror VkDescriptorType and VkFormat value for value.
            rb.type      = static_cast<VkDescriptorType>(b->descriptor_type);
            rb.blockSize = b->block.size;
            rb.stages    = stage;
            if (b->name) rb.name = b->name;
            layout.bindings.push_back(rb);
        }
    }

    std::uint32_t pcCount = 0;
    result = spvReflectEnumeratePushConstantBlocks(&rm.module, &pcCount, nullptr);
    if (result == SPV_REFLECT_RESULT_SUCCESS && pcCount > 0) {
        std::vector<SpvReflectBlockVariable*> blocks(pcCount);
        spvReflectEnumeratePushConstantBlocks(&rm.module, &pcCount, blocks.data());

        for (auto* block : blocks) {
            layout.pushConstants.push_back({static_cast<VkShaderStageFlags>(stage),
                                            block->offset, block->size});
        }
    }

    if (stage == VK_SHADER_STAGE_VERTEX_BIT) {
        std::uint32_t inputCount = 0;
        result = spvReflectEnumerateInputVariables(&rm.module, &inputCount, nullptr);
        if (result == SPV_REFLECT_RESULT_SUCCESS && inputCount > 0) {
            std::vector<SpvReflectInterfaceVariable*> inputs(inputCount);
            spvReflectEnumerateInputVariables(&rm.module, &inputCount, inputs.data());

            for (auto* in : inputs) {
                if (in->decoration_flags & SPV_REFLECT_DECORATION_BUILT_IN) continue;
                ReflectedInput ri;
                ri.location = in->location;
                ri.format   = static_cast<VkFormat>(in->format);
                if (in->name) ri.name = in->name;
                layout.inputs.push_back(ri);
            }
        }
    }

    return layout;
}

Result<ReflectedLayout> mergeReflections(const ReflectedLayout& a,
                                         const ReflectedLayout& b) {
    ReflectedLayout merged;
    merged.bindings = a.bindings;

    for (const auto& bb : b.bindings) {
        auto it = std::find_if(merged.bindings.begin(), merged.bindings.end(),
                               [&](const ReflectedBinding& mb) {
                                   return mb.set == bb.set && mb.binding == bb.binding;
                               });
        if (it == merged.bindings.end()) {
            merged.bindings.push_back(bb);
            continue;
        }
        if (it->type != bb.type) {
            return Error{"merge shader reflections", 0,
                         SlotName(bb.set, bb.binding) +
                         " has conflicting types between stages"};
        }
        it->stages   |= bb.stages;
        it->blockSize = std::max(it->blockSize, bb.blockSize);
        if (it->name.empty()) it->name = bb.name;
    }

    merged.pushConstants = a.pushConstants;
    merged.pushConstants.insert(merged.pushConstants.end(),
                                b.pushConstants.begin(), b.pushConstants.end());

    merged.inputs = a.inputs;
    merged.inputs.insert(merged.inputs.end(), b.inputs.begin(), b.inputs.end());

    return merged;
}

Result<void> checkShaderInterface(const ReflectedLayout& layout,
                                  const ShaderInterface& expected) {
    if (!layout.pushConstants.empty()) {
        return Error{"check shader interface", 0,
                     "push constants are not supported, use the uniform blocks"};
    }

    for (const auto& b : layout.bindings) {
        auto slot = std::find_if(expected.uniforms.begin(), expected.uniforms.end(),
                                 [&](const ShaderInterface::UniformSlot& u) {
                                     return u.set == b.set && u.binding == b.binding;
                                 });
        std::string where = SlotName(b.set, b.binding) +
                            (b.name.empty() ? "" : " ('" + b.name + "')");
        if (slot == expected.uniforms.end()) {
            return Error{"check shader interface", 0, where + " is not provided"};
        }
        if (b.type != VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER) {
            return Error{"check shader interface", 0, where + " must be a uniform block"};
        }
        if (b.blockSize > slot->maxBlockSize) {
            return Error{"check shader interface", 0,
                         where + " declares " + std::to_string(b.blockSize) +
                         " bytes but only " + std::to_string(slot->maxBlockSize) +
                         " are bound"};
        }
    }

    for (const auto& in : layout.inputs) {
        auto slot = std::find_if(expected.inputs.begin(), expected.inputs.end(),
                                 [&](const ShaderInterface::InputSlot& s) {
                                     return s.location == in.location;
                                 });
        std::string where = "vertex input at location " + std::to_string(in.location) +
                            (in.name.empty() ? "" : " ('" + in.name + "')");
        if (slot == expected.inputs.end()) {
            return Error{"check shader interface", 0, where + " is not provided"};
        }
        if (slot->format != in.format) {
            return Error{"check shader interface", 0,
                         where + " has VkFormat " + std::to_string(static_cast<int>(in.format)) +
                         ", expected " + std::to_string(static_cast<int>(slot->format))};
        }
    }

    return {};
}

Result<void> checkShaderInterface(const std::vector<std::uint32_t>& vertCode,
                                  const std::vector<std::uint32_t>& fragCode,
                                  const ShaderInterface& expected) {
    auto vert = reflectSpv(vertCode, VK_SHADER_STAGE_VERTEX_BIT);
    if (!vert.ok()) return std::move(vert).error();

    auto frag = reflectSpv(fragCode, VK_SHADER_STAGE_FRAGMENT_BIT);
    if (!frag.ok()) return std::move(frag).error();

    auto merged = mergeReflections(vert.value(), frag.value());
    if (!merged.ok()) return std::move(merged).error();

    return checkShaderInterface(merged.value(), expected);
}

} // namespace shaderpad
