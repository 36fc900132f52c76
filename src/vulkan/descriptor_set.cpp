#include <shaderpad/descriptor_set.hpp>
#include <shaderpad/device.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace shaderpad {

void DescriptorSet::destroy() {
    if (device_ == VK_NULL_HANDLE) return;
    // The set goes with its pool.
    if (pool_ != VK_NULL_HANDLE)   vkDestroyDescriptorPool(device_, pool_, nullptr);
    if (layout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(device_, layout_, nullptr);
    pool_   = VK_NULL_HANDLE;
    layout_ = VK_NULL_HANDLE;
    set_    = VK_NULL_HANDLE;
    device_ = VK_NULL_HANDLE;
}

DescriptorSet::~DescriptorSet() { destroy(); }

DescriptorSet::DescriptorSet(DescriptorSet&& o) noexcept
    : device_(std::exchange(o.device_, VK_NULL_HANDLE)),
      layout_(std::exchange(o.layout_, VK_NULL_HANDLE)),
      pool_(std::exchange(o.pool_, VK_NULL_HANDLE)),
      set_(std::exchange(o.set_, VK_NULL_HANDLE)) {}

DescriptorSet& DescriptorSet::operator=(DescriptorSet&& o) noexcept {
    if (this == &o) return *this;
    destroy();
    device_ = std::exchange(o.device_, VK_NULL_HANDLE);
    layout_ = std::exchange(o.layout_, VK_NULL_HANDLE);
    pool_   = std::exchange(o.pool_, VK_NULL_HANDLE);
    set_    = std::exchange(o.set_, VK_NULL_HANDLE);
    return *this;
}

DescriptorSetBuilder::DescriptorSetBuilder(const Device& device)
    : device_(device.vkDevice()) {}

DescriptorSetBuilder& DescriptorSetBuilder::uniformBuffer(std::uint32_t binding,
                                                          VkShaderStageFlags stages,
                                                          VkBuffer buffer, VkDeviceSize range) {
    slots_.push_back(UniformSlot{binding, stages, buffer, range});
    return *this;
}

Result<DescriptorSet> DescriptorSetBuilder::build() {
    if (slots_.empty()) {
        return Error{"create descriptor set", 0, "no uniform buffers added"};
    }
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].buffer == VK_NULL_HANDLE) {
            return Error{"create descriptor set", 0,
                         "binding " + std::to_string(slots_[i].binding) + " has no buffer"};
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (slots_[j].binding == slots_[i].binding) {
                return Error{"create descriptor set", 0,
                             "binding " + std::to_string(slots_[i].binding) + " added twice"};
            }
        }
    }

    const auto count = static_cast<std::uint32_t>(slots_.size());

    std::vector<VkDescriptorSetLayoutBinding> bindings(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        bindings[i].binding         = slots_[i].binding;
        bindings[i].descriptorType  = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        bindings[i].descriptorCount = 1;
        bindings[i].stageFlags      = slots_[i].stages;
    }

    DescriptorSet ds;
    ds.device_ = device_;

    VkDescriptorSetLayoutCreateInfo layoutCI{};
    layoutCI.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutCI.bindingCount = count;
    layoutCI.pBindings    = bindings.data();

    VkResult vr = vkCreateDescriptorSetLayout(device_, &layoutCI, nullptr, &ds.layout_);
    if (vr != VK_SUCCESS) {
        ds.layout_ = VK_NULL_HANDLE;
        return Error{"create descriptor set layout", static_cast<std::int32_t>(vr),
                     "vkCreateDescriptorSetLayout failed"};
    }

    const VkDescriptorPoolSize poolSize{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, count};

    VkDescriptorPoolCreateInfo poolCI{};
    poolCI.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolCI.maxSets       = 1;
    poolCI.poolSizeCount = 1;
    poolCI.pPoolSizes    = &poolSize;

    vr = vkCreateDescriptorPool(device_, &poolCI, nullptr, &ds.pool_);
    if (vr != VK_SUCCESS) {
        ds.pool_ = VK_NULL_HANDLE;
        return Error{"create descriptor pool", static_cast<std::int32_t>(vr),
                     "vkCreateDescriptorPool failed"};
    }

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType              = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool     = ds.pool_;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts        = &ds.layout_;

    vr = vkAllocateDescriptorSets(device_, &allocInfo, &ds.set_);
    if (vr != VK_SUCCESS) {
        ds.set_ = VK_NULL_HANDLE;
        return Error{"allocate descriptor set", static_cast<std::int32_t>(vr),
                     "vkAllocateDescriptorSets failed"};
    }

    // bufferInfos must not reallocate once writes point into it.
    std::vector<VkDescriptorBufferInfo> bufferInfos(count);
    std::vector<VkWriteDescriptorSet>   writes(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        bufferInfos[i] = VkDescriptorBufferInfo{slots_[i].buffer, 0, slots_[i].range};

        writes[i].sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[i].dstSet          = ds.set_;
        writes[i].dstBinding      = slots_[i].binding;
        writes[i].descriptorCount = 1;
        writes[i].descriptorType  = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        writes[i].pBufferInfo     = &bufferInfos[i];
    }
    vkUpdateDescriptorSets(device_, count, writes.data(), 0, nullptr);

    return ds;
}

} // namespace shaderpad
