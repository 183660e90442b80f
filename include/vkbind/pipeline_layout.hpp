#pragma once

#include <vkbind/error.hpp>
#include <vkbind/pipeline_layout_desc.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace vkbind {

class Device;
class DescriptorSet;
class DescriptorSetLayout;

// VkPipelineLayout over shared descriptor set layouts, which it keeps alive.
// The Device must outlive it.
//
// Thread safety: immutable after construction.
class PipelineLayout {
public:
    // Fails with InvalidArgument when the device's maxBoundDescriptorSets or
    // maxPushConstantsSize would be exceeded.
    [[nodiscard]] static Result<std::shared_ptr<const PipelineLayout>> create(
        const Device& device,
        std::vector<std::shared_ptr<const DescriptorSetLayout>> setLayouts,
        std::vector<PushConstantRange> pushConstants = {});

    ~PipelineLayout();
    PipelineLayout(const PipelineLayout&) = delete;
    PipelineLayout& operator=(const PipelineLayout&) = delete;

    [[nodiscard]] VkPipelineLayout          native()           const { return layout_; }
    [[nodiscard]] VkPipelineLayout          vkPipelineLayout() const { return native(); }
    [[nodiscard]] const PipelineLayoutDesc& desc()             const { return desc_; }

    [[nodiscard]] std::uint32_t setCount() const { return desc_.setCount(); }
    [[nodiscard]] const std::shared_ptr<const DescriptorSetLayout>& setLayout(std::uint32_t index) const {
        return setLayouts_.at(index);
    }

    // Checks that sets[i] is usable and compatible with set layout
    // firstSet + i, and returns the raw handles in order.
    [[nodiscard]] Result<std::vector<VkDescriptorSet>> decodeDescriptorSets(
        const std::vector<std::shared_ptr<DescriptorSet>>& sets,
        std::uint32_t firstSet = 0) const;

    // decodeDescriptorSets, a dynamic offset count check, then
    // vkCmdBindDescriptorSets.
    [[nodiscard]] Result<void> bindDescriptorSets(
        VkCommandBuffer cmd, VkPipelineBindPoint bindPoint,
        const std::vector<std::shared_ptr<DescriptorSet>>& sets,
        std::uint32_t firstSet = 0,
        const std::vector<std::uint32_t>& dynamicOffsets = {}) const;

private:
    PipelineLayout() = default;

    VkDevice                                                device_ = VK_NULL_HANDLE;
    VkPipelineLayout                                        layout_ = VK_NULL_HANDLE;
    PipelineLayoutDesc                                      desc_;
    std::vector<std::shared_ptr<const DescriptorSetLayout>> setLayouts_;
};

} // namespace vkbind
