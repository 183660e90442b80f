#pragma once

#include <vkbind/descriptor_set_desc.hpp>
#include <vkbind/error.hpp>
#include <vkbind/result.hpp>
#include <vkbind/shader_stages.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <utility>
#include <vector>

namespace vkbind {

struct PushConstantRange {
    ShaderStages  stages;
    std::uint32_t offset = 0;
    std::uint32_t size   = 0;

    [[nodiscard]] VkPushConstantRange toVk() const {
        return {stages.toVk(), offset, size};
    }

    bool operator==(const PushConstantRange&) const = default;
};

// Ordered descriptor set descriptions plus push constant ranges.
//
// Thread safety: immutable after construction.
class PipelineLayoutDesc {
public:
    PipelineLayoutDesc() = default;

    // Push constant ranges must have a non-zero size, offset and size must be
    // multiples of 4, and no two ranges may share a stage.
    [[nodiscard]] static Result<PipelineLayoutDesc> create(
        std::vector<DescriptorSetDesc> sets,
        std::vector<PushConstantRange> pushConstants = {});

    [[nodiscard]] const std::vector<DescriptorSetDesc>& sets()          const { return sets_; }
    [[nodiscard]] const std::vector<PushConstantRange>& pushConstants() const { return pushConstants_; }
    [[nodiscard]] std::uint32_t setCount() const { return static_cast<std::uint32_t>(sets_.size()); }

    // End of the highest push constant range, 0 without push constants.
    [[nodiscard]] std::uint32_t pushConstantBytes() const;

    [[nodiscard]] bool isCompatibleWith(const PipelineLayoutDesc& other) const;

    // Number of leading sets N such that a set bound at index < N with one
    // layout stays valid after switching to the other: push constants must be
    // identical and sets 0..N-1 compatible.
    [[nodiscard]] std::uint32_t compatibleSetCount(const PipelineLayoutDesc& other) const;

private:
    PipelineLayoutDesc(std::vector<DescriptorSetDesc> sets, std::vector<PushConstantRange> pcs)
        : sets_(std::move(sets)), pushConstants_(std::move(pcs)) {}

    std::vector<DescriptorSetDesc> sets_;
    std::vector<PushConstantRange> pushConstants_;
};

} // namespace vkbind
