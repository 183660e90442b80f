#pragma once

#include <vkbind/shader_stages.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string_view>

namespace vkbind {

// What kind of resource may later be bound to a descriptor.
// Immutable samplers are not modeled.
enum class DescriptorType : std::uint32_t {
    Sampler              = VK_DESCRIPTOR_TYPE_SAMPLER,
    CombinedImageSampler = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
    SampledImage         = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE,
    StorageImage         = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE,
    UniformTexelBuffer   = VK_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER,
    StorageTexelBuffer   = VK_DESCRIPTOR_TYPE_STORAGE_TEXEL_BUFFER,
    UniformBuffer        = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
    StorageBuffer        = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
    UniformBufferDynamic = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC,
    StorageBufferDynamic = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC,
    InputAttachment      = VK_DESCRIPTOR_TYPE_INPUT_ATTACHMENT,
};

inline constexpr std::uint32_t kDescriptorTypeCount = 11;

[[nodiscard]] constexpr VkDescriptorType toVk(DescriptorType t) {
    return static_cast<VkDescriptorType>(t);
}

// The VK_DESCRIPTOR_TYPE_* values above are 0..10, so they double as an index.
[[nodiscard]] constexpr std::uint32_t descriptorTypeIndex(DescriptorType t) {
    return static_cast<std::uint32_t>(t);
}

[[nodiscard]] constexpr bool isBufferDescriptor(DescriptorType t) {
    return t == DescriptorType::UniformBuffer || t == DescriptorType::StorageBuffer ||
           t == DescriptorType::UniformBufferDynamic ||
           t == DescriptorType::StorageBufferDynamic;
}

[[nodiscard]] std::string_view descriptorTypeName(DescriptorType t);

// One shader binding slot of a descriptor set layout.
struct DescriptorDesc {
    std::uint32_t  binding    = 0;
    DescriptorType type       = DescriptorType::UniformBuffer;
    std::uint32_t  arrayCount = 1;
    ShaderStages   stages;

    bool operator==(const DescriptorDesc&) const = default;
};

} // namespace vkbind
