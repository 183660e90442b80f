#pragma once

#include <vkbind/descriptor_set_desc.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vkbind {

class Device;

// Accumulates descriptor writes for one set and issues them in a single
// vkUpdateDescriptorSets call. Performs no validation: feed it writes that
// went through DescriptorSetDesc::decodeWrite/decodeInit.
//
// Usage:
//   DescriptorWriter(set)
//       .add(decodedWrites)
//       .write(device);
class DescriptorWriter {
public:
    explicit DescriptorWriter(VkDescriptorSet set);

    [[nodiscard]] VkDescriptorSet descriptorSet() const { return set_; }
    [[nodiscard]] std::size_t     pendingCount()  const { return pending_.size(); }

    DescriptorWriter& add(const DescriptorWrite& write);
    DescriptorWriter& add(const std::vector<DescriptorWrite>& writes);

    // Raw forms for handles not owned by vkbind.
    DescriptorWriter& buffer(std::uint32_t binding, std::uint32_t arrayElement,
                             VkBuffer buf, VkDeviceSize offset, VkDeviceSize range,
                             VkDescriptorType type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);

    DescriptorWriter& image(std::uint32_t binding, std::uint32_t arrayElement,
                            VkImageView view, VkImageLayout layout,
                            VkDescriptorType type = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE,
                            VkSampler sampler = VK_NULL_HANDLE);

    void write(VkDevice device);
    void write(const Device& device);

private:
    VkDescriptorSet set_;

    // VkWriteDescriptorSet array is built at write() time; the info vectors
    // may still reallocate while writes accumulate.
    enum class InfoKind : std::uint8_t { Image, Buffer };

    struct PendingWrite {
        std::uint32_t    binding;
        std::uint32_t    arrayElement;
        VkDescriptorType type;
        InfoKind         kind;
        std::uint32_t    infoIndex;
    };

    std::vector<VkDescriptorImageInfo>  imageInfos_;
    std::vector<VkDescriptorBufferInfo> bufferInfos_;
    std::vector<PendingWrite>           pending_;
};

} // namespace vkbind
