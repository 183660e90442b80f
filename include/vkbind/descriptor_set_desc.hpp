#pragma once

#include <vkbind/descriptor_desc.hpp>
#include <vkbind/error.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace vkbind {

class Buffer;
class Image;
struct DeviceLimits;

// Descriptor count per DescriptorType, indexed by descriptorTypeIndex().
using DescriptorCounts = std::array<std::uint32_t, kDescriptorTypeCount>;

// A resource to bind into one descriptor slot. The resource is shared: the
// descriptor set that receives it keeps it alive as long as the slot holds it.
//
// Samplers and texel buffer views have no payload yet, so bindings of those
// kinds can be declared but not written.
class DescriptorBind {
public:
    DescriptorBind() = default;

    [[nodiscard]] static DescriptorBind uniformBuffer(std::shared_ptr<const Buffer> buffer,
                                                      VkDeviceSize offset = 0,
                                                      VkDeviceSize range  = VK_WHOLE_SIZE);
    [[nodiscard]] static DescriptorBind storageBuffer(std::shared_ptr<const Buffer> buffer,
                                                      VkDeviceSize offset = 0,
                                                      VkDeviceSize range  = VK_WHOLE_SIZE);
    [[nodiscard]] static DescriptorBind uniformBufferDynamic(std::shared_ptr<const Buffer> buffer,
                                                             VkDeviceSize offset = 0,
                                                             VkDeviceSize range  = VK_WHOLE_SIZE);
    [[nodiscard]] static DescriptorBind storageBufferDynamic(std::shared_ptr<const Buffer> buffer,
                                                             VkDeviceSize offset = 0,
                                                             VkDeviceSize range  = VK_WHOLE_SIZE);

    [[nodiscard]] static DescriptorBind sampledImage(
        std::shared_ptr<const Image> image,
        VkImageLayout layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    [[nodiscard]] static DescriptorBind storageImage(
        std::shared_ptr<const Image> image,
        VkImageLayout layout = VK_IMAGE_LAYOUT_GENERAL);
    [[nodiscard]] static DescriptorBind inputAttachment(
        std::shared_ptr<const Image> image,
        VkImageLayout layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

    [[nodiscard]] DescriptorType type()        const { return type_; }
    [[nodiscard]] bool           isBuffer()    const { return isBufferDescriptor(type_); }
    [[nodiscard]] bool           hasResource() const { return buffer_ != nullptr || image_ != nullptr; }

    [[nodiscard]] const std::shared_ptr<const Buffer>& buffer() const { return buffer_; }
    [[nodiscard]] const std::shared_ptr<const Image>&  image()  const { return image_; }

    [[nodiscard]] VkDeviceSize  offset()      const { return offset_; }
    [[nodiscard]] VkDeviceSize  range()       const { return range_; }
    [[nodiscard]] VkImageLayout imageLayout() const { return imageLayout_; }

    // Checks the resource itself: usage flags, offset/range within bounds,
    // and for images a view a descriptor can use.
    [[nodiscard]] Result<void> validateResource() const;

    // Buffer offset alignment and range against the GPU's limits. Image
    // payloads always pass.
    [[nodiscard]] Result<void> validateLimits(const DeviceLimits& limits) const;

private:
    static DescriptorBind bufferBind(DescriptorType type, std::shared_ptr<const Buffer> buffer,
                                     VkDeviceSize offset, VkDeviceSize range);
    static DescriptorBind imageBind(DescriptorType type, std::shared_ptr<const Image> image,
                                    VkImageLayout layout);

    DescriptorType                type_        = DescriptorType::UniformBuffer;
    std::shared_ptr<const Buffer> buffer_;
    std::shared_ptr<const Image>  image_;
    VkDeviceSize                  offset_      = 0;
    VkDeviceSize                  range_       = VK_WHOLE_SIZE;
    VkImageLayout                 imageLayout_ = VK_IMAGE_LAYOUT_UNDEFINED;
};

// Binds `content` to element `arrayElement` of `binding`.
struct DescriptorWrite {
    std::uint32_t  binding      = 0;
    std::uint32_t  arrayElement = 0;
    DescriptorBind content;
};

// Shorthand for writes that target array element 0.
using DescriptorBindings = std::vector<std::pair<std::uint32_t, DescriptorBind>>;

// The shape of one descriptor set layout: binding slots ordered by index.
// This is the single place where writes are checked against the layout;
// everything below it (DescriptorWriter, vkUpdateDescriptorSets) trusts it.
//
// Thread safety: immutable after construction.
class DescriptorSetDesc {
public:
    // Empty layout. Valid in Vulkan as a placeholder set.
    DescriptorSetDesc() = default;

    // Rejects duplicate binding indices, arrayCount == 0 and empty stage sets.
    [[nodiscard]] static Result<DescriptorSetDesc> create(std::vector<DescriptorDesc> descriptors);

    [[nodiscard]] const std::vector<DescriptorDesc>& descriptors() const { return descriptors_; }
    [[nodiscard]] const DescriptorDesc*              find(std::uint32_t binding) const;
    [[nodiscard]] bool                               empty() const { return descriptors_.empty(); }

    // Validates a batch of writes. Each slot may be written at most once.
    [[nodiscard]] Result<std::vector<DescriptorWrite>> decodeWrite(
        std::vector<DescriptorWrite> writes) const;
    [[nodiscard]] Result<std::vector<DescriptorWrite>> decodeWrite(DescriptorBindings binds) const;

    // decodeWrite plus completeness: every element of every binding must be
    // written exactly once.
    [[nodiscard]] Result<std::vector<DescriptorWrite>> decodeInit(
        std::vector<DescriptorWrite> writes) const;
    [[nodiscard]] Result<std::vector<DescriptorWrite>> decodeInit(DescriptorBindings binds) const;

    // Same bindings with the same kinds, counts and stages.
    [[nodiscard]] bool isCompatibleWith(const DescriptorSetDesc& other) const;

    [[nodiscard]] DescriptorCounts poolSizes() const;
    [[nodiscard]] std::uint32_t    descriptorCount() const;
    [[nodiscard]] std::uint32_t    dynamicDescriptorCount() const;

    [[nodiscard]] std::vector<VkDescriptorSetLayoutBinding> toVk() const;

private:
    explicit DescriptorSetDesc(std::vector<DescriptorDesc> descriptors)
        : descriptors_(std::move(descriptors)) {}

    [[nodiscard]] Result<void> checkWrite(const DescriptorWrite& w) const;

    std::vector<DescriptorDesc> descriptors_; // sorted by binding
};

} // namespace vkbind
