#include <vkbind/descriptor_set_desc.hpp>
#include <vkbind/buffer.hpp>
#include <vkbind/device.hpp>
#include <vkbind/image.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace vkbind {

namespace {

using Slot = std::pair<std::uint32_t, std::uint32_t>; // binding, array element

std::string slotName(std::uint32_t binding, std::uint32_t element) {
    return "binding " + std::to_string(binding) + "[" + std::to_string(element) + "]";
}

Error mismatch(const std::string& message) {
    return Error{"decode descriptor write", 0, message, ErrorKind::LayoutMismatch};
}

std::vector<DescriptorWrite> toWrites(DescriptorBindings binds) {
    std::vector<DescriptorWrite> writes;
    writes.reserve(binds.size());
    for (auto& [binding, content] : binds) {
        writes.push_back(DescriptorWrite{binding, 0, std::move(content)});
    }
    return writes;
}

VkBufferUsageFlags requiredBufferUsage(DescriptorType t) {
    switch (t) {
    case DescriptorType::UniformBuffer:
    case DescriptorType::UniformBufferDynamic:
        return VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    case DescriptorType::StorageBuffer:
    case DescriptorType::StorageBufferDynamic:
        return VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    default:
        return 0;
    }
}

VkImageUsageFlags requiredImageUsage(DescriptorType t) {
    switch (t) {
    case DescriptorType::SampledImage:
    case DescriptorType::CombinedImageSampler:
        return VK_IMAGE_USAGE_SAMPLED_BIT;
    case DescriptorType::StorageImage:
        return VK_IMAGE_USAGE_STORAGE_BIT;
    case DescriptorType::InputAttachment:
        return VK_IMAGE_USAGE_INPUT_ATTACHMENT_BIT;
    default:
        return 0;
    }
}

} // namespace

DescriptorBind DescriptorBind::bufferBind(DescriptorType type, std::shared_ptr<const Buffer> buffer,
                                          VkDeviceSize offset, VkDeviceSize range) {
    DescriptorBind b;
    b.type_   = type;
    b.buffer_ = std::move(buffer);
    b.offset_ = offset;
    b.range_  = range;
    return b;
}

DescriptorBind DescriptorBind::imageBind(DescriptorType type, std::shared_ptr<const Image> image,
                                         VkImageLayout layout) {
    DescriptorBind b;
    b.type_        = type;
    b.image_       = std::move(image);
    b.imageLayout_ = layout;
    return b;
}

DescriptorBind DescriptorBind::uniformBuffer(std::shared_ptr<const Buffer> buffer,
                                             VkDeviceSize offset, VkDeviceSize range) {
    return bufferBind(DescriptorType::UniformBuffer, std::move(buffer), offset, range);
}

DescriptorBind DescriptorBind::storageBuffer(std::shared_ptr<const Buffer> buffer,
                                             VkDeviceSize offset, VkDeviceSize range) {
    return bufferBind(DescriptorType::StorageBuffer, std::move(buffer), offset, range);
}

DescriptorBind DescriptorBind::uniformBufferDynamic(std::shared_ptr<const Buffer> buffer,
                                                    VkDeviceSize offset, VkDeviceSize range) {
    return bufferBind(DescriptorType::UniformBufferDynamic, std::move(buffer), offset, range);
}

DescriptorBind DescriptorBind::storageBufferDynamic(std::shared_ptr<const Buffer> buffer,
                                                    VkDeviceSize offset, VkDeviceSize range) {
    return bufferBind(DescriptorType::StorageBufferDynamic, std::move(buffer), offset, range);
}

DescriptorBind DescriptorBind::sampledImage(std::shared_ptr<const Image> image, VkImageLayout layout) {
    return imageBind(DescriptorType::SampledImage, std::move(image), layout);
}

DescriptorBind DescriptorBind::storageImage(std::shared_ptr<const Image> image, VkImageLayout layout) {
    return imageBind(DescriptorType::StorageImage, std::move(image), layout);
}

DescriptorBind DescriptorBind::inputAttachment(std::shared_ptr<const Image> image,
                                               VkImageLayout layout) {
    return imageBind(DescriptorType::InputAttachment, std::move(image), layout);
}

Result<void> DescriptorBind::validateResource() const {
    const std::string kind(descriptorTypeName(type_));

    if (isBuffer()) {
        if (!buffer_) {
            return Error{"validate descriptor resource", 0, kind + " has no buffer",
                         ErrorKind::InvalidArgument};
        }
        VkBufferUsageFlags need = requiredBufferUsage(type_);
        if ((buffer_->usage() & need) != need) {
            return Error{"validate descriptor resource", 0,
                         "buffer was not created with the usage a " + kind + " needs",
                         ErrorKind::InvalidArgument};
        }
        VkDeviceSize size = buffer_->size();
        if (offset_ >= size) {
            return Error{"validate descriptor resource", 0,
                         "offset " + std::to_string(offset_) + " is past the end of a " +
                             std::to_string(size) + "-byte buffer",
                         ErrorKind::InvalidArgument};
        }
        if (range_ != VK_WHOLE_SIZE && (range_ == 0 || range_ > size - offset_)) {
            return Error{"validate descriptor resource", 0,
                         "range " + std::to_string(range_) + " at offset " +
                             std::to_string(offset_) + " does not fit a " +
                             std::to_string(size) + "-byte buffer",
                         ErrorKind::InvalidArgument};
        }
        return {};
    }

    if (!image_) {
        return Error{"validate descriptor resource", 0, kind + " has no image",
                     ErrorKind::InvalidArgument};
    }
    VkImageUsageFlags need = requiredImageUsage(type_);
    if ((image_->usage() & need) != need) {
        return Error{"validate descriptor resource", 0,
                     "image was not created with the usage a " + kind + " needs",
                     ErrorKind::InvalidArgument};
    }
    // Image descriptors need a single-aspect view; Image only has a combined
    // depth+stencil view for these formats.
    if (formatClass(image_->format()) == FormatClass::DepthStencil) {
        return Error{"validate descriptor resource", 0,
                     std::string(formatName(image_->format())) +
                         " image has a depth+stencil view, a " + kind +
                         " needs a view with a single aspect",
                     ErrorKind::InvalidArgument};
    }
    return {};
}

Result<void> DescriptorBind::validateLimits(const DeviceLimits& limits) const {
    if (!isBuffer()) return {};

    const bool uniform = type_ == DescriptorType::UniformBuffer ||
                         type_ == DescriptorType::UniformBufferDynamic;
    const VkDeviceSize alignment = uniform ? limits.minUniformBufferOffsetAlignment
                                           : limits.minStorageBufferOffsetAlignment;
    const VkDeviceSize maxRange  = uniform ? limits.maxUniformBufferRange
                                           : limits.maxStorageBufferRange;
    const std::string kind(descriptorTypeName(type_));

    if (alignment > 1 && offset_ % alignment != 0) {
        return Error{"validate descriptor limits", 0,
                     kind + " offset " + std::to_string(offset_) +
                         " is not a multiple of this GPU's offset alignment of " +
                         std::to_string(alignment),
                     ErrorKind::InvalidArgument};
    }

    VkDeviceSize effective = range_;
    if (range_ == VK_WHOLE_SIZE) {
        if (!buffer_ || offset_ >= buffer_->size()) return {};
        effective = buffer_->size() - offset_;
    }
    if (effective > maxRange) {
        return Error{"validate descriptor limits", 0,
                     kind + " range of " + std::to_string(effective) +
                         " bytes exceeds this GPU's limit of " + std::to_string(maxRange),
                     ErrorKind::InvalidArgument};
    }
    return {};
}

Result<DescriptorSetDesc> DescriptorSetDesc::create(std::vector<DescriptorDesc> descriptors) {
    std::sort(descriptors.begin(), descriptors.end(),
              [](const DescriptorDesc& a, const DescriptorDesc& b) { return a.binding < b.binding; });

    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const auto& d = descriptors[i];
        if (i > 0 && descriptors[i - 1].binding == d.binding) {
            return Error{"create descriptor set desc", 0,
                         "binding " + std::to_string(d.binding) + " is declared twice",
                         ErrorKind::InvalidArgument};
        }
        if (d.arrayCount == 0) {
            return Error{"create descriptor set desc", 0,
                         "binding " + std::to_string(d.binding) + " has an array count of 0",
                         ErrorKind::InvalidArgument};
        }
        if (d.stages.empty()) {
            return Error{"create descriptor set desc", 0,
                         "binding " + std::to_string(d.binding) + " is visible to no shader stage",
                         ErrorKind::InvalidArgument};
        }
    }

    return DescriptorSetDesc(std::move(descriptors));
}

const DescriptorDesc* DescriptorSetDesc::find(std::uint32_t binding) const {
    auto it = std::lower_bound(descriptors_.begin(), descriptors_.end(), binding,
                               [](const DescriptorDesc& d, std::uint32_t b) { return d.binding < b; });
    if (it == descriptors_.end() || it->binding != binding) return nullptr;
    return &*it;
}

Result<void> DescriptorSetDesc::checkWrite(const DescriptorWrite& w) const {
    const DescriptorDesc* desc = find(w.binding);
    if (desc == nullptr) {
        return mismatch("binding " + std::to_string(w.binding) + " is not declared in this layout");
    }
    if (w.arrayElement >= desc->arrayCount) {
        return mismatch(slotName(w.binding, w.arrayElement) + " is out of range (array count " +
                        std::to_string(desc->arrayCount) + ")");
    }
    if (w.content.type() != desc->type) {
        return mismatch("binding " + std::to_string(w.binding) + " is a " +
                        std::string(descriptorTypeName(desc->type)) + ", got a " +
                        std::string(descriptorTypeName(w.content.type())));
    }
    if (!w.content.hasResource()) {
        return mismatch(slotName(w.binding, w.arrayElement) + " is written without a resource");
    }
    return w.content.validateResource();
}

Result<std::vector<DescriptorWrite>> DescriptorSetDesc::decodeWrite(
    std::vector<DescriptorWrite> writes) const {
    std::set<Slot> seen;
    for (const auto& w : writes) {
        auto check = checkWrite(w);
        if (!check.ok()) return check.error();

        if (!seen.insert({w.binding, w.arrayElement}).second) {
            return mismatch(slotName(w.binding, w.arrayElement) + " is written twice in one batch");
        }
    }
    return writes;
}

Result<std::vector<DescriptorWrite>> DescriptorSetDesc::decodeWrite(DescriptorBindings binds) const {
    return decodeWrite(toWrites(std::move(binds)));
}

Result<std::vector<DescriptorWrite>> DescriptorSetDesc::decodeInit(
    std::vector<DescriptorWrite> writes) const {
    auto decoded = decodeWrite(std::move(writes));
    if (!decoded.ok()) return decoded;

    std::set<Slot> covered;
    for (const auto& w : decoded.value()) {
        covered.insert({w.binding, w.arrayElement});
    }

    for (const auto& d : descriptors_) {
        for (std::uint32_t e = 0; e < d.arrayCount; ++e) {
            if (covered.count({d.binding, e}) == 0) {
                return Error{"decode descriptor init", 0,
                             slotName(d.binding, e) + " (" +
                                 std::string(descriptorTypeName(d.type)) +
                                 ") is not initialized",
                             ErrorKind::LayoutMismatch};
            }
        }
    }
    return decoded;
}

Result<std::vector<DescriptorWrite>> DescriptorSetDesc::decodeInit(DescriptorBindings binds) const {
    return decodeInit(toWrites(std::move(binds)));
}

bool DescriptorSetDesc::isCompatibleWith(const DescriptorSetDesc& other) const {
    return descriptors_ == other.descriptors_;
}

DescriptorCounts DescriptorSetDesc::poolSizes() const {
    DescriptorCounts counts{};
    for (const auto& d : descriptors_) {
        counts[descriptorTypeIndex(d.type)] += d.arrayCount;
    }
    return counts;
}

std::uint32_t DescriptorSetDesc::descriptorCount() const {
    std::uint32_t total = 0;
    for (const auto& d : descriptors_) total += d.arrayCount;
    return total;
}

std::uint32_t DescriptorSetDesc::dynamicDescriptorCount() const {
    std::uint32_t total = 0;
    for (const auto& d : descriptors_) {
        if (d.type == DescriptorType::UniformBufferDynamic ||
            d.type == DescriptorType::StorageBufferDynamic) {
            total += d.arrayCount;
        }
    }
    return total;
}

std::vector<VkDescriptorSetLayoutBinding> DescriptorSetDesc::toVk() const {
    std::vector<VkDescriptorSetLayoutBinding> out;
    out.reserve(descriptors_.size());
    for (const auto& d : descriptors_) {
        VkDescriptorSetLayoutBinding b{};
        b.binding         = d.binding;
        b.descriptorType  = vkbind::toVk(d.type);
        b.descriptorCount = d.arrayCount;
        b.stageFlags      = d.stages.toVk();
        out.push_back(b);
    }
    return out;
}

} // namespace vkbind
