#include <vkbind/descriptor_writer.hpp>
#include <vkbind/buffer.hpp>
#include <vkbind/device.hpp>
#include <vkbind/image.hpp>

namespace vkbind {

DescriptorWriter::DescriptorWriter(VkDescriptorSet set) : set_(set) {}

DescriptorWriter& DescriptorWriter::add(const DescriptorWrite& write) {
    const DescriptorBind& c = write.content;
    if (c.buffer()) {
        return buffer(write.binding, write.arrayElement, c.buffer()->vkBuffer(),
                      c.offset(), c.range(), toVk(c.type()));
    }
    if (c.image()) {
        return image(write.binding, write.arrayElement, c.image()->vkImageView(),
                     c.imageLayout(), toVk(c.type()));
    }
    return *this;
}

DescriptorWriter& DescriptorWriter::add(const std::vector<DescriptorWrite>& writes) {
    for (const auto& w : writes) add(w);
    return *this;
}

DescriptorWriter& DescriptorWriter::buffer(std::uint32_t binding, std::uint32_t arrayElement,
                                           VkBuffer buf, VkDeviceSize offset, VkDeviceSize range,
                                           VkDescriptorType type) {
    VkDescriptorBufferInfo info{};
    info.buffer = buf;
    info.offset = offset;
    info.range  = range;
    auto idx = static_cast<std::uint32_t>(bufferInfos_.size());
    bufferInfos_.push_back(info);
    pending_.push_back({binding, arrayElement, type, InfoKind::Buffer, idx});
    return *this;
}

DescriptorWriter& DescriptorWriter::image(std::uint32_t binding, std::uint32_t arrayElement,
                                          VkImageView view, VkImageLayout layout,
                                          VkDescriptorType type, VkSampler sampler) {
    VkDescriptorImageInfo info{};
    info.sampler     = sampler;
    info.imageView   = view;
    info.imageLayout = layout;
    auto idx = static_cast<std::uint32_t>(imageInfos_.size());
    imageInfos_.push_back(info);
    pending_.push_back({binding, arrayElement, type, InfoKind::Image, idx});
    return *this;
}

void DescriptorWriter::write(VkDevice device) {
    std::vector<VkWriteDescriptorSet> writes;
    writes.reserve(pending_.size());

    for (const auto& pw : pending_) {
        VkWriteDescriptorSet w{};
        w.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        w.dstSet          = set_;
        w.dstBinding      = pw.binding;
        w.dstArrayElement = pw.arrayElement;
        w.descriptorCount = 1;
        w.descriptorType  = pw.type;

        if (pw.kind == InfoKind::Image) {
            w.pImageInfo = &imageInfos_[pw.infoIndex];
        } else {
            w.pBufferInfo = &bufferInfos_[pw.infoIndex];
        }

        writes.push_back(w);
    }

    if (!writes.empty()) {
        vkUpdateDescriptorSets(device, static_cast<std::uint32_t>(writes.size()), writes.data(),
                               0, nullptr);
    }

    pending_.clear();
    bufferInfos_.clear();
    imageInfos_.clear();
}

void DescriptorWriter::write(const Device& device) {
    write(device.vkDevice());
}

} // namespace vkbind
