#include <vkbind/descriptor_set_layout.hpp>
#include <vkbind/device.hpp>

#include <vector>

namespace vkbind {

DescriptorSetLayout::~DescriptorSetLayout() {
    if (layout_ != VK_NULL_HANDLE) {
        vkDestroyDescriptorSetLayout(device_, layout_, nullptr);
    }
}

Result<std::shared_ptr<const DescriptorSetLayout>> DescriptorSetLayout::create(
    const Device& device, DescriptorSetDesc desc) {
    if (device.vkDevice() == VK_NULL_HANDLE) {
        return Error{"create descriptor set layout", 0, "device is not valid",
                     ErrorKind::InvalidArgument};
    }

    std::shared_ptr<DescriptorSetLayout> layout(new DescriptorSetLayout(std::move(desc)));
    layout->device_ = device.vkDevice();

    std::vector<VkDescriptorSetLayoutBinding> vkBindings = layout->desc_.toVk();

    VkDescriptorSetLayoutCreateInfo ci{};
    ci.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    ci.bindingCount = static_cast<std::uint32_t>(vkBindings.size());
    ci.pBindings    = vkBindings.empty() ? nullptr : vkBindings.data();

    VkResult vr = vkCreateDescriptorSetLayout(layout->device_, &ci, nullptr, &layout->layout_);
    if (vr != VK_SUCCESS) {
        layout->layout_ = VK_NULL_HANDLE;
        return vulkanError("create descriptor set layout", vr, "vkCreateDescriptorSetLayout failed");
    }

    return std::shared_ptr<const DescriptorSetLayout>(std::move(layout));
}

} // namespace vkbind
