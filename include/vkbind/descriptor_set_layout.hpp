#pragma once

#include <vkbind/descriptor_set_desc.hpp>
#include <vkbind/error.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <memory>

namespace vkbind {

class Device;

// VkDescriptorSetLayout built once from a DescriptorSetDesc. Shared by every
// pipeline layout and descriptor set that uses it; destroyed with the last
// reference. The Device must outlive it.
//
// Thread safety: immutable after construction.
class DescriptorSetLayout {
public:
    [[nodiscard]] static Result<std::shared_ptr<const DescriptorSetLayout>> create(
        const Device& device, DescriptorSetDesc desc);

    ~DescriptorSetLayout();
    DescriptorSetLayout(const DescriptorSetLayout&) = delete;
    DescriptorSetLayout& operator=(const DescriptorSetLayout&) = delete;

    [[nodiscard]] VkDescriptorSetLayout    native()                const { return layout_; }
    [[nodiscard]] VkDescriptorSetLayout    vkDescriptorSetLayout() const { return native(); }
    [[nodiscard]] VkDevice                 vkDevice()              const { return device_; }
    [[nodiscard]] const DescriptorSetDesc& desc()                  const { return desc_; }

    [[nodiscard]] bool isCompatibleWith(const DescriptorSetLayout& other) const {
        return desc_.isCompatibleWith(other.desc_);
    }

private:
    explicit DescriptorSetLayout(DescriptorSetDesc desc) : desc_(std::move(desc)) {}

    VkDevice              device_ = VK_NULL_HANDLE;
    VkDescriptorSetLayout layout_ = VK_NULL_HANDLE;
    DescriptorSetDesc     desc_;
};

} // namespace vkbind
