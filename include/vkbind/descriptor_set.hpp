#pragma once

#include <vkbind/descriptor_set_desc.hpp>
#include <vkbind/device.hpp>
#include <vkbind/error.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace vkbind {

class DescriptorPool;
class DescriptorSetLayout;

// A descriptor set allocated from a DescriptorPool and fully populated at
// creation. Either every step (decode, device limits, quota, allocation,
// write) succeeds or nothing is allocated.
//
// Keeps its layout and every bound resource alive. Holds only a weak
// reference to its pool: once the pool is destroyed the set is no longer
// usable(), update() fails, and destruction releases just the resources.
//
// Descriptor safety: do not destroy or update while a command buffer using
// the set is pending.
//
// Thread safety: thread-confined, like its pool.
class DescriptorSet {
public:
    [[nodiscard]] static Result<std::shared_ptr<DescriptorSet>> create(
        const std::shared_ptr<DescriptorPool>& pool,
        std::shared_ptr<const DescriptorSetLayout> layout,
        std::vector<DescriptorWrite> init);

    [[nodiscard]] static Result<std::shared_ptr<DescriptorSet>> create(
        const std::shared_ptr<DescriptorPool>& pool,
        std::shared_ptr<const DescriptorSetLayout> layout,
        DescriptorBindings init);

    ~DescriptorSet();
    DescriptorSet(const DescriptorSet&) = delete;
    DescriptorSet& operator=(const DescriptorSet&) = delete;

    [[nodiscard]] VkDescriptorSet native()          const { return set_; }
    [[nodiscard]] VkDescriptorSet vkDescriptorSet() const { return native(); }

    [[nodiscard]] const std::shared_ptr<const DescriptorSetLayout>& layout() const { return layout_; }

    // False once the pool it came from has been destroyed.
    [[nodiscard]] bool usable() const { return !pool_.expired(); }

    // Validated against the layout and the device limits, then issued as one
    // vkUpdateDescriptorSets.
    // Overwriting a slot drops the reference to the resource it held.
    [[nodiscard]] Result<void> update(std::vector<DescriptorWrite> writes);
    [[nodiscard]] Result<void> update(DescriptorBindings writes);

    // The resource currently bound to a slot, or nullptr.
    [[nodiscard]] const DescriptorBind* boundResource(std::uint32_t binding,
                                                      std::uint32_t arrayElement = 0) const;

private:
    DescriptorSet() = default;

    [[nodiscard]] static Result<void> checkLimits(const std::vector<DescriptorWrite>& writes,
                                                  const DeviceLimits& limits);
    void record(std::vector<DescriptorWrite> writes);

    std::weak_ptr<DescriptorPool>              pool_;
    std::shared_ptr<const DescriptorSetLayout> layout_;
    DeviceLimits                               limits_;
    VkDevice                                   device_ = VK_NULL_HANDLE;
    VkDescriptorSet                            set_    = VK_NULL_HANDLE;

    // (binding, array element) -> resource
    std::map<std::pair<std::uint32_t, std::uint32_t>, DescriptorBind> resources_;
};

} // namespace vkbind
