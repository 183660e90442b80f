#pragma once

#include <vkbind/descriptor_set_desc.hpp>
#include <vkbind/device.hpp>
#include <vkbind/error.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <memory>

namespace vkbind {

class DescriptorSet;
class DescriptorSetLayout;

// Bookkeeping for a pool's fixed capacity: a maximum set count and a
// descriptor quota per type. No Vulkan calls.
class DescriptorPoolQuota {
public:
    DescriptorPoolQuota() = default;
    DescriptorPoolQuota(std::uint32_t maxSets, const DescriptorCounts& limits)
        : maxSets_(maxSets), limits_(limits) {}

    [[nodiscard]] std::uint32_t maxSets()       const { return maxSets_; }
    [[nodiscard]] std::uint32_t allocatedSets() const { return allocatedSets_; }
    [[nodiscard]] std::uint32_t limit(DescriptorType t) const {
        return limits_[descriptorTypeIndex(t)];
    }
    [[nodiscard]] std::uint32_t allocated(DescriptorType t) const {
        return allocated_[descriptorTypeIndex(t)];
    }
    [[nodiscard]] std::uint32_t remaining(DescriptorType t) const {
        return limit(t) - allocated(t);
    }
    [[nodiscard]] const DescriptorCounts& limits() const { return limits_; }

    // Whether one more set with `need` descriptors fits.
    [[nodiscard]] bool canReserve(const DescriptorCounts& need) const;

    // All or nothing: on failure nothing is reserved.
    [[nodiscard]] Result<void> reserve(const DescriptorCounts& need);

    void release(const DescriptorCounts& need);

private:
    std::uint32_t    maxSets_       = 0;
    std::uint32_t    allocatedSets_ = 0;
    DescriptorCounts limits_{};
    DescriptorCounts allocated_{};
};

// Descriptor pool with capacity fixed at construction. Sets allocated from it
// return their descriptors when destroyed. Exhaustion is reported as an
// OutOfMemory error; the pool never grows and never retries.
//
// Destroying the pool frees every set still allocated from it. Those sets
// become unusable, but the resources written into them stay alive until
// their own last reference is dropped.
//
// Descriptor safety: do not destroy the pool while a command buffer that
// uses one of its sets is pending. The Device must outlive the pool.
//
// Thread safety: thread-confined.
class DescriptorPool {
public:
    // 100 sets, 10 uniform buffer descriptors.
    [[nodiscard]] static Result<std::shared_ptr<DescriptorPool>> create(const Device& device);

    ~DescriptorPool();
    DescriptorPool(const DescriptorPool&) = delete;
    DescriptorPool& operator=(const DescriptorPool&) = delete;

    [[nodiscard]] VkDescriptorPool native()           const { return pool_; }
    [[nodiscard]] VkDescriptorPool vkDescriptorPool() const { return native(); }
    [[nodiscard]] VkDevice         vkDevice()         const { return device_; }

    // Limits of the device the pool was created on. Writes into its sets are
    // checked against them.
    [[nodiscard]] const DeviceLimits& limits() const { return limits_; }

    [[nodiscard]] const DescriptorPoolQuota& quota() const { return quota_; }
    [[nodiscard]] std::uint32_t maxSets()           const { return quota_.maxSets(); }
    [[nodiscard]] std::uint32_t allocatedSetCount() const { return quota_.allocatedSets(); }
    [[nodiscard]] std::uint32_t quota(DescriptorType t) const { return quota_.limit(t); }
    [[nodiscard]] std::uint32_t allocatedDescriptorCount(DescriptorType t) const {
        return quota_.allocated(t);
    }

    // Whether a set with this layout would fit right now.
    [[nodiscard]] bool canAllocate(const DescriptorSetLayout& layout) const;

private:
    friend class DescriptorPoolBuilder;
    friend class DescriptorSet;
    DescriptorPool() = default;

    [[nodiscard]] Result<VkDescriptorSet> allocate(const DescriptorSetLayout& layout);
    void freeSet(VkDescriptorSet set, const DescriptorCounts& counts);

    VkDevice            device_ = VK_NULL_HANDLE;
    VkDescriptorPool    pool_   = VK_NULL_HANDLE;
    DeviceLimits        limits_;
    DescriptorPoolQuota quota_;
};

class DescriptorPoolBuilder {
public:
    explicit DescriptorPoolBuilder(const Device& device);

    DescriptorPoolBuilder& maxSets(std::uint32_t count);

    // Sets the quota for one type; types never given a quota get none.
    DescriptorPoolBuilder& quota(DescriptorType type, std::uint32_t count);

    // Room for `sets` sets of this shape. Totals that overflow 32 bits make
    // build() fail.
    DescriptorPoolBuilder& fitLayout(const DescriptorSetDesc& desc, std::uint32_t sets);

    [[nodiscard]] Result<std::shared_ptr<DescriptorPool>> build();

private:
    VkDevice         device_   = VK_NULL_HANDLE;
    DeviceLimits     limits_;
    std::uint32_t    maxSets_  = 0;
    DescriptorCounts quotas_{};
    bool             overflow_ = false;
};

} // namespace vkbind
