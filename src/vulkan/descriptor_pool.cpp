#include <vkbind/descriptor_pool.hpp>
#include <vkbind/descriptor_set_layout.hpp>
#include <vkbind/device.hpp>

#include <cstdint>
#include <cstdio>
#include <vector>

namespace vkbind {

DescriptorPool::~DescriptorPool() {
    if (pool_ == VK_NULL_HANDLE) return;
#ifndef NDEBUG
    if (quota_.allocatedSets() > 0) {
        std::fprintf(stderr,
            "[vkbind] destroying descriptor pool with %u live set(s); they become unusable\n",
            quota_.allocatedSets());
    }
#endif
    vkDestroyDescriptorPool(device_, pool_, nullptr);
}

Result<std::shared_ptr<DescriptorPool>> DescriptorPool::create(const Device& device) {
    return DescriptorPoolBuilder(device)
        .maxSets(100)
        .quota(DescriptorType::UniformBuffer, 10)
        .build();
}

bool DescriptorPool::canAllocate(const DescriptorSetLayout& layout) const {
    return quota_.canReserve(layout.desc().poolSizes());
}

Result<VkDescriptorSet> DescriptorPool::allocate(const DescriptorSetLayout& layout) {
    if (layout.vkDevice() != device_) {
        return Error{"allocate descriptor set", 0,
                     "layout and pool belong to different devices", ErrorKind::InvalidArgument};
    }

    DescriptorCounts need = layout.desc().poolSizes();
    auto reserved = quota_.reserve(need);
    if (!reserved.ok()) return reserved.error();

    VkDescriptorSetLayout vkLayout = layout.vkDescriptorSetLayout();

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType              = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool     = pool_;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts        = &vkLayout;

    VkDescriptorSet set = VK_NULL_HANDLE;
    VkResult vr = vkAllocateDescriptorSets(device_, &allocInfo, &set);
    if (vr != VK_SUCCESS) {
        quota_.release(need);
        return vulkanError("allocate descriptor set", vr, "vkAllocateDescriptorSets failed");
    }

    return set;
}

void DescriptorPool::freeSet(VkDescriptorSet set, const DescriptorCounts& counts) {
    if (set == VK_NULL_HANDLE) return;
    VkResult vr = vkFreeDescriptorSets(device_, pool_, 1, &set);
    if (vr != VK_SUCCESS) {
        std::fprintf(stderr, "[vkbind] vkFreeDescriptorSets failed (%s)\n", vkResultName(vr));
    }
    quota_.release(counts);
}

DescriptorPoolBuilder::DescriptorPoolBuilder(const Device& device)
    : device_(device.vkDevice()), limits_(device.limits()) {}

DescriptorPoolBuilder& DescriptorPoolBuilder::maxSets(std::uint32_t count) {
    maxSets_ = count;
    return *this;
}

DescriptorPoolBuilder& DescriptorPoolBuilder::quota(DescriptorType type, std::uint32_t count) {
    quotas_[descriptorTypeIndex(type)] = count;
    return *this;
}

DescriptorPoolBuilder& DescriptorPoolBuilder::fitLayout(const DescriptorSetDesc& desc,
                                                        std::uint32_t sets) {
    constexpr std::uint64_t kMax = UINT32_MAX;
    DescriptorCounts counts = desc.poolSizes();
    for (std::size_t i = 0; i < counts.size(); ++i) {
        std::uint64_t total = quotas_[i] + static_cast<std::uint64_t>(counts[i]) * sets;
        if (total > kMax) {
            overflow_ = true;
            total     = kMax;
        }
        quotas_[i] = static_cast<std::uint32_t>(total);
    }
    std::uint64_t setTotal = static_cast<std::uint64_t>(maxSets_) + sets;
    if (setTotal > kMax) {
        overflow_ = true;
        setTotal  = kMax;
    }
    maxSets_ = static_cast<std::uint32_t>(setTotal);
    return *this;
}

Result<std::shared_ptr<DescriptorPool>> DescriptorPoolBuilder::build() {
    if (device_ == VK_NULL_HANDLE) {
        return Error{"create descriptor pool", 0, "device is not valid",
                     ErrorKind::InvalidArgument};
    }
    if (overflow_) {
        return Error{"create descriptor pool", 0,
                     "fitLayout() totals overflow 32-bit descriptor or set counts",
                     ErrorKind::InvalidArgument};
    }
    if (maxSets_ == 0) {
        return Error{"create descriptor pool", 0,
                     "maxSets is 0 -- call maxSets(n) or fitLayout()",
                     ErrorKind::InvalidArgument};
    }

    std::vector<VkDescriptorPoolSize> poolSizes;
    for (std::uint32_t i = 0; i < kDescriptorTypeCount; ++i) {
        if (quotas_[i] == 0) continue;
        poolSizes.push_back({toVk(static_cast<DescriptorType>(i)), quotas_[i]});
    }
    if (poolSizes.empty()) {
        return Error{"create descriptor pool", 0,
                     "no descriptor quota -- call quota(type, count) or fitLayout()",
                     ErrorKind::InvalidArgument};
    }

    VkDescriptorPoolCreateInfo poolCI{};
    poolCI.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolCI.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    poolCI.maxSets       = maxSets_;
    poolCI.poolSizeCount = static_cast<std::uint32_t>(poolSizes.size());
    poolCI.pPoolSizes    = poolSizes.data();

    std::shared_ptr<DescriptorPool> pool(new DescriptorPool());
    pool->device_ = device_;
    pool->limits_ = limits_;
    pool->quota_  = DescriptorPoolQuota(maxSets_, quotas_);

    VkResult vr = vkCreateDescriptorPool(device_, &poolCI, nullptr, &pool->pool_);
    if (vr != VK_SUCCESS) {
        pool->pool_ = VK_NULL_HANDLE;
        return vulkanError("create descriptor pool", vr, "vkCreateDescriptorPool failed");
    }

    return pool;
}

} // namespace vkbind
