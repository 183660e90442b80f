#include <vkbind/descriptor_pool.hpp>

#include <string>

namespace vkbind {

bool DescriptorPoolQuota::canReserve(const DescriptorCounts& need) const {
    if (allocatedSets_ >= maxSets_) return false;
    for (std::size_t i = 0; i < need.size(); ++i) {
        if (static_cast<std::uint64_t>(allocated_[i]) + need[i] > limits_[i]) return false;
    }
    return true;
}

Result<void> DescriptorPoolQuota::reserve(const DescriptorCounts& need) {
    if (allocatedSets_ >= maxSets_) {
        return Error{"allocate descriptor set", 0,
                     "pool already holds its maximum of " + std::to_string(maxSets_) + " sets",
                     ErrorKind::OutOfMemory};
    }
    for (std::size_t i = 0; i < need.size(); ++i) {
        if (static_cast<std::uint64_t>(allocated_[i]) + need[i] > limits_[i]) {
            auto type = static_cast<DescriptorType>(i);
            return Error{"allocate descriptor set", 0,
                         "set needs " + std::to_string(need[i]) + " " +
                             std::string(descriptorTypeName(type)) + " descriptors, pool has " +
                             std::to_string(limits_[i] - allocated_[i]) + " of " +
                             std::to_string(limits_[i]) + " left",
                         ErrorKind::OutOfMemory};
        }
    }

    ++allocatedSets_;
    for (std::size_t i = 0; i < need.size(); ++i) {
        allocated_[i] += need[i];
    }
    return {};
}

void DescriptorPoolQuota::release(const DescriptorCounts& need) {
    if (allocatedSets_ > 0) --allocatedSets_;
    for (std::size_t i = 0; i < need.size(); ++i) {
        allocated_[i] = need[i] > allocated_[i] ? 0 : allocated_[i] - need[i];
    }
}

} // namespace vkbind
