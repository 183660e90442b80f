#include <vkbind/descriptor_pool.hpp>

#include <cassert>
#include <string>

using vkbind::DescriptorCounts;
using vkbind::DescriptorPoolQuota;
using vkbind::DescriptorSetDesc;
using vkbind::DescriptorType;
using vkbind::ErrorKind;
using vkbind::ShaderStages;

namespace {

DescriptorCounts counts(DescriptorType type, std::uint32_t n) {
    DescriptorCounts c{};
    c[vkbind::descriptorTypeIndex(type)] = n;
    return c;
}

} // namespace

int main() {
    // Default quota holds nothing
    {
        DescriptorPoolQuota q;
        assert(q.maxSets() == 0);
        assert(!q.canReserve(DescriptorCounts{}));
        assert(q.reserve(DescriptorCounts{}).failedWith(ErrorKind::OutOfMemory));
    }

    // Exhausting the uniform buffer quota
    {
        DescriptorPoolQuota q(100, counts(DescriptorType::UniformBuffer, 10));
        const auto one = counts(DescriptorType::UniformBuffer, 1);

        for (int i = 0; i < 10; ++i) {
            assert(q.canReserve(one));
            assert(q.reserve(one).ok());
        }
        assert(q.allocatedSets() == 10);
        assert(q.allocated(DescriptorType::UniformBuffer) == 10);
        assert(q.remaining(DescriptorType::UniformBuffer) == 0);

        assert(!q.canReserve(one));
        auto r = q.reserve(one);
        assert(r.failedWith(ErrorKind::OutOfMemory));
        assert(r.error().message.find("uniform buffer") != std::string::npos);
        assert(q.allocatedSets() == 10);

        // Sets without descriptors of the exhausted kind still fit
        assert(q.canReserve(DescriptorCounts{}));

        q.release(one);
        assert(q.allocatedSets() == 9);
        assert(q.remaining(DescriptorType::UniformBuffer) == 1);
        assert(q.reserve(one).ok());
    }

    // Set count limit
    {
        DescriptorPoolQuota q(2, counts(DescriptorType::StorageBuffer, 100));
        const auto one = counts(DescriptorType::StorageBuffer, 1);
        assert(q.reserve(one).ok());
        assert(q.reserve(one).ok());
        auto r = q.reserve(one);
        assert(r.failedWith(ErrorKind::OutOfMemory));
        assert(r.error().message.find("maximum of 2 sets") != std::string::npos);
    }

    // All or nothing across kinds
    {
        DescriptorCounts limits{};
        limits[vkbind::descriptorTypeIndex(DescriptorType::UniformBuffer)] = 4;
        limits[vkbind::descriptorTypeIndex(DescriptorType::SampledImage)]  = 1;
        DescriptorPoolQuota q(10, limits);

        DescriptorCounts need{};
        need[vkbind::descriptorTypeIndex(DescriptorType::UniformBuffer)] = 2;
        need[vkbind::descriptorTypeIndex(DescriptorType::SampledImage)]  = 2;

        assert(q.reserve(need).failedWith(ErrorKind::OutOfMemory));
        assert(q.allocatedSets() == 0);
        assert(q.allocated(DescriptorType::UniformBuffer) == 0);
        assert(q.allocated(DescriptorType::SampledImage) == 0);
    }

    // A layout's pool sizes feed straight into the quota
    {
        auto desc = DescriptorSetDesc::create({
            {0, DescriptorType::UniformBuffer, 2, ShaderStages::allGraphics()},
            {1, DescriptorType::StorageBuffer, 1, ShaderStages::computeOnly()},
        }).value();

        DescriptorCounts limits{};
        limits[vkbind::descriptorTypeIndex(DescriptorType::UniformBuffer)] = 5;
        limits[vkbind::descriptorTypeIndex(DescriptorType::StorageBuffer)] = 5;
        DescriptorPoolQuota q(10, limits);

        assert(q.reserve(desc.poolSizes()).ok());
        assert(q.reserve(desc.poolSizes()).ok());
        // 6 uniform buffers would exceed the 5 available
        assert(!q.canReserve(desc.poolSizes()));
        assert(q.remaining(DescriptorType::UniformBuffer) == 1);
        assert(q.remaining(DescriptorType::StorageBuffer) == 3);
    }

    return 0;
}
