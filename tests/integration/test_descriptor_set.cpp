#include <vkbind/vkbind.hpp>
#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using vkbind::Buffer;
using vkbind::DescriptorBind;
using vkbind::DescriptorPool;
using vkbind::DescriptorPoolBuilder;
using vkbind::DescriptorSet;
using vkbind::DescriptorSetDesc;
using vkbind::DescriptorSetLayout;
using vkbind::DescriptorType;
using vkbind::DescriptorWrite;
using vkbind::ErrorKind;
using vkbind::ShaderStages;

int main() {
    auto instance = vkbind::InstanceBuilder{}
        .appName("test_descriptor_set")
        .requireVulkan(1, 1)
        .validation(vkbind::Validation::On)
        .build();
    if (!instance.ok()) {
        std::printf("skipped: %s\n", instance.error().format().c_str());
        return 77;
    }

    auto device = vkbind::DeviceBuilder(instance.value()).preferDiscreteGpu().build();
    if (!device.ok()) {
        std::printf("skipped: %s\n", device.error().format().c_str());
        return 77;
    }

    auto allocator = vkbind::Allocator::create(instance.value(), device.value());
    assert(allocator.ok());

    auto makeUbo = [&]() {
        return std::make_shared<Buffer>(
            vkbind::BufferBuilder(allocator.value()).size(256).uniformBuffer().build().value());
    };
    auto makeSsbo = [&]() {
        return std::make_shared<Buffer>(
            vkbind::BufferBuilder(allocator.value()).size(1024).storageBuffer().build().value());
    };

    // binding 0: one uniform buffer, binding 1: two storage buffers
    auto desc = DescriptorSetDesc::create({
        {0, DescriptorType::UniformBuffer, 1, ShaderStages::allGraphics()},
        {1, DescriptorType::StorageBuffer, 2, ShaderStages::computeOnly()},
    }).value();
    auto layout = DescriptorSetLayout::create(device.value(), desc).value();

    auto ubo   = makeUbo();
    auto ssbo0 = makeSsbo();
    auto ssbo1 = makeSsbo();

    auto fullInit = [&]() {
        std::vector<DescriptorWrite> w;
        w.push_back({0, 0, DescriptorBind::uniformBuffer(ubo)});
        w.push_back({1, 0, DescriptorBind::storageBuffer(ssbo0)});
        w.push_back({1, 1, DescriptorBind::storageBuffer(ssbo1, 0, 512)});
        return w;
    };

    // Fully initialized set
    {
        auto pool = DescriptorPoolBuilder(device.value()).fitLayout(desc, 4).build().value();

        auto set = DescriptorSet::create(pool, layout, fullInit());
        assert(set.ok());
        assert(set.value()->vkDescriptorSet() != VK_NULL_HANDLE);
        assert(set.value()->usable());
        assert(set.value()->layout() == layout);
        assert(pool->allocatedSetCount() == 1);
        assert(pool->allocatedDescriptorCount(DescriptorType::StorageBuffer) == 2);

        const DescriptorBind* bound = set.value()->boundResource(1, 1);
        assert(bound != nullptr);
        assert(bound->buffer() == ssbo1);
        assert(bound->range() == 512);
        assert(set.value()->boundResource(1, 2) == nullptr);
        assert(set.value()->boundResource(5) == nullptr);

        // The set holds its resources.
        assert(ubo.use_count() == 2);
        std::printf("  create with full init: ok\n");
    }
    assert(ubo.use_count() == 1);

    // Rejected initializations allocate nothing
    {
        auto pool = DescriptorPoolBuilder(device.value()).fitLayout(desc, 4).build().value();

        // Missing binding 1[1]
        {
            auto w = fullInit();
            w.pop_back();
            auto set = DescriptorSet::create(pool, layout, std::move(w));
            assert(set.failedWith(ErrorKind::LayoutMismatch));
            assert(set.error().message.find("binding 1[1]") != std::string::npos);
        }

        // Same slot twice
        {
            auto w = fullInit();
            w.push_back({1, 0, DescriptorBind::storageBuffer(ssbo1)});
            auto set = DescriptorSet::create(pool, layout, std::move(w));
            assert(set.failedWith(ErrorKind::LayoutMismatch));
            assert(set.error().message.find("twice") != std::string::npos);
        }

        // Storage buffer payload for the uniform buffer binding
        {
            auto w = fullInit();
            w[0].content = DescriptorBind::storageBuffer(ssbo0);
            auto set = DescriptorSet::create(pool, layout, std::move(w));
            assert(set.failedWith(ErrorKind::LayoutMismatch));
        }

        // Right kind, buffer created without uniform usage
        {
            auto w = fullInit();
            w[0].content = DescriptorBind::uniformBuffer(ssbo0);
            auto set = DescriptorSet::create(pool, layout, std::move(w));
            assert(set.failedWith(ErrorKind::InvalidArgument));
        }

        // Offset past the end of the buffer
        {
            auto w = fullInit();
            w[1].content = DescriptorBind::storageBuffer(ssbo0, 2048);
            auto set = DescriptorSet::create(pool, layout, std::move(w));
            assert(set.failedWith(ErrorKind::InvalidArgument));
        }

        // Range past the end of the buffer
        {
            auto w = fullInit();
            w[2].content = DescriptorBind::storageBuffer(ssbo1, 512, 1024);
            auto set = DescriptorSet::create(pool, layout, std::move(w));
            assert(set.failedWith(ErrorKind::InvalidArgument));
        }

        // Offset not aligned to the GPU's minUniformBufferOffsetAlignment
        {
            const auto& limits = device.value().limits();
            assert(pool->limits().minUniformBufferOffsetAlignment ==
                   limits.minUniformBufferOffsetAlignment);
            if (limits.minUniformBufferOffsetAlignment > 4) {
                auto w = fullInit();
                w[0].content = DescriptorBind::uniformBuffer(ubo, 4, 16);
                auto set = DescriptorSet::create(pool, layout, std::move(w));
                assert(set.failedWith(ErrorKind::InvalidArgument));
                assert(set.error().message.find("binding 0[0]") != std::string::npos);
                assert(set.error().message.find("alignment") != std::string::npos);
            }
        }

        assert(pool->allocatedSetCount() == 0);
        std::printf("  rejected init: ok\n");
    }

    // Partial updates
    {
        auto pool = DescriptorPoolBuilder(device.value()).fitLayout(desc, 1).build().value();
        auto set = DescriptorSet::create(pool, layout, fullInit()).value();

        auto replacement = makeUbo();
        vkbind::DescriptorBindings binds;
        binds.push_back({0, DescriptorBind::uniformBuffer(replacement)});
        assert(set->update(std::move(binds)).ok());
        assert(set->boundResource(0)->buffer() == replacement);
        assert(ubo.use_count() == 1);
        assert(replacement.use_count() == 2);

        // Nothing is written when one write in the batch is bad.
        std::vector<DescriptorWrite> bad;
        bad.push_back({1, 0, DescriptorBind::storageBuffer(ssbo1)});
        bad.push_back({4, 0, DescriptorBind::storageBuffer(ssbo1)});
        assert(set->update(std::move(bad)).failedWith(ErrorKind::LayoutMismatch));
        assert(set->boundResource(1, 0)->buffer() == ssbo0);

        // Unaligned offsets are rejected on update too.
        if (device.value().limits().minUniformBufferOffsetAlignment > 4) {
            vkbind::DescriptorBindings unaligned;
            unaligned.push_back({0, DescriptorBind::uniformBuffer(ubo, 4, 16)});
            assert(set->update(std::move(unaligned)).failedWith(ErrorKind::InvalidArgument));
            assert(set->boundResource(0)->buffer() == replacement);
        }

        // An empty update is valid.
        assert(set->update(std::vector<DescriptorWrite>{}).ok());
        std::printf("  update: ok\n");
    }

    // Destroying the pool leaves the set unusable but its resources alive
    {
        auto pool = DescriptorPoolBuilder(device.value()).fitLayout(desc, 1).build().value();

        std::weak_ptr<Buffer> watch;
        std::shared_ptr<DescriptorSet> set;
        {
            auto onlyInSet = makeUbo();
            watch = onlyInSet;
            auto w = fullInit();
            w[0].content = DescriptorBind::uniformBuffer(std::move(onlyInSet));
            set = DescriptorSet::create(pool, layout, std::move(w)).value();
        }
        assert(!watch.expired());

        pool.reset();
        assert(!set->usable());
        assert(!watch.expired());

        vkbind::DescriptorBindings binds;
        binds.push_back({0, DescriptorBind::uniformBuffer(ubo)});
        auto r = set->update(std::move(binds));
        assert(r.failedWith(ErrorKind::InvalidArgument));

        set.reset();
        assert(watch.expired());
        std::printf("  pool destroyed before set: ok\n");
    }

    // Empty layouts give empty sets
    {
        auto emptyLayout = DescriptorSetLayout::create(device.value(), DescriptorSetDesc{}).value();
        auto pool = DescriptorPool::create(device.value()).value();
        auto set = DescriptorSet::create(pool, emptyLayout, std::vector<DescriptorWrite>{});
        assert(set.ok());
        assert(pool->allocatedSetCount() == 1);
        std::printf("  empty set: ok\n");
    }

    std::printf("all descriptor set tests passed\n");
    return 0;
}
