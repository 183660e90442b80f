#include <vkbind/descriptor_set_desc.hpp>
#include <vkbind/device.hpp>

#include <vulkan/vulkan.h>

#include <cassert>
#include <string>
#include <vector>

using vkbind::DescriptorBind;
using vkbind::DescriptorDesc;
using vkbind::DescriptorSetDesc;
using vkbind::DescriptorType;
using vkbind::DescriptorWrite;
using vkbind::ErrorKind;
using vkbind::ShaderStages;

namespace {

DescriptorSetDesc makeDesc(std::vector<DescriptorDesc> d) {
    auto r = DescriptorSetDesc::create(std::move(d));
    assert(r.ok());
    return std::move(r).value();
}

} // namespace

int main() {
    const auto gfx = ShaderStages::allGraphics();

    // Bindings are kept sorted regardless of declaration order
    {
        auto desc = makeDesc({
            {2, DescriptorType::SampledImage, 1, ShaderStages::fragmentOnly()},
            {0, DescriptorType::UniformBuffer, 1, gfx},
            {1, DescriptorType::StorageBuffer, 4, ShaderStages::computeOnly()},
        });
        assert(desc.descriptors().size() == 3);
        assert(desc.descriptors()[0].binding == 0);
        assert(desc.descriptors()[1].binding == 1);
        assert(desc.descriptors()[2].binding == 2);
        assert(desc.find(1) != nullptr);
        assert(desc.find(1)->arrayCount == 4);
        assert(desc.find(3) == nullptr);
        assert(!desc.empty());
    }

    // Malformed descriptions
    {
        auto dup = DescriptorSetDesc::create({
            {0, DescriptorType::UniformBuffer, 1, gfx},
            {0, DescriptorType::StorageBuffer, 1, gfx},
        });
        assert(dup.failedWith(ErrorKind::InvalidArgument));
        assert(dup.error().message.find("binding 0") != std::string::npos);

        auto zero = DescriptorSetDesc::create({{0, DescriptorType::UniformBuffer, 0, gfx}});
        assert(zero.failedWith(ErrorKind::InvalidArgument));

        auto noStage = DescriptorSetDesc::create({{0, DescriptorType::UniformBuffer, 1, {}}});
        assert(noStage.failedWith(ErrorKind::InvalidArgument));
    }

    // Empty layouts are valid
    {
        auto empty = DescriptorSetDesc::create({});
        assert(empty.ok());
        assert(empty->empty());
        assert(empty->descriptorCount() == 0);

        auto init = empty->decodeInit(std::vector<DescriptorWrite>{});
        assert(init.ok());
        assert(init->empty());
    }

    // Pool sizes and counts
    {
        auto desc = makeDesc({
            {0, DescriptorType::UniformBuffer, 1, gfx},
            {1, DescriptorType::UniformBuffer, 2, gfx},
            {2, DescriptorType::StorageBufferDynamic, 3, ShaderStages::computeOnly()},
            {3, DescriptorType::UniformBufferDynamic, 1, gfx},
            {4, DescriptorType::InputAttachment, 1, ShaderStages::fragmentOnly()},
        });
        auto sizes = desc.poolSizes();
        assert(sizes[vkbind::descriptorTypeIndex(DescriptorType::UniformBuffer)] == 3);
        assert(sizes[vkbind::descriptorTypeIndex(DescriptorType::StorageBufferDynamic)] == 3);
        assert(sizes[vkbind::descriptorTypeIndex(DescriptorType::UniformBufferDynamic)] == 1);
        assert(sizes[vkbind::descriptorTypeIndex(DescriptorType::InputAttachment)] == 1);
        assert(sizes[vkbind::descriptorTypeIndex(DescriptorType::Sampler)] == 0);
        assert(desc.descriptorCount() == 8);
        assert(desc.dynamicDescriptorCount() == 4);
    }

    // Vulkan binding structs
    {
        auto desc = makeDesc({
            {3, DescriptorType::StorageImage, 2, ShaderStages::computeOnly()},
            {0, DescriptorType::UniformBuffer, 1, gfx},
        });
        auto vk = desc.toVk();
        assert(vk.size() == 2);
        assert(vk[0].binding == 0);
        assert(vk[0].descriptorType == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
        assert(vk[0].stageFlags == VK_SHADER_STAGE_ALL_GRAPHICS);
        assert(vk[1].binding == 3);
        assert(vk[1].descriptorType == VK_DESCRIPTOR_TYPE_STORAGE_IMAGE);
        assert(vk[1].descriptorCount == 2);
        assert(vk[1].stageFlags == VK_SHADER_STAGE_COMPUTE_BIT);
        assert(vk[1].pImmutableSamplers == nullptr);
    }

    // Compatibility is structural
    {
        auto a = makeDesc({{0, DescriptorType::UniformBuffer, 1, gfx},
                           {1, DescriptorType::StorageBuffer, 1, gfx}});
        auto b = makeDesc({{1, DescriptorType::StorageBuffer, 1, gfx},
                           {0, DescriptorType::UniformBuffer, 1, gfx}});
        auto otherKind   = makeDesc({{0, DescriptorType::UniformBufferDynamic, 1, gfx},
                                     {1, DescriptorType::StorageBuffer, 1, gfx}});
        auto otherCount  = makeDesc({{0, DescriptorType::UniformBuffer, 2, gfx},
                                     {1, DescriptorType::StorageBuffer, 1, gfx}});
        auto otherStages = makeDesc({{0, DescriptorType::UniformBuffer, 1, ShaderStages::vertexOnly()},
                                     {1, DescriptorType::StorageBuffer, 1, gfx}});
        auto fewer       = makeDesc({{0, DescriptorType::UniformBuffer, 1, gfx}});

        assert(a.isCompatibleWith(a));
        assert(a.isCompatibleWith(b));
        assert(b.isCompatibleWith(a));
        assert(!a.isCompatibleWith(otherKind));
        assert(!a.isCompatibleWith(otherCount));
        assert(!a.isCompatibleWith(otherStages));
        assert(!a.isCompatibleWith(fewer));
        assert(!fewer.isCompatibleWith(a));
        assert(DescriptorSetDesc{}.isCompatibleWith(DescriptorSetDesc{}));
    }

    // Single-binding layout: binding 1 does not exist, binding 0 takes only
    // uniform buffers
    {
        auto single = makeDesc({{0, DescriptorType::UniformBuffer, 1, gfx}});

        vkbind::DescriptorBindings past;
        past.push_back({1, DescriptorBind::uniformBuffer(nullptr)});
        assert(single.decodeWrite(std::move(past)).failedWith(ErrorKind::LayoutMismatch));

        vkbind::DescriptorBindings wrongKind;
        wrongKind.push_back({0, DescriptorBind::storageBufferDynamic(nullptr)});
        assert(single.decodeWrite(std::move(wrongKind)).failedWith(ErrorKind::LayoutMismatch));
    }

    auto desc = makeDesc({
        {0, DescriptorType::UniformBuffer, 1, gfx},
        {1, DescriptorType::StorageBuffer, 2, ShaderStages::computeOnly()},
    });

    // Writes to an undeclared binding
    {
        std::vector<DescriptorWrite> writes;
        writes.push_back({7, 0, DescriptorBind::uniformBuffer(nullptr)});
        auto r = desc.decodeWrite(std::move(writes));
        assert(r.failedWith(ErrorKind::LayoutMismatch));
        assert(r.error().message.find("binding 7") != std::string::npos);
    }

    // Array element past the declared count
    {
        std::vector<DescriptorWrite> writes;
        writes.push_back({1, 2, DescriptorBind::storageBuffer(nullptr)});
        auto r = desc.decodeWrite(std::move(writes));
        assert(r.failedWith(ErrorKind::LayoutMismatch));
        assert(r.error().message.find("out of range") != std::string::npos);
    }

    // Kind mismatch is caught before the payload is looked at
    {
        vkbind::DescriptorBindings binds;
        binds.push_back({0, DescriptorBind::storageBuffer(nullptr)});
        auto r = desc.decodeWrite(std::move(binds));
        assert(r.failedWith(ErrorKind::LayoutMismatch));
        assert(r.error().message.find("uniform buffer") != std::string::npos);
        assert(r.error().message.find("storage buffer") != std::string::npos);
    }

    // Matching kind without a resource
    {
        vkbind::DescriptorBindings binds;
        binds.push_back({0, DescriptorBind::uniformBuffer(nullptr)});
        auto r = desc.decodeWrite(std::move(binds));
        assert(r.failedWith(ErrorKind::LayoutMismatch));
        assert(r.error().message.find("without a resource") != std::string::npos);
    }

    // Image payloads against buffer bindings
    {
        std::vector<DescriptorWrite> writes;
        writes.push_back({0, 0, DescriptorBind::sampledImage(nullptr)});
        assert(desc.decodeWrite(std::move(writes)).failedWith(ErrorKind::LayoutMismatch));
    }

    // An empty batch is a valid update but not a valid initialization
    {
        assert(desc.decodeWrite(std::vector<DescriptorWrite>{}).ok());

        auto r = desc.decodeInit(std::vector<DescriptorWrite>{});
        assert(r.failedWith(ErrorKind::LayoutMismatch));
        assert(r.error().message.find("binding 0[0]") != std::string::npos);
        assert(r.error().message.find("not initialized") != std::string::npos);
    }

    // decodeInit reports bad writes before incompleteness
    {
        vkbind::DescriptorBindings binds;
        binds.push_back({9, DescriptorBind::uniformBuffer(nullptr)});
        auto r = desc.decodeInit(std::move(binds));
        assert(r.failedWith(ErrorKind::LayoutMismatch));
        assert(r.error().message.find("binding 9") != std::string::npos);
    }

    // Payload accessors
    {
        auto b = DescriptorBind::uniformBufferDynamic(nullptr, 256, 64);
        assert(b.type() == DescriptorType::UniformBufferDynamic);
        assert(b.isBuffer());
        assert(!b.hasResource());
        assert(b.offset() == 256);
        assert(b.range() == 64);

        auto i = DescriptorBind::storageImage(nullptr);
        assert(i.type() == DescriptorType::StorageImage);
        assert(!i.isBuffer());
        assert(i.imageLayout() == VK_IMAGE_LAYOUT_GENERAL);

        assert(DescriptorBind::uniformBuffer(nullptr).range() == VK_WHOLE_SIZE);
        assert(DescriptorBind::uniformBuffer(nullptr).validateResource().failedWith(
            ErrorKind::InvalidArgument));
    }

    // Device limits: offset alignment and maximum range per buffer kind
    {
        vkbind::DeviceLimits limits;
        limits.minUniformBufferOffsetAlignment = 256;
        limits.minStorageBufferOffsetAlignment = 64;
        limits.maxUniformBufferRange           = 16384;
        limits.maxStorageBufferRange           = 1u << 20;

        auto unaligned = DescriptorBind::uniformBuffer(nullptr, 4, 16).validateLimits(limits);
        assert(unaligned.failedWith(ErrorKind::InvalidArgument));
        assert(unaligned.error().message.find("offset 4") != std::string::npos);
        assert(unaligned.error().message.find("256") != std::string::npos);

        assert(DescriptorBind::uniformBufferDynamic(nullptr, 128, 16).validateLimits(limits)
                   .failedWith(ErrorKind::InvalidArgument));
        assert(DescriptorBind::uniformBuffer(nullptr, 512, 16).validateLimits(limits).ok());

        // Storage buffers use their own alignment.
        assert(DescriptorBind::storageBuffer(nullptr, 64, 16).validateLimits(limits).ok());
        assert(DescriptorBind::storageBufferDynamic(nullptr, 32, 16).validateLimits(limits)
                   .failedWith(ErrorKind::InvalidArgument));

        auto tooWide = DescriptorBind::uniformBuffer(nullptr, 0, 65536).validateLimits(limits);
        assert(tooWide.failedWith(ErrorKind::InvalidArgument));
        assert(tooWide.error().message.find("65536") != std::string::npos);
        assert(DescriptorBind::uniformBuffer(nullptr, 0, 16384).validateLimits(limits).ok());
        assert(DescriptorBind::storageBuffer(nullptr, 0, 65536).validateLimits(limits).ok());
        assert(DescriptorBind::storageBuffer(nullptr, 0, (1u << 20) + 4).validateLimits(limits)
                   .failedWith(ErrorKind::InvalidArgument));

        // Image payloads carry no offset or range.
        assert(DescriptorBind::sampledImage(nullptr).validateLimits(limits).ok());
    }

    return 0;
}
