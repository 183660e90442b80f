#include <vkbind/vkbind.hpp>
#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using vkbind::DescriptorBind;
using vkbind::DescriptorPoolBuilder;
using vkbind::DescriptorSet;
using vkbind::DescriptorSetDesc;
using vkbind::DescriptorSetLayout;
using vkbind::DescriptorType;
using vkbind::ErrorKind;
using vkbind::PipelineLayout;
using vkbind::PushConstantRange;
using vkbind::ShaderStages;

int main() {
    auto instance = vkbind::InstanceBuilder{}
        .appName("test_pipeline_layout")
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

    auto uboDesc = DescriptorSetDesc::create({
        {0, DescriptorType::UniformBuffer, 1, ShaderStages::allGraphics()},
    }).value();
    auto dynDesc = DescriptorSetDesc::create({
        {0, DescriptorType::UniformBufferDynamic, 1, ShaderStages::vertexOnly()},
    }).value();
    auto uboLayout = DescriptorSetLayout::create(device.value(), uboDesc).value();
    auto dynLayout = DescriptorSetLayout::create(device.value(), dynDesc).value();

    // No sets, no push constants
    {
        auto layout = PipelineLayout::create(device.value(), {});
        assert(layout.ok());
        assert(layout.value()->vkPipelineLayout() != VK_NULL_HANDLE);
        assert(layout.value()->setCount() == 0);
        std::printf("  empty pipeline layout: ok\n");
    }

    // Two sets plus push constants
    {
        auto layout = PipelineLayout::create(
            device.value(), {uboLayout, dynLayout},
            {{ShaderStages::vertexOnly(), 0, 64}, {ShaderStages::fragmentOnly(), 64, 16}});
        assert(layout.ok());
        assert(layout.value()->setCount() == 2);
        assert(layout.value()->setLayout(1) == dynLayout);
        assert(layout.value()->desc().pushConstantBytes() == 80);
        std::printf("  sets and push constants: ok\n");
    }

    // Description and device limit errors
    {
        auto overlap = PipelineLayout::create(
            device.value(), {uboLayout},
            {{ShaderStages::allGraphics(), 0, 16}, {ShaderStages::vertexOnly(), 16, 16}});
        assert(overlap.failedWith(ErrorKind::InvalidArgument));

        std::uint32_t tooBig = device.value().limits().maxPushConstantsSize + 4;
        auto big = PipelineLayout::create(device.value(), {uboLayout},
                                          {{ShaderStages::vertexOnly(), 0, tooBig}});
        assert(big.failedWith(ErrorKind::InvalidArgument));

        std::vector<std::shared_ptr<const DescriptorSetLayout>> many(
            device.value().limits().maxBoundDescriptorSets + 1, uboLayout);
        auto tooMany = PipelineLayout::create(device.value(), many);
        assert(tooMany.failedWith(ErrorKind::InvalidArgument));

        auto null = PipelineLayout::create(device.value(), {uboLayout, nullptr});
        assert(null.failedWith(ErrorKind::InvalidArgument));

        // The range end wraps to 16 in 32 bits; it must not slip past the size check.
        auto wrapped = PipelineLayout::create(device.value(), {uboLayout},
                                              {{ShaderStages::vertexOnly(), 0xFFFFFFF0u, 32}});
        assert(wrapped.failedWith(ErrorKind::InvalidArgument));

        // Storage buffers visible to the compute stage, summed over all sets.
        const std::uint32_t perStage = device.value().limits().maxPerStageDescriptorStorageBuffers;
        if (perStage < 4096) {
            auto half = DescriptorSetDesc::create({
                {0, DescriptorType::StorageBuffer, perStage / 2 + 1, ShaderStages::computeOnly()},
            }).value();
            auto halfLayout = DescriptorSetLayout::create(device.value(), half).value();
            assert(PipelineLayout::create(device.value(), {halfLayout}).ok());

            auto overStage = PipelineLayout::create(device.value(), {halfLayout, halfLayout});
            assert(overStage.failedWith(ErrorKind::InvalidArgument));
            assert(overStage.error().message.find("compute") != std::string::npos);
            assert(overStage.error().message.find("maxPerStageDescriptorStorageBuffers") !=
                   std::string::npos);
        }
        std::printf("  creation errors: ok\n");
    }

    auto pipelineLayout = PipelineLayout::create(device.value(), {uboLayout, dynLayout}).value();

    auto pool = DescriptorPoolBuilder(device.value())
        .fitLayout(uboDesc, 2)
        .fitLayout(dynDesc, 1)
        .build()
        .value();

    auto ubo = std::make_shared<vkbind::Buffer>(
        vkbind::BufferBuilder(allocator.value()).size(256).uniformBuffer().build().value());

    vkbind::DescriptorBindings uboInit;
    uboInit.push_back({0, DescriptorBind::uniformBuffer(ubo)});
    vkbind::DescriptorBindings dynInit;
    dynInit.push_back({0, DescriptorBind::uniformBufferDynamic(ubo, 0, 64)});

    auto uboSet = DescriptorSet::create(pool, uboLayout, uboInit).value();
    auto dynSet = DescriptorSet::create(pool, dynLayout, dynInit).value();

    // A set made from an equal but separately created layout is accepted.
    auto twinLayout = DescriptorSetLayout::create(device.value(), uboDesc).value();
    auto twinSet = DescriptorSet::create(pool, twinLayout, uboInit).value();

    // Decoding sets against the pipeline layout
    {
        auto handles = pipelineLayout->decodeDescriptorSets({uboSet, dynSet});
        assert(handles.ok());
        assert(handles->size() == 2);
        assert((*handles)[0] == uboSet->vkDescriptorSet());

        assert(pipelineLayout->decodeDescriptorSets({twinSet}).ok());
        assert(pipelineLayout->decodeDescriptorSets({dynSet}, 1).ok());

        auto swapped = pipelineLayout->decodeDescriptorSets({dynSet, uboSet});
        assert(swapped.failedWith(ErrorKind::LayoutMismatch));

        auto pastEnd = pipelineLayout->decodeDescriptorSets({dynSet}, 2);
        assert(pastEnd.failedWith(ErrorKind::LayoutMismatch));
        std::printf("  decode descriptor sets: ok\n");
    }

    // Recording a bind
    {
        VkCommandPoolCreateInfo cpCI{};
        cpCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        cpCI.queueFamilyIndex = device.value().queueFamilies().graphics;
        VkCommandPool cmdPool = VK_NULL_HANDLE;
        VkResult vr = vkCreateCommandPool(device.value().vkDevice(), &cpCI, nullptr, &cmdPool);
        assert(vr == VK_SUCCESS);

        VkCommandBufferAllocateInfo cbAI{};
        cbAI.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        cbAI.commandPool        = cmdPool;
        cbAI.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        cbAI.commandBufferCount = 1;
        VkCommandBuffer cmd = VK_NULL_HANDLE;
        vr = vkAllocateCommandBuffers(device.value().vkDevice(), &cbAI, &cmd);
        assert(vr == VK_SUCCESS);

        VkCommandBufferBeginInfo begin{};
        begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        vr = vkBeginCommandBuffer(cmd, &begin);
        assert(vr == VK_SUCCESS);

        // One dynamic descriptor, so exactly one offset.
        auto missing = pipelineLayout->bindDescriptorSets(
            cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, {uboSet, dynSet});
        assert(missing.failedWith(ErrorKind::LayoutMismatch));

        auto bound = pipelineLayout->bindDescriptorSets(
            cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, {uboSet, dynSet}, 0, {0});
        assert(bound.ok());

        vr = vkEndCommandBuffer(cmd);
        assert(vr == VK_SUCCESS);

        vkDestroyCommandPool(device.value().vkDevice(), cmdPool, nullptr);
        std::printf("  bind descriptor sets: ok\n");
    }

    // Sets of a destroyed pool can no longer be bound
    {
        auto shortLived = DescriptorPoolBuilder(device.value()).fitLayout(uboDesc, 1).build().value();
        auto orphan = DescriptorSet::create(shortLived, uboLayout, uboInit).value();
        shortLived.reset();

        auto r = pipelineLayout->decodeDescriptorSets({orphan});
        assert(r.failedWith(ErrorKind::InvalidArgument));
        std::printf("  orphaned set rejected: ok\n");
    }

    device.value().waitIdle();

    std::printf("all pipeline layout tests passed\n");
    return 0;
}
