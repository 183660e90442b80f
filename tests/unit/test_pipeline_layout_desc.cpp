#include <vkbind/pipeline_layout_desc.hpp>

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

using vkbind::DescriptorSetDesc;
using vkbind::DescriptorType;
using vkbind::ErrorKind;
using vkbind::PipelineLayoutDesc;
using vkbind::PushConstantRange;
using vkbind::ShaderStages;

namespace {

DescriptorSetDesc set(DescriptorType type, std::uint32_t count = 1) {
    return DescriptorSetDesc::create({{0, type, count, ShaderStages::allGraphics()}}).value();
}

} // namespace

int main() {
    const auto ubo  = set(DescriptorType::UniformBuffer);
    const auto ssbo = set(DescriptorType::StorageBuffer);

    // No sets, no push constants
    {
        auto r = PipelineLayoutDesc::create({});
        assert(r.ok());
        assert(r->setCount() == 0);
        assert(r->pushConstantBytes() == 0);
    }

    // Valid push constant ranges
    {
        auto r = PipelineLayoutDesc::create(
            {ubo, ssbo},
            {{ShaderStages::vertexOnly(), 0, 64}, {ShaderStages::fragmentOnly(), 64, 16}});
        assert(r.ok());
        assert(r->setCount() == 2);
        assert(r->pushConstants().size() == 2);
        assert(r->pushConstantBytes() == 80);

        auto vk = r->pushConstants()[1].toVk();
        assert(vk.stageFlags == VK_SHADER_STAGE_FRAGMENT_BIT);
        assert(vk.offset == 64);
        assert(vk.size == 16);
    }

    // Malformed push constant ranges
    {
        auto zero = PipelineLayoutDesc::create({}, {{ShaderStages::vertexOnly(), 0, 0}});
        assert(zero.failedWith(ErrorKind::InvalidArgument));

        auto unaligned = PipelineLayoutDesc::create({}, {{ShaderStages::vertexOnly(), 2, 16}});
        assert(unaligned.failedWith(ErrorKind::InvalidArgument));

        auto oddSize = PipelineLayoutDesc::create({}, {{ShaderStages::vertexOnly(), 0, 6}});
        assert(oddSize.failedWith(ErrorKind::InvalidArgument));

        auto noStage = PipelineLayoutDesc::create({}, {{ShaderStages::none(), 0, 16}});
        assert(noStage.failedWith(ErrorKind::InvalidArgument));

        auto shared = PipelineLayoutDesc::create(
            {}, {{ShaderStages::allGraphics(), 0, 16}, {ShaderStages::fragmentOnly(), 16, 16}});
        assert(shared.failedWith(ErrorKind::InvalidArgument));
        assert(shared.error().message.find("range 1") != std::string::npos);
    }

    // A range whose end does not fit in 32 bits
    {
        auto wrapped = PipelineLayoutDesc::create({}, {{ShaderStages::vertexOnly(), 0xFFFFFFF0u, 32}});
        assert(wrapped.failedWith(ErrorKind::InvalidArgument));
        assert(wrapped.error().message.find("range 0") != std::string::npos);

        auto last = PipelineLayoutDesc::create({}, {{ShaderStages::vertexOnly(), 0xFFFFFFF0u, 12}});
        assert(last.ok());
        assert(last->pushConstantBytes() == 0xFFFFFFFCu);
    }

    // Compatibility
    {
        const std::vector<PushConstantRange> pcs{{ShaderStages::vertexOnly(), 0, 16}};

        auto a = PipelineLayoutDesc::create({ubo, ssbo}, pcs).value();
        auto b = PipelineLayoutDesc::create({ubo, ssbo}, pcs).value();
        auto prefix = PipelineLayoutDesc::create({ubo, ubo}, pcs).value();
        auto shorter = PipelineLayoutDesc::create({ubo}, pcs).value();
        auto noPush = PipelineLayoutDesc::create({ubo, ssbo}).value();

        assert(a.isCompatibleWith(b));
        assert(a.compatibleSetCount(b) == 2);

        assert(!a.isCompatibleWith(prefix));
        assert(a.compatibleSetCount(prefix) == 1);

        assert(!a.isCompatibleWith(shorter));
        assert(a.compatibleSetCount(shorter) == 1);
        assert(shorter.compatibleSetCount(a) == 1);

        // Different push constants break compatibility of every set
        assert(!a.isCompatibleWith(noPush));
        assert(a.compatibleSetCount(noPush) == 0);
    }

    return 0;
}
