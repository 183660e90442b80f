#include <vkbind/descriptor_desc.hpp>
#include <vkbind/shader_stages.hpp>

#include <vulkan/vulkan.h>

#include <cassert>
#include <string>

int main() {
    using vkbind::ShaderStages;

    // Presets
    {
        auto g = ShaderStages::allGraphics();
        assert(g.vertex && g.tessellationControl && g.tessellationEvaluation);
        assert(g.geometry && g.fragment);
        assert(!g.compute);
        assert(g.toVk() == VK_SHADER_STAGE_ALL_GRAPHICS);

        auto c = ShaderStages::computeOnly();
        assert(c.compute);
        assert(!c.vertex && !c.fragment);
        assert(c.toVk() == VK_SHADER_STAGE_COMPUTE_BIT);

        // computeOnly is the exact complement of allGraphics
        assert(!g.overlaps(c));
        assert((g | c).toVk() == (VK_SHADER_STAGE_ALL_GRAPHICS | VK_SHADER_STAGE_COMPUTE_BIT));

        assert(ShaderStages::none().empty());
        assert(!ShaderStages::vertexOnly().empty());
        assert(ShaderStages::vertexOnly().toVk() == VK_SHADER_STAGE_VERTEX_BIT);
        assert(ShaderStages::fragmentOnly().toVk() == VK_SHADER_STAGE_FRAGMENT_BIT);
    }

    // Field-wise construction
    {
        ShaderStages s;
        s.vertex   = true;
        s.fragment = true;
        assert(s.toVk() == (VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT));
        assert(s.overlaps(ShaderStages::fragmentOnly()));
        assert(!s.overlaps(ShaderStages::computeOnly()));
    }

    // fromVk drops stages outside the six modeled ones
    {
        auto s = ShaderStages::fromVk(VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_COMPUTE_BIT);
        assert(s.vertex && s.compute);
        assert(!s.fragment);
        assert(ShaderStages::fromVk(s.toVk()) == s);
        assert(ShaderStages::fromVk(VK_SHADER_STAGE_ALL) ==
               (ShaderStages::allGraphics() | ShaderStages::computeOnly()));
    }

    // Descriptor kinds
    {
        using vkbind::DescriptorType;
        assert(vkbind::toVk(DescriptorType::UniformBuffer) == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
        assert(vkbind::toVk(DescriptorType::InputAttachment) == VK_DESCRIPTOR_TYPE_INPUT_ATTACHMENT);
        assert(vkbind::descriptorTypeIndex(DescriptorType::Sampler) == 0);
        assert(vkbind::kDescriptorTypeCount == 11);

        assert(vkbind::isBufferDescriptor(DescriptorType::StorageBufferDynamic));
        assert(!vkbind::isBufferDescriptor(DescriptorType::UniformTexelBuffer));
        assert(!vkbind::isBufferDescriptor(DescriptorType::SampledImage));

        assert(std::string(vkbind::descriptorTypeName(DescriptorType::UniformBufferDynamic)) ==
               "dynamic uniform buffer");
    }

    // Descriptor equality
    {
        vkbind::DescriptorDesc a{0, vkbind::DescriptorType::UniformBuffer, 1,
                                 ShaderStages::allGraphics()};
        vkbind::DescriptorDesc b = a;
        assert(a == b);
        b.stages = ShaderStages::vertexOnly();
        assert(!(a == b));
    }

    return 0;
}
