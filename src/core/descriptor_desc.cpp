#include <vkbind/descriptor_desc.hpp>

namespace vkbind {

static_assert(descriptorTypeIndex(DescriptorType::InputAttachment) == kDescriptorTypeCount - 1);
static_assert(ShaderStages::allGraphics().toVk() == VK_SHADER_STAGE_ALL_GRAPHICS);
static_assert((ShaderStages::allGraphics() | ShaderStages::computeOnly()).toVk() ==
              (VK_SHADER_STAGE_ALL_GRAPHICS | VK_SHADER_STAGE_COMPUTE_BIT));

std::string_view descriptorTypeName(DescriptorType t) {
    switch (t) {
    case DescriptorType::Sampler:              return "sampler";
    case DescriptorType::CombinedImageSampler: return "combined image sampler";
    case DescriptorType::SampledImage:         return "sampled image";
    case DescriptorType::StorageImage:         return "storage image";
    case DescriptorType::UniformTexelBuffer:   return "uniform texel buffer";
    case DescriptorType::StorageTexelBuffer:   return "storage texel buffer";
    case DescriptorType::UniformBuffer:        return "uniform buffer";
    case DescriptorType::StorageBuffer:        return "storage buffer";
    case DescriptorType::UniformBufferDynamic: return "dynamic uniform buffer";
    case DescriptorType::StorageBufferDynamic: return "dynamic storage buffer";
    case DescriptorType::InputAttachment:      return "input attachment";
    }
    return "unknown descriptor type";
}

} // namespace vkbind
