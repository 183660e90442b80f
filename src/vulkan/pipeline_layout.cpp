#include <vkbind/pipeline_layout.hpp>
#include <vkbind/descriptor_set.hpp>
#include <vkbind/descriptor_set_layout.hpp>
#include <vkbind/device.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace vkbind {

namespace {

struct StageName {
    VkShaderStageFlagBits bit;
    const char*           name;
};

constexpr StageName kStages[] = {
    {VK_SHADER_STAGE_VERTEX_BIT,                  "vertex"},
    {VK_SHADER_STAGE_TESSELLATION_CONTROL_BIT,    "tessellation control"},
    {VK_SHADER_STAGE_TESSELLATION_EVALUATION_BIT, "tessellation evaluation"},
    {VK_SHADER_STAGE_GEOMETRY_BIT,                "geometry"},
    {VK_SHADER_STAGE_FRAGMENT_BIT,                "fragment"},
    {VK_SHADER_STAGE_COMPUTE_BIT,                 "compute"},
};

// Uniform and storage buffer descriptors visible to one stage, summed over
// every set, must stay within the per-stage limits.
Result<void> checkPerStageBuffers(const PipelineLayoutDesc& desc, const DeviceLimits& limits) {
    for (const auto& stage : kStages) {
        std::uint64_t uniform = 0;
        std::uint64_t storage = 0;
        for (const auto& set : desc.sets()) {
            for (const auto& d : set.descriptors()) {
                if ((d.stages.toVk() & stage.bit) == 0) continue;
                if (d.type == DescriptorType::UniformBuffer ||
                    d.type == DescriptorType::UniformBufferDynamic) {
                    uniform += d.arrayCount;
                } else if (d.type == DescriptorType::StorageBuffer ||
                           d.type == DescriptorType::StorageBufferDynamic) {
                    storage += d.arrayCount;
                }
            }
        }
        if (uniform > limits.maxPerStageDescriptorUniformBuffers) {
            return Error{"create pipeline layout", 0,
                         std::to_string(uniform) + " uniform buffers visible to the " + stage.name +
                             " stage exceed this GPU's maxPerStageDescriptorUniformBuffers of " +
                             std::to_string(limits.maxPerStageDescriptorUniformBuffers),
                         ErrorKind::InvalidArgument};
        }
        if (storage > limits.maxPerStageDescriptorStorageBuffers) {
            return Error{"create pipeline layout", 0,
                         std::to_string(storage) + " storage buffers visible to the " + stage.name +
                             " stage exceed this GPU's maxPerStageDescriptorStorageBuffers of " +
                             std::to_string(limits.maxPerStageDescriptorStorageBuffers),
                         ErrorKind::InvalidArgument};
        }
    }
    return {};
}

} // namespace

PipelineLayout::~PipelineLayout() {
    if (layout_ != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(device_, layout_, nullptr);
    }
}

Result<std::shared_ptr<const PipelineLayout>> PipelineLayout::create(
    const Device& device,
    std::vector<std::shared_ptr<const DescriptorSetLayout>> setLayouts,
    std::vector<PushConstantRange> pushConstants) {
    if (device.vkDevice() == VK_NULL_HANDLE) {
        return Error{"create pipeline layout", 0, "device is not valid",
                     ErrorKind::InvalidArgument};
    }

    std::vector<DescriptorSetDesc>     setDescs;
    std::vector<VkDescriptorSetLayout> vkSetLayouts;
    setDescs.reserve(setLayouts.size());
    vkSetLayouts.reserve(setLayouts.size());
    for (std::size_t i = 0; i < setLayouts.size(); ++i) {
        if (!setLayouts[i]) {
            return Error{"create pipeline layout", 0,
                         "set layout " + std::to_string(i) + " is null",
                         ErrorKind::InvalidArgument};
        }
        setDescs.push_back(setLayouts[i]->desc());
        vkSetLayouts.push_back(setLayouts[i]->vkDescriptorSetLayout());
    }

    auto desc = PipelineLayoutDesc::create(std::move(setDescs), std::move(pushConstants));
    if (!desc.ok()) return desc.error();

    const DeviceLimits& limits = device.limits();
    if (desc->setCount() > limits.maxBoundDescriptorSets) {
        return Error{"create pipeline layout", 0,
                     std::to_string(desc->setCount()) + " descriptor sets exceed this GPU's "
                     "maxBoundDescriptorSets of " + std::to_string(limits.maxBoundDescriptorSets),
                     ErrorKind::InvalidArgument};
    }
    if (desc->pushConstantBytes() > limits.maxPushConstantsSize) {
        return Error{"create pipeline layout", 0,
                     std::to_string(desc->pushConstantBytes()) + " bytes of push constants "
                     "exceed this GPU's maxPushConstantsSize of " +
                         std::to_string(limits.maxPushConstantsSize),
                     ErrorKind::InvalidArgument};
    }

    auto perStage = checkPerStageBuffers(desc.value(), limits);
    if (!perStage.ok()) return perStage.error();

    std::vector<VkPushConstantRange> vkRanges;
    vkRanges.reserve(desc->pushConstants().size());
    for (const auto& r : desc->pushConstants()) {
        vkRanges.push_back(r.toVk());
    }

    VkPipelineLayoutCreateInfo ci{};
    ci.sType                  = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    ci.setLayoutCount         = static_cast<std::uint32_t>(vkSetLayouts.size());
    ci.pSetLayouts            = vkSetLayouts.empty() ? nullptr : vkSetLayouts.data();
    ci.pushConstantRangeCount = static_cast<std::uint32_t>(vkRanges.size());
    ci.pPushConstantRanges    = vkRanges.empty() ? nullptr : vkRanges.data();

    std::shared_ptr<PipelineLayout> layout(new PipelineLayout());
    layout->device_     = device.vkDevice();
    layout->desc_       = std::move(desc).value();
    layout->setLayouts_ = std::move(setLayouts);

    VkResult vr = vkCreatePipelineLayout(layout->device_, &ci, nullptr, &layout->layout_);
    if (vr != VK_SUCCESS) {
        layout->layout_ = VK_NULL_HANDLE;
        return vulkanError("create pipeline layout", vr, "vkCreatePipelineLayout failed");
    }

    return std::shared_ptr<const PipelineLayout>(std::move(layout));
}

Result<std::vector<VkDescriptorSet>> PipelineLayout::decodeDescriptorSets(
    const std::vector<std::shared_ptr<DescriptorSet>>& sets, std::uint32_t firstSet) const {
    if (static_cast<std::uint64_t>(firstSet) + sets.size() > setLayouts_.size()) {
        return Error{"decode descriptor sets", 0,
                     "sets " + std::to_string(firstSet) + ".." +
                         std::to_string(firstSet + sets.size()) +
                         " do not fit a pipeline layout with " +
                         std::to_string(setLayouts_.size()) + " sets",
                     ErrorKind::LayoutMismatch};
    }

    std::vector<VkDescriptorSet> handles;
    handles.reserve(sets.size());
    for (std::size_t i = 0; i < sets.size(); ++i) {
        auto index = firstSet + static_cast<std::uint32_t>(i);
        const auto& set = sets[i];
        if (!set) {
            return Error{"decode descriptor sets", 0,
                         "set " + std::to_string(index) + " is null", ErrorKind::InvalidArgument};
        }
        if (!set->usable()) {
            return Error{"decode descriptor sets", 0,
                         "set " + std::to_string(index) + " belongs to a destroyed pool",
                         ErrorKind::InvalidArgument};
        }
        if (!set->layout()->isCompatibleWith(*setLayouts_[index])) {
            return Error{"decode descriptor sets", 0,
                         "set " + std::to_string(index) +
                             " was allocated with a layout incompatible with this pipeline layout",
                         ErrorKind::LayoutMismatch};
        }
        handles.push_back(set->vkDescriptorSet());
    }
    return handles;
}

Result<void> PipelineLayout::bindDescriptorSets(
    VkCommandBuffer cmd, VkPipelineBindPoint bindPoint,
    const std::vector<std::shared_ptr<DescriptorSet>>& sets, std::uint32_t firstSet,
    const std::vector<std::uint32_t>& dynamicOffsets) const {
    auto handles = decodeDescriptorSets(sets, firstSet);
    if (!handles.ok()) return handles.error();

    std::uint32_t dynamicCount = 0;
    for (const auto& set : sets) {
        dynamicCount += set->layout()->desc().dynamicDescriptorCount();
    }
    if (dynamicOffsets.size() != dynamicCount) {
        return Error{"bind descriptor sets", 0,
                     std::to_string(dynamicOffsets.size()) + " dynamic offsets given, the sets declare " +
                         std::to_string(dynamicCount) + " dynamic descriptors",
                     ErrorKind::LayoutMismatch};
    }

    if (handles->empty()) return {};

    vkCmdBindDescriptorSets(cmd, bindPoint, layout_, firstSet,
                            static_cast<std::uint32_t>(handles->size()), handles->data(),
                            dynamicCount, dynamicOffsets.empty() ? nullptr : dynamicOffsets.data());
    return {};
}

} // namespace vkbind
