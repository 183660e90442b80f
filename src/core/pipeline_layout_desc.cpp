#include <vkbind/pipeline_layout_desc.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>

namespace vkbind {

static Error BadRange(std::size_t index, const std::string& why) {
    return Error{"create pipeline layout desc", 0,
                 "push constant range " + std::to_string(index) + " " + why,
                 ErrorKind::InvalidArgument};
}

Result<PipelineLayoutDesc> PipelineLayoutDesc::create(std::vector<DescriptorSetDesc> sets,
                                                      std::vector<PushConstantRange> pushConstants) {
    for (std::size_t i = 0; i < pushConstants.size(); ++i) {
        const auto& r = pushConstants[i];
        if (r.size == 0)      return BadRange(i, "has a size of 0");
        if (r.offset % 4 != 0) return BadRange(i, "offset is not a multiple of 4");
        if (r.size % 4 != 0)   return BadRange(i, "size is not a multiple of 4");
        if (r.size > UINT32_MAX - r.offset) return BadRange(i, "ends past the 32-bit offset range");
        if (r.stages.empty())  return BadRange(i, "is visible to no shader stage");
        for (std::size_t j = 0; j < i; ++j) {
            if (pushConstants[j].stages.overlaps(r.stages)) {
                return BadRange(i, "shares a shader stage with range " + std::to_string(j));
            }
        }
    }

    PipelineLayoutDesc desc(std::move(sets), std::move(pushConstants));

#ifndef NDEBUG
    if (desc.pushConstantBytes() > 128) {
        std::fprintf(stderr,
            "[vkbind perf] push constant ranges span %u bytes. "
            "Vulkan only guarantees 128 bytes. "
            "Consider using a uniform buffer instead.\n",
            desc.pushConstantBytes());
    }
#endif

    return desc;
}

std::uint32_t PipelineLayoutDesc::pushConstantBytes() const {
    std::uint32_t end = 0;
    for (const auto& r : pushConstants_) {
        end = std::max(end, r.offset + r.size);
    }
    return end;
}

bool PipelineLayoutDesc::isCompatibleWith(const PipelineLayoutDesc& other) const {
    return sets_.size() == other.sets_.size() && compatibleSetCount(other) == sets_.size();
}

std::uint32_t PipelineLayoutDesc::compatibleSetCount(const PipelineLayoutDesc& other) const {
    if (pushConstants_ != other.pushConstants_) return 0;

    std::size_t n = std::min(sets_.size(), other.sets_.size());
    std::uint32_t count = 0;
    while (count < n && sets_[count].isCompatibleWith(other.sets_[count])) {
        ++count;
    }
    return count;
}

} // namespace vkbind
