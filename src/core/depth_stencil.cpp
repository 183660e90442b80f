#include <vkbind/depth_stencil.hpp>

#include <string>

namespace vkbind {

VkStencilOpState StencilOpState::toVk() const {
    VkStencilOpState s{};
    s.failOp      = failOp;
    s.passOp      = passOp;
    s.depthFailOp = depthFailOp;
    s.compareOp   = vkbind::toVk(compare);
    s.compareMask = compareMask;
    s.writeMask   = writeMask;
    s.reference   = reference;
    return s;
}

VkPipelineDepthStencilStateCreateInfo DepthStencil::toVk() const {
    VkPipelineDepthStencilStateCreateInfo ci{};
    ci.sType                 = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    ci.depthTestEnable       = depthTestEnabled() ? VK_TRUE : VK_FALSE;
    ci.depthWriteEnable      = depthWrite ? VK_TRUE : VK_FALSE;
    ci.depthCompareOp        = vkbind::toVk(depthCompare);
    ci.depthBoundsTestEnable = depthBoundsTest ? VK_TRUE : VK_FALSE;
    ci.stencilTestEnable     = stencilTestEnabled() ? VK_TRUE : VK_FALSE;
    ci.front                 = stencilFront.toVk();
    ci.back                  = stencilBack.toVk();
    ci.minDepthBounds        = minDepthBounds;
    ci.maxDepthBounds        = maxDepthBounds;
    return ci;
}

Result<void> DepthStencil::validateFor(Format attachment) const {
    const std::string name(formatName(attachment));

    if (depthTestEnabled() && !hasDepth(attachment)) {
        return Error{"validate depth stencil state", 0,
                     "depth test needs a depth format, attachment is " + name,
                     ErrorKind::InvalidArgument};
    }
    if (stencilTestEnabled() && !hasStencil(attachment)) {
        return Error{"validate depth stencil state", 0,
                     "stencil test needs a stencil format, attachment is " + name,
                     ErrorKind::InvalidArgument};
    }
    if (depthBoundsTest &&
        (minDepthBounds < 0.0f || maxDepthBounds > 1.0f || minDepthBounds > maxDepthBounds)) {
        return Error{"validate depth stencil state", 0,
                     "depth bounds must satisfy 0 <= min <= max <= 1",
                     ErrorKind::InvalidArgument};
    }
    return {};
}

} // namespace vkbind
