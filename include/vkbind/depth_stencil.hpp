#pragma once

#include <vkbind/error.hpp>
#include <vkbind/format.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace vkbind {

enum class Compare : std::uint32_t {
    Never          = VK_COMPARE_OP_NEVER,
    Less           = VK_COMPARE_OP_LESS,
    Equal          = VK_COMPARE_OP_EQUAL,
    LessOrEqual    = VK_COMPARE_OP_LESS_OR_EQUAL,
    Greater        = VK_COMPARE_OP_GREATER,
    NotEqual       = VK_COMPARE_OP_NOT_EQUAL,
    GreaterOrEqual = VK_COMPARE_OP_GREATER_OR_EQUAL,
    Always         = VK_COMPARE_OP_ALWAYS,
};

[[nodiscard]] constexpr VkCompareOp toVk(Compare c) {
    return static_cast<VkCompareOp>(c);
}

struct StencilOpState {
    VkStencilOp   failOp      = VK_STENCIL_OP_KEEP;
    VkStencilOp   passOp      = VK_STENCIL_OP_KEEP;
    VkStencilOp   depthFailOp = VK_STENCIL_OP_KEEP;
    Compare       compare     = Compare::Always;
    std::uint32_t compareMask = 0xFF;
    std::uint32_t writeMask   = 0xFF;
    std::uint32_t reference   = 0;

    // Always passes and never writes.
    [[nodiscard]] bool isNoop() const {
        return compare == Compare::Always && failOp == VK_STENCIL_OP_KEEP &&
               passOp == VK_STENCIL_OP_KEEP && depthFailOp == VK_STENCIL_OP_KEEP;
    }

    [[nodiscard]] VkStencilOpState toVk() const;

    bool operator==(const StencilOpState&) const = default;
};

// Depth and stencil test configuration of a graphics pipeline. The depth test
// is enabled unless depthCompare is Always and depthWrite is false; the
// stencil test unless both faces are no-ops.
struct DepthStencil {
    bool           depthWrite      = false;
    Compare        depthCompare    = Compare::Always;
    bool           depthBoundsTest = false;
    float          minDepthBounds  = 0.0f;
    float          maxDepthBounds  = 1.0f;
    StencilOpState stencilFront;
    StencilOpState stencilBack;

    // Depth and stencil tests off.
    [[nodiscard]] static DepthStencil disabled() { return {}; }

    // Writes depth and keeps fragments closer than what is stored.
    [[nodiscard]] static DepthStencil simpleDepthTest() {
        DepthStencil ds;
        ds.depthWrite   = true;
        ds.depthCompare = Compare::Less;
        return ds;
    }

    [[nodiscard]] bool depthTestEnabled() const {
        return depthWrite || depthCompare != Compare::Always || depthBoundsTest;
    }
    [[nodiscard]] bool stencilTestEnabled() const {
        return !stencilFront.isNoop() || !stencilBack.isNoop();
    }

    [[nodiscard]] VkPipelineDepthStencilStateCreateInfo toVk() const;

    // The attachment format must carry every aspect the state uses, and the
    // depth bounds must be ordered within [0, 1].
    [[nodiscard]] Result<void> validateFor(Format attachment) const;

    bool operator==(const DepthStencil&) const = default;
};

} // namespace vkbind
