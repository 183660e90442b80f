#pragma once

#include <vulkan/vulkan.h>

namespace vkbind {

// Which shader stages may access a descriptor or push constant range.
struct ShaderStages {
    bool vertex                 = false;
    bool tessellationControl    = false;
    bool tessellationEvaluation = false;
    bool geometry               = false;
    bool fragment               = false;
    bool compute                = false;

    // Every graphics stage, compute excluded.
    [[nodiscard]] static constexpr ShaderStages allGraphics() {
        return {true, true, true, true, true, false};
    }

    // Compute only. The exact complement of allGraphics().
    [[nodiscard]] static constexpr ShaderStages computeOnly() {
        return {false, false, false, false, false, true};
    }

    [[nodiscard]] static constexpr ShaderStages none() { return {}; }

    [[nodiscard]] static constexpr ShaderStages vertexOnly() {
        ShaderStages s;
        s.vertex = true;
        return s;
    }

    [[nodiscard]] static constexpr ShaderStages fragmentOnly() {
        ShaderStages s;
        s.fragment = true;
        return s;
    }

    // Bits outside the six stages above are dropped.
    [[nodiscard]] static constexpr ShaderStages fromVk(VkShaderStageFlags flags) {
        ShaderStages s;
        s.vertex                 = (flags & VK_SHADER_STAGE_VERTEX_BIT) != 0;
        s.tessellationControl    = (flags & VK_SHADER_STAGE_TESSELLATION_CONTROL_BIT) != 0;
        s.tessellationEvaluation = (flags & VK_SHADER_STAGE_TESSELLATION_EVALUATION_BIT) != 0;
        s.geometry               = (flags & VK_SHADER_STAGE_GEOMETRY_BIT) != 0;
        s.fragment               = (flags & VK_SHADER_STAGE_FRAGMENT_BIT) != 0;
        s.compute                = (flags & VK_SHADER_STAGE_COMPUTE_BIT) != 0;
        return s;
    }

    [[nodiscard]] constexpr VkShaderStageFlags toVk() const {
        VkShaderStageFlags flags = 0;
        if (vertex)                 flags |= VK_SHADER_STAGE_VERTEX_BIT;
        if (tessellationControl)    flags |= VK_SHADER_STAGE_TESSELLATION_CONTROL_BIT;
        if (tessellationEvaluation) flags |= VK_SHADER_STAGE_TESSELLATION_EVALUATION_BIT;
        if (geometry)               flags |= VK_SHADER_STAGE_GEOMETRY_BIT;
        if (fragment)               flags |= VK_SHADER_STAGE_FRAGMENT_BIT;
        if (compute)                flags |= VK_SHADER_STAGE_COMPUTE_BIT;
        return flags;
    }

    [[nodiscard]] constexpr bool empty() const { return toVk() == 0; }

    [[nodiscard]] constexpr ShaderStages operator|(const ShaderStages& o) const {
        return {vertex || o.vertex,
                tessellationControl || o.tessellationControl,
                tessellationEvaluation || o.tessellationEvaluation,
                geometry || o.geometry,
                fragment || o.fragment,
                compute || o.compute};
    }

    [[nodiscard]] constexpr bool overlaps(const ShaderStages& o) const {
        return (toVk() & o.toVk()) != 0;
    }

    constexpr bool operator==(const ShaderStages&) const = default;
};

} // namespace vkbind
