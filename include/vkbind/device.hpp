#pragma once

#include <vkbind/error.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace vkbind {

class Instance;

enum class GpuPrefer {
    Discrete,
    Integrated,
    Any,
};

struct QueueFamilies {
    std::uint32_t graphics = UINT32_MAX;

    [[nodiscard]] bool valid() const { return graphics != UINT32_MAX; }
};

// Descriptor and layout limits reported by the selected GPU. The defaults
// are the minimums every Vulkan implementation guarantees.
struct DeviceLimits {
    std::uint32_t maxBoundDescriptorSets              = 4;
    std::uint32_t maxPushConstantsSize                = 128;
    std::uint32_t maxPerStageDescriptorUniformBuffers = 12;
    std::uint32_t maxPerStageDescriptorStorageBuffers = 4;
    VkDeviceSize  minUniformBufferOffsetAlignment     = 256;
    VkDeviceSize  minStorageBufferOffsetAlignment     = 256;
    VkDeviceSize  maxUniformBufferRange               = 16384;
    VkDeviceSize  maxStorageBufferRange               = 1u << 27;
};

// Headless logical device with one graphics queue.
//
// Thread safety: immutable after construction. VkQueue handles returned by
// accessors follow Vulkan queue externally-synchronized rules.
class Device {
public:
    ~Device();
    Device(Device&&) noexcept;
    Device& operator=(Device&&) noexcept;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] VkDevice            native()           const { return device_; }
    [[nodiscard]] VkDevice            vkDevice()         const { return native(); }
    [[nodiscard]] VkPhysicalDevice    vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] VkQueue             graphicsQueue()    const { return graphicsQueue_; }
    [[nodiscard]] QueueFamilies       queueFamilies()    const { return families_; }
    [[nodiscard]] const DeviceLimits& limits()           const { return limits_; }
    [[nodiscard]] std::uint32_t       apiVersion()       const { return apiVersion_; }
    [[nodiscard]] const char*         gpuName()          const { return gpuName_.c_str(); }

    // Whether the format can back an optimal-tiling image with the given features.
    [[nodiscard]] bool supportsFormat(VkFormat format, VkFormatFeatureFlags features) const;

    void waitIdle() const;

private:
    friend class DeviceBuilder;
    Device() = default;

    VkDevice         device_         = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkQueue          graphicsQueue_  = VK_NULL_HANDLE;
    QueueFamilies    families_;
    DeviceLimits     limits_;
    std::uint32_t    apiVersion_     = VK_API_VERSION_1_1;
    std::string      gpuName_;
};

class DeviceBuilder {
public:
    explicit DeviceBuilder(const Instance& instance);

    DeviceBuilder& preferDiscreteGpu();
    DeviceBuilder& preferIntegratedGpu();
    DeviceBuilder& preferGpu(GpuPrefer pref);

    DeviceBuilder& requireExtension(const char* name);

    [[nodiscard]] Result<Device> build();

private:
    [[nodiscard]] QueueFamilies findQueueFamilies(VkPhysicalDevice gpu) const;
    [[nodiscard]] bool          supportsExtensions(VkPhysicalDevice gpu) const;
    [[nodiscard]] int           scoreDevice(VkPhysicalDevice gpu) const;

    VkInstance               instance_   = VK_NULL_HANDLE;
    std::uint32_t            apiVersion_ = VK_API_VERSION_1_1;
    GpuPrefer                gpuPref_    = GpuPrefer::Discrete;
    std::vector<const char*> extensions_;
};

} // namespace vkbind
