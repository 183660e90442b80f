#include <vkbind/device.hpp>
#include <vkbind/instance.hpp>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace vkbind {

Device::~Device() {
    if (device_ != VK_NULL_HANDLE) {
        vkDestroyDevice(device_, nullptr);
    }
}

Device::Device(Device&& o) noexcept
    : device_(o.device_),
      physicalDevice_(o.physicalDevice_),
      graphicsQueue_(o.graphicsQueue_),
      families_(o.families_),
      limits_(o.limits_),
      apiVersion_(o.apiVersion_),
      gpuName_(std::move(o.gpuName_)) {
    o.device_         = VK_NULL_HANDLE;
    o.physicalDevice_ = VK_NULL_HANDLE;
    o.graphicsQueue_  = VK_NULL_HANDLE;
    o.families_       = {};
}

Device& Device::operator=(Device&& o) noexcept {
    if (this != &o) {
        if (device_ != VK_NULL_HANDLE) {
            vkDestroyDevice(device_, nullptr);
        }
        device_           = o.device_;
        physicalDevice_   = o.physicalDevice_;
        graphicsQueue_    = o.graphicsQueue_;
        families_         = o.families_;
        limits_           = o.limits_;
        apiVersion_       = o.apiVersion_;
        gpuName_          = std::move(o.gpuName_);
        o.device_         = VK_NULL_HANDLE;
        o.physicalDevice_ = VK_NULL_HANDLE;
        o.graphicsQueue_  = VK_NULL_HANDLE;
        o.families_       = {};
    }
    return *this;
}

bool Device::supportsFormat(VkFormat format, VkFormatFeatureFlags features) const {
    VkFormatProperties props{};
    vkGetPhysicalDeviceFormatProperties(physicalDevice_, format, &props);
    return (props.optimalTilingFeatures & features) == features;
}

void Device::waitIdle() const {
    if (device_ != VK_NULL_HANDLE) {
        VkResult vr = vkDeviceWaitIdle(device_);
        if (vr != VK_SUCCESS) {
            std::fprintf(stderr, "[vkbind] vkDeviceWaitIdle failed (%s)\n", vkResultName(vr));
        }
    }
}

DeviceBuilder::DeviceBuilder(const Instance& instance)
    : instance_(instance.vkInstance()), apiVersion_(instance.apiVersion()) {}

DeviceBuilder& DeviceBuilder::preferDiscreteGpu() {
    gpuPref_ = GpuPrefer::Discrete;
    return *this;
}

DeviceBuilder& DeviceBuilder::preferIntegratedGpu() {
    gpuPref_ = GpuPrefer::Integrated;
    return *this;
}

DeviceBuilder& DeviceBuilder::preferGpu(GpuPrefer pref) {
    gpuPref_ = pref;
    return *this;
}

DeviceBuilder& DeviceBuilder::requireExtension(const char* name) {
    extensions_.push_back(name);
    return *this;
}

QueueFamilies DeviceBuilder::findQueueFamilies(VkPhysicalDevice gpu) const {
    QueueFamilies result;

    std::uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, families.data());

    for (std::uint32_t i = 0; i < count; ++i) {
        if (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) {
            result.graphics = i;
            break;
        }
    }

    return result;
}

bool DeviceBuilder::supportsExtensions(VkPhysicalDevice gpu) const {
    std::uint32_t count = 0;
    VkResult vr = vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
    if (vr != VK_SUCCESS) {
        std::fprintf(stderr, "[vkbind] vkEnumerateDeviceExtensionProperties failed (%s)\n",
                     vkResultName(vr));
        return false;
    }
    std::vector<VkExtensionProperties> available(count);
    vr = vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, available.data());
    if (vr != VK_SUCCESS && vr != VK_INCOMPLETE) {
        std::fprintf(stderr, "[vkbind] vkEnumerateDeviceExtensionProperties failed (%s)\n",
                     vkResultName(vr));
        return false;
    }
    available.resize(count);

    for (auto* required : extensions_) {
        bool found = std::any_of(available.begin(), available.end(),
                                 [required](const VkExtensionProperties& e) {
                                     return std::strcmp(e.extensionName, required) == 0;
                                 });
        if (!found) return false;
    }
    return true;
}

int DeviceBuilder::scoreDevice(VkPhysicalDevice gpu) const {
    auto families = findQueueFamilies(gpu);
    if (!families.valid()) return -1;
    if (!supportsExtensions(gpu)) return -1;

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(gpu, &props);
    if (props.apiVersion < VK_API_VERSION_1_1) return -1;

    int score = 0;

    switch (gpuPref_) {
    case GpuPrefer::Discrete:
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
            score += 100000;
        break;
    case GpuPrefer::Integrated:
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU)
            score += 100000;
        break;
    case GpuPrefer::Any:
        break;
    }

    // Software rasterizers (lavapipe, swiftshader) still qualify, last.
    if (props.deviceType != VK_PHYSICAL_DEVICE_TYPE_CPU) score += 1000;

    // Only dedicated VRAM counts: integrated GPUs report shared system RAM as
    // DEVICE_LOCAL, but every memory type on those heaps is HOST_VISIBLE.
    VkPhysicalDeviceMemoryProperties mem;
    vkGetPhysicalDeviceMemoryProperties(gpu, &mem);
    for (std::uint32_t i = 0; i < mem.memoryHeapCount; ++i) {
        if (!(mem.memoryHeaps[i].flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT))
            continue;
        bool hasDedicatedType = false;
        for (std::uint32_t t = 0; t < mem.memoryTypeCount; ++t) {
            if (mem.memoryTypes[t].heapIndex == i &&
                !(mem.memoryTypes[t].propertyFlags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT)) {
                hasDedicatedType = true;
                break;
            }
        }
        if (hasDedicatedType) {
            score += static_cast<int>(mem.memoryHeaps[i].size / (1024 * 1024));
            break;
        }
    }

    return score;
}

Result<Device> DeviceBuilder::build() {
    if (instance_ == VK_NULL_HANDLE) {
        return Error{"select GPU", 0, "instance is not valid", ErrorKind::InvalidArgument};
    }

    std::uint32_t gpuCount = 0;
    VkResult vr = vkEnumeratePhysicalDevices(instance_, &gpuCount, nullptr);
    if (vr != VK_SUCCESS) {
        return vulkanError("enumerate physical devices", vr, "");
    }
    if (gpuCount == 0) {
        return Error{"select GPU", 0,
                     "No Vulkan-capable GPUs found.\n"
                     "Make sure you have a GPU with Vulkan driver support."};
    }

    std::vector<VkPhysicalDevice> gpus(gpuCount);
    vkEnumeratePhysicalDevices(instance_, &gpuCount, gpus.data());

    VkPhysicalDevice bestGpu = VK_NULL_HANDLE;
    int bestScore = -1;

    for (auto gpu : gpus) {
        int score = scoreDevice(gpu);
        if (score > bestScore) {
            bestScore = score;
            bestGpu   = gpu;
        }
    }

    if (bestGpu == VK_NULL_HANDLE) {
        std::string msg = "No suitable GPU found. Requirements:\n";
        for (auto* ext : extensions_) {
            msg += "  - extension: ";
            msg += ext;
            msg += "\n";
        }
        msg += "  - a graphics queue and Vulkan 1.1\n";
        msg += "Available GPUs:\n";
        for (auto gpu : gpus) {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(gpu, &props);
            msg += "  - ";
            msg += props.deviceName;
            msg += " (score: ";
            msg += std::to_string(scoreDevice(gpu));
            msg += ")\n";
        }
        return Error{"select GPU", 0, msg};
    }

    auto families = findQueueFamilies(bestGpu);

    float priority = 1.0f;
    VkDeviceQueueCreateInfo qci{};
    qci.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qci.queueFamilyIndex = families.graphics;
    qci.queueCount       = 1;
    qci.pQueuePriorities = &priority;

    VkDeviceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.queueCreateInfoCount    = 1;
    ci.pQueueCreateInfos       = &qci;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions_.size());
    ci.ppEnabledExtensionNames = extensions_.data();

    Device dev;
    dev.physicalDevice_ = bestGpu;
    dev.families_       = families;

    vr = vkCreateDevice(bestGpu, &ci, nullptr, &dev.device_);
    if (vr != VK_SUCCESS) {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(bestGpu, &props);
        std::string msg = "vkCreateDevice failed for '";
        msg += props.deviceName;
        msg += "'";
        return vulkanError("create device", vr, msg);
    }

    vkGetDeviceQueue(dev.device_, families.graphics, 0, &dev.graphicsQueue_);

    VkPhysicalDeviceProperties devProps;
    vkGetPhysicalDeviceProperties(bestGpu, &devProps);
    const auto& l = devProps.limits;
    dev.limits_.maxBoundDescriptorSets              = l.maxBoundDescriptorSets;
    dev.limits_.maxPushConstantsSize                = l.maxPushConstantsSize;
    dev.limits_.maxPerStageDescriptorUniformBuffers = l.maxPerStageDescriptorUniformBuffers;
    dev.limits_.maxPerStageDescriptorStorageBuffers = l.maxPerStageDescriptorStorageBuffers;
    dev.limits_.minUniformBufferOffsetAlignment     = l.minUniformBufferOffsetAlignment;
    dev.limits_.minStorageBufferOffsetAlignment     = l.minStorageBufferOffsetAlignment;
    dev.limits_.maxUniformBufferRange               = l.maxUniformBufferRange;
    dev.limits_.maxStorageBufferRange               = l.maxStorageBufferRange;
    dev.apiVersion_ = std::min(apiVersion_, devProps.apiVersion);
    dev.gpuName_    = devProps.deviceName;

    return dev;
}

} // namespace vkbind
