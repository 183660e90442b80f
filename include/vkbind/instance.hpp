#pragma once

#include <vkbind/error.hpp>
#include <vkbind/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vkbind {

enum class Validation {
    Off,
    On,
};

#ifdef NDEBUG
inline constexpr Validation DefaultValidation = Validation::Off;
#else
inline constexpr Validation DefaultValidation = Validation::On;
#endif

// Headless instance: no WSI extensions are requested.
//
// Thread safety: immutable after construction.
class Instance {
public:
    ~Instance();
    Instance(Instance&&) noexcept;
    Instance& operator=(Instance&&) noexcept;
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    [[nodiscard]] VkInstance    native()            const { return instance_; }
    [[nodiscard]] VkInstance    vkInstance()        const { return native(); }
    [[nodiscard]] std::uint32_t apiVersion()        const { return apiVersion_; }
    [[nodiscard]] bool          validationEnabled() const { return messenger_ != VK_NULL_HANDLE; }

private:
    friend class InstanceBuilder;
    Instance() = default;
    void destroy();

    VkInstance               instance_   = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_  = VK_NULL_HANDLE;
    std::uint32_t            apiVersion_ = VK_API_VERSION_1_1;
};

class InstanceBuilder {
public:
    InstanceBuilder& appName(std::string_view name);
    InstanceBuilder& requireVulkan(std::uint32_t major, std::uint32_t minor, std::uint32_t patch = 0);
    InstanceBuilder& validation(Validation v);
    InstanceBuilder& addExtension(const char* name);
    InstanceBuilder& addLayer(const char* name);

    [[nodiscard]] Result<Instance> build();

private:
    std::string              appName_    = "vkbind_app";
    // 1.1 is the floor: VK_ERROR_OUT_OF_POOL_MEMORY is core there.
    std::uint32_t            apiVersion_ = VK_API_VERSION_1_1;
    Validation               validation_ = DefaultValidation;
    std::vector<const char*> extensions_;
    std::vector<const char*> layers_;
};

} // namespace vkbind
