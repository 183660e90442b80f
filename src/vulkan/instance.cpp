#include <vkbind/instance.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace vkbind {

static constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

static VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/)
{
    const char* level = "INFO";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
        level = "ERROR";
    else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
        level = "WARN";

    std::fprintf(stderr, "vkbind [%s]: %s\n", level, data->pMessage);
    return VK_FALSE;
}

void Instance::destroy() {
    if (messenger_ != VK_NULL_HANDLE) {
        auto func = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (func) func(instance_, messenger_, nullptr);
        messenger_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
}

Instance::~Instance() {
    destroy();
}

Instance::Instance(Instance&& o) noexcept
    : instance_(o.instance_), messenger_(o.messenger_), apiVersion_(o.apiVersion_) {
    o.instance_  = VK_NULL_HANDLE;
    o.messenger_ = VK_NULL_HANDLE;
}

Instance& Instance::operator=(Instance&& o) noexcept {
    if (this != &o) {
        destroy();
        instance_    = o.instance_;
        messenger_   = o.messenger_;
        apiVersion_  = o.apiVersion_;
        o.instance_  = VK_NULL_HANDLE;
        o.messenger_ = VK_NULL_HANDLE;
    }
    return *this;
}

static bool LayerAvailable(const char* name,
                           const std::vector<VkLayerProperties>& available) {
    return std::any_of(available.begin(), available.end(), [name](const VkLayerProperties& l) {
        return std::strcmp(l.layerName, name) == 0;
    });
}

static bool ExtensionAvailable(const char* name,
                               const std::vector<VkExtensionProperties>& available) {
    return std::any_of(available.begin(), available.end(), [name](const VkExtensionProperties& e) {
        return std::strcmp(e.extensionName, name) == 0;
    });
}

static void Deduplicate(std::vector<const char*>& list) {
    std::vector<const char*> unique;
    unique.reserve(list.size());
    for (auto* name : list) {
        bool seen = std::any_of(unique.begin(), unique.end(), [name](const char* u) {
            return std::strcmp(u, name) == 0;
        });
        if (!seen) unique.push_back(name);
    }
    list = std::move(unique);
}

InstanceBuilder& InstanceBuilder::appName(std::string_view name) {
    appName_ = name;
    return *this;
}

InstanceBuilder& InstanceBuilder::requireVulkan(std::uint32_t major,
                                                std::uint32_t minor,
                                                std::uint32_t patch) {
    apiVersion_ = VK_MAKE_API_VERSION(0, major, minor, patch);
    return *this;
}

InstanceBuilder& InstanceBuilder::validation(Validation v) {
    validation_ = v;
    return *this;
}

InstanceBuilder& InstanceBuilder::addExtension(const char* name) {
    extensions_.push_back(name);
    return *this;
}

InstanceBuilder& InstanceBuilder::addLayer(const char* name) {
    layers_.push_back(name);
    return *this;
}

Result<Instance> InstanceBuilder::build() {
    if (apiVersion_ < VK_API_VERSION_1_1) {
        return Error{"create instance", 0,
                     "vkbind needs Vulkan 1.1 or newer (descriptor pool exhaustion "
                     "is reported through a 1.1 result code)",
                     ErrorKind::InvalidArgument};
    }

    // A 1.1+ loader accepts any apiVersion, so compare against what it reports.
    std::uint32_t loaderVersion = VK_API_VERSION_1_0;
    auto enumerateVersion = reinterpret_cast<PFN_vkEnumerateInstanceVersion>(
        vkGetInstanceProcAddr(VK_NULL_HANDLE, "vkEnumerateInstanceVersion"));
    if (enumerateVersion != nullptr) {
        VkResult vr = enumerateVersion(&loaderVersion);
        if (vr != VK_SUCCESS) {
            return vulkanError("query instance version", vr, "vkEnumerateInstanceVersion failed");
        }
    }
    if (VK_MAKE_API_VERSION(0, VK_API_VERSION_MAJOR(loaderVersion),
                            VK_API_VERSION_MINOR(loaderVersion), 0) <
        VK_MAKE_API_VERSION(0, VK_API_VERSION_MAJOR(apiVersion_),
                            VK_API_VERSION_MINOR(apiVersion_), 0)) {
        return Error{"create instance", VK_ERROR_INCOMPATIBLE_DRIVER,
                     "Vulkan " + std::to_string(VK_API_VERSION_MAJOR(apiVersion_)) + "." +
                         std::to_string(VK_API_VERSION_MINOR(apiVersion_)) +
                         " requested but the loader only provides " +
                         std::to_string(VK_API_VERSION_MAJOR(loaderVersion)) + "." +
                         std::to_string(VK_API_VERSION_MINOR(loaderVersion)),
                     ErrorKind::Driver};
    }

    std::vector<const char*> extensions = extensions_;

    bool wantValidation = (validation_ == Validation::On);
    if (wantValidation) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }
    Deduplicate(extensions);

    std::uint32_t extCount = 0;
    VkResult vr = vkEnumerateInstanceExtensionProperties(nullptr, &extCount, nullptr);
    if (vr != VK_SUCCESS) {
        return vulkanError("enumerate instance extensions", vr,
                           "is a Vulkan loader installed?");
    }
    std::vector<VkExtensionProperties> availableExts(extCount);
    vkEnumerateInstanceExtensionProperties(nullptr, &extCount, availableExts.data());

    std::vector<const char*> layers = layers_;
    if (wantValidation) {
        layers.push_back(kValidationLayer);
    }
    Deduplicate(layers);

    std::uint32_t layerCount = 0;
    vkEnumerateInstanceLayerProperties(&layerCount, nullptr);
    std::vector<VkLayerProperties> availableLayers(layerCount);
    vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data());

    bool hasValidationLayer = true;
    for (auto* requested : layers) {
        if (LayerAvailable(requested, availableLayers)) continue;
        if (std::strcmp(requested, kValidationLayer) == 0) {
            hasValidationLayer = false;
        } else {
            return Error{"create instance", 0,
                         "Layer '" + std::string(requested) + "' is not available.\n"
                         "Make sure the Vulkan SDK is installed."};
        }
    }

    // Run without validation when the layer is absent (release driver, CI).
    if (wantValidation && (!hasValidationLayer ||
                           !ExtensionAvailable(VK_EXT_DEBUG_UTILS_EXTENSION_NAME, availableExts))) {
        std::fprintf(stderr, "[vkbind] validation requested but %s is unavailable; continuing without it\n",
                     kValidationLayer);
        wantValidation = false;
        std::erase_if(layers, [](const char* n) {
            return std::strcmp(n, kValidationLayer) == 0;
        });
        std::erase_if(extensions, [](const char* n) {
            return std::strcmp(n, VK_EXT_DEBUG_UTILS_EXTENSION_NAME) == 0;
        });
    }

    for (auto* requested : extensions) {
        if (!ExtensionAvailable(requested, availableExts)) {
            return Error{"create instance", 0,
                         "Extension '" + std::string(requested) + "' is not available.\n"
                         "Try updating your GPU drivers, or check https://vulkan.gpuinfo.org"};
        }
    }

    VkApplicationInfo appInfo{};
    appInfo.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName   = appName_.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.pEngineName        = "vkbind";
    appInfo.apiVersion         = apiVersion_;

    VkInstanceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo        = &appInfo;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();
    ci.enabledLayerCount       = static_cast<std::uint32_t>(layers.size());
    ci.ppEnabledLayerNames     = layers.data();

    // Chained so validation also covers vkCreateInstance/vkDestroyInstance.
    VkDebugUtilsMessengerCreateInfoEXT debugCI{};
    if (wantValidation) {
        debugCI.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        debugCI.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        debugCI.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
        debugCI.pfnUserCallback = DebugCallback;
        ci.pNext = &debugCI;
    }

    Instance inst;
    inst.apiVersion_ = apiVersion_;
    vr = vkCreateInstance(&ci, nullptr, &inst.instance_);
    if (vr != VK_SUCCESS) {
        std::string msg;
        if (vr == VK_ERROR_INCOMPATIBLE_DRIVER) {
            msg = "you requested Vulkan " + std::to_string(VK_API_VERSION_MAJOR(apiVersion_)) +
                  "." + std::to_string(VK_API_VERSION_MINOR(apiVersion_)) +
                  " but the driver doesn't support it";
        }
        return vulkanError("create instance", vr, msg);
    }

    if (wantValidation) {
        auto createFunc = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(inst.instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (createFunc) {
            VkDebugUtilsMessengerCreateInfoEXT messengerCI = debugCI;
            messengerCI.pNext = nullptr;
            vr = createFunc(inst.instance_, &messengerCI, nullptr, &inst.messenger_);
            if (vr != VK_SUCCESS) {
                inst.messenger_ = VK_NULL_HANDLE;
                std::fprintf(stderr, "[vkbind] debug messenger creation failed (%s)\n",
                             vkResultName(vr));
            }
        }
    }

    return inst;
}

} // namespace vkbind
