#include <vkbind/error.hpp>

#include <vulkan/vulkan.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace vkbind {

#ifndef VKBIND_ENABLE_EXCEPTIONS
#define VKBIND_ENABLE_EXCEPTIONS 1
#endif

static bool IsExhaustion(std::int32_t vkResult) {
    switch (static_cast<VkResult>(vkResult)) {
    case VK_ERROR_OUT_OF_HOST_MEMORY:
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
    case VK_ERROR_OUT_OF_POOL_MEMORY:
    case VK_ERROR_FRAGMENTED_POOL:
    case VK_ERROR_FRAGMENTATION:
        return true;
    default:
        return false;
    }
}

const char* vkResultName(std::int32_t vkResult) {
    switch (static_cast<VkResult>(vkResult)) {
    case VK_SUCCESS:                     return "success";
    case VK_NOT_READY:                   return "not ready";
    case VK_TIMEOUT:                     return "timeout";
    case VK_INCOMPLETE:                  return "incomplete";
    case VK_ERROR_OUT_OF_HOST_MEMORY:    return "out of host memory";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:  return "out of GPU memory";
    case VK_ERROR_INITIALIZATION_FAILED: return "initialization failed";
    case VK_ERROR_DEVICE_LOST:           return "device lost (GPU crashed or was removed)";
    case VK_ERROR_LAYER_NOT_PRESENT:     return "requested layer not present";
    case VK_ERROR_EXTENSION_NOT_PRESENT: return "requested extension not present";
    case VK_ERROR_FEATURE_NOT_PRESENT:   return "requested feature not present";
    case VK_ERROR_INCOMPATIBLE_DRIVER:   return "incompatible Vulkan driver";
    case VK_ERROR_TOO_MANY_OBJECTS:      return "too many objects";
    case VK_ERROR_FORMAT_NOT_SUPPORTED:  return "format not supported";
    case VK_ERROR_FRAGMENTED_POOL:       return "fragmented pool";
    case VK_ERROR_OUT_OF_POOL_MEMORY:    return "out of pool memory";
    case VK_ERROR_FRAGMENTATION:         return "fragmentation";
    default:
        return "unknown error";
    }
}

bool Error::isOutOfMemory() const {
    return kind == ErrorKind::OutOfMemory || IsExhaustion(vkResult);
}

std::string Error::format() const {
    std::string out = "vkbind: " + operation + " failed";

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult) + " " + vkResultName(vkResult) + ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

Error vulkanError(std::string operation, std::int32_t vkResult, std::string message) {
    ErrorKind kind = IsExhaustion(vkResult) ? ErrorKind::OutOfMemory : ErrorKind::Driver;
    return Error{std::move(operation), vkResult, std::move(message), kind};
}

void throwError(const Error& e) {
#if VKBIND_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace vkbind
