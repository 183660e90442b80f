#pragma once

#include <cstdint>
#include <string>

namespace vkbind {

// Which part of the error taxonomy an Error belongs to.
//   Driver          -- a Vulkan call failed for a reason other than exhaustion.
//   OutOfMemory     -- object creation or allocation ran out of host, device or
//                      pool memory, or hit a descriptor pool quota.
//   LayoutMismatch  -- a descriptor write disagrees with the declared layout.
//                      Always a programming error in the caller.
//   InvalidArgument -- a malformed description (duplicate bindings, zero counts...).
enum class ErrorKind : std::uint8_t {
    Driver,
    OutOfMemory,
    LayoutMismatch,
    InvalidArgument,
};

// Thin error type that carries what we tried, what Vulkan said, and a human message.
// VkResult is stored as int32_t to avoid pulling <vulkan/vulkan.h> into every header.
struct Error {
    std::string operation; // e.g. "allocate descriptor set"
    std::int32_t vkResult; // 0 (VK_SUCCESS) when not a Vulkan error
    std::string message;   // human-readable explanation + suggestion
    ErrorKind kind = ErrorKind::Driver;

    // True for OutOfMemory errors and for the Vulkan results that mean
    // exhaustion, whatever kind the producer tagged.
    [[nodiscard]] bool isOutOfMemory() const;

    // Format as a single readable string.
    [[nodiscard]] std::string format() const;
};

// Builds an Error from a failed Vulkan call. Exhaustion results are tagged
// OutOfMemory, everything else Driver.
[[nodiscard]] Error vulkanError(std::string operation, std::int32_t vkResult,
                                std::string message);

[[nodiscard]] const char* vkResultName(std::int32_t vkResult);

// Error unwrap hook used by Result<T>::orThrow().
// When VKBIND_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When VKBIND_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace vkbind
