#pragma once

#include <vkbind/error.hpp>
#include <vkbind/result.hpp>
#include <vkbind/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vkbind {

class Instance;
class Device;

// Per-heap memory snapshot.
// usage    -- bytes currently allocated through this allocator's heaps.
// budget   -- bytes VMA estimates are available to this process.
// heapSize -- VkMemoryHeap::size.
struct HeapBudget {
    std::uint64_t     usage    = 0;
    std::uint64_t     budget   = 0;
    std::uint64_t     heapSize = 0;
    VkMemoryHeapFlags flags    = 0;
};

// Owns the VMA allocator that backs every Buffer and Image.
// Must outlive all resources allocated from it.
//
// Thread safety: VMA synchronizes internally (vkbind never sets
// VMA_ALLOCATOR_CREATE_EXTERNALLY_SYNCHRONIZED_BIT).
class Allocator {
public:
    [[nodiscard]] static Result<Allocator> create(const Instance& instance, const Device& device);

    ~Allocator();
    Allocator(Allocator&&) noexcept;
    Allocator& operator=(Allocator&&) noexcept;
    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    [[nodiscard]] VmaAllocator native()       const { return allocator_; }
    [[nodiscard]] VmaAllocator vmaAllocator() const { return native(); }
    [[nodiscard]] VkDevice     vkDevice()     const { return device_; }

    // One entry per physical device heap.
    [[nodiscard]] std::vector<HeapBudget> queryBudget() const;

private:
    Allocator() = default;

    VmaAllocator allocator_ = nullptr;
    VkDevice     device_    = VK_NULL_HANDLE;
};

} // namespace vkbind
