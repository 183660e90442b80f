#pragma once

#include <vkbind/error.hpp>
#include <vkbind/format.hpp>
#include <vkbind/format_marker.hpp>
#include <vkbind/result.hpp>
#include <vkbind/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

namespace vkbind {

class Allocator;

// Thread safety: immutable after construction. write() on a mapped buffer
// must be externally synchronized with GPU reads.
class Buffer {
public:
    ~Buffer();
    Buffer(Buffer&&) noexcept;
    Buffer& operator=(Buffer&&) noexcept;
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] VkBuffer           native()     const { return buffer_; }
    [[nodiscard]] VkBuffer           vkBuffer()   const { return native(); }
    [[nodiscard]] VkDeviceSize       size()       const { return size_; }
    [[nodiscard]] VkBufferUsageFlags usage()      const { return usage_; }
    [[nodiscard]] void*              mappedData() const { return mapped_; }

    // Copies bytes into a host-mapped buffer and flushes them.
    [[nodiscard]] Result<void> write(const void* data, VkDeviceSize bytes,
                                     VkDeviceSize offset = 0) const;

    template <typename T>
    [[nodiscard]] Result<void> write(const T& value, VkDeviceSize offset = 0) const {
        static_assert(std::is_trivially_copyable_v<T>, "buffer contents must be trivially copyable");
        return write(&value, sizeof(T), offset);
    }

private:
    friend class BufferBuilder;
    Buffer() = default;

    VmaAllocator       allocator_  = nullptr;
    VkBuffer           buffer_     = VK_NULL_HANDLE;
    VmaAllocation      allocation_ = nullptr;
    VkDeviceSize       size_       = 0;
    VkBufferUsageFlags usage_      = 0;
    void*              mapped_     = nullptr;
};

// A Buffer of T elements whose element format is part of its type. Only
// BufferBuilder::buildTyped makes one, so the size is always a whole number
// of elements.
template <typename T>
class TypedBuffer {
public:
    using Element = T;
    using Marker  = typename DataFormat<T>::Marker;
    static constexpr Format format = Marker::format;

    [[nodiscard]] const Buffer& buffer() const { return buffer_; }
    [[nodiscard]] VkBuffer      native() const { return buffer_.native(); }
    [[nodiscard]] VkDeviceSize  size()   const { return buffer_.size(); }
    [[nodiscard]] VkDeviceSize  count()  const { return buffer_.size() / sizeof(T); }

    // Writes `n` elements starting at element `first`.
    [[nodiscard]] Result<void> write(const T* data, std::size_t n, std::size_t first = 0) const {
        return buffer_.write(data, n * sizeof(T), first * sizeof(T));
    }

    // Gives up the static element type.
    [[nodiscard]] Buffer release() && { return std::move(buffer_); }

private:
    friend class BufferBuilder;
    explicit TypedBuffer(Buffer&& buffer) : buffer_(std::move(buffer)) {}

    Buffer buffer_;
};

// The untyped Buffer inside a shared TypedBuffer, sharing its ownership, for
// descriptor payloads.
template <typename T>
[[nodiscard]] std::shared_ptr<const Buffer> sharedBuffer(const std::shared_ptr<TypedBuffer<T>>& typed) {
    return std::shared_ptr<const Buffer>(typed, &typed->buffer());
}

class BufferBuilder {
public:
    explicit BufferBuilder(const Allocator& allocator);

    BufferBuilder& size(VkDeviceSize bytes);

    // Convenience methods -- set usage + VMA flags for common patterns.
    BufferBuilder& uniformBuffer(); // UNIFORM_BUFFER, host-mapped
    BufferBuilder& storageBuffer(); // STORAGE_BUFFER | TRANSFER_DST, device-local
    BufferBuilder& stagingBuffer(); // TRANSFER_SRC, host-mapped

    // Escape hatches
    BufferBuilder& usage(VkBufferUsageFlags flags);
    BufferBuilder& mapped();

    [[nodiscard]] Result<Buffer> build();

    // Sized for `count` elements of T. T must have a registered element format.
    template <typename T>
    [[nodiscard]] Result<TypedBuffer<T>> buildTyped(std::size_t count) {
        static_assert(isFormatMarker<typename DataFormat<T>::Marker>);
        if (count == 0) {
            return Error{"create buffer", 0, "typed buffer needs at least one element",
                         ErrorKind::InvalidArgument};
        }
        size(static_cast<VkDeviceSize>(count) * sizeof(T));
        auto buf = build();
        if (!buf.ok()) return std::move(buf).error();
        return TypedBuffer<T>(std::move(buf).value());
    }

private:
    VmaAllocator       allocator_ = nullptr;
    VkDeviceSize       size_      = 0;
    VkBufferUsageFlags usage_     = 0;
    bool               mapped_    = false;
};

} // namespace vkbind
