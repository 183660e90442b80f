#include <vkbind/buffer.hpp>
#include <vkbind/allocator.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstring>
#include <string>

namespace vkbind {

Buffer::~Buffer() {
    if (buffer_ != VK_NULL_HANDLE) {
        vmaDestroyBuffer(allocator_, buffer_, allocation_);
    }
}

Buffer::Buffer(Buffer&& o) noexcept
    : allocator_(o.allocator_), buffer_(o.buffer_), allocation_(o.allocation_),
      size_(o.size_), usage_(o.usage_), mapped_(o.mapped_) {
    o.allocator_  = nullptr;
    o.buffer_     = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
    o.size_       = 0;
    o.usage_      = 0;
    o.mapped_     = nullptr;
}

Buffer& Buffer::operator=(Buffer&& o) noexcept {
    if (this != &o) {
        if (buffer_ != VK_NULL_HANDLE) {
            vmaDestroyBuffer(allocator_, buffer_, allocation_);
        }
        allocator_    = o.allocator_;
        buffer_       = o.buffer_;
        allocation_   = o.allocation_;
        size_         = o.size_;
        usage_        = o.usage_;
        mapped_       = o.mapped_;
        o.allocator_  = nullptr;
        o.buffer_     = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
        o.size_       = 0;
        o.usage_      = 0;
        o.mapped_     = nullptr;
    }
    return *this;
}

Result<void> Buffer::write(const void* data, VkDeviceSize bytes, VkDeviceSize offset) const {
    if (mapped_ == nullptr) {
        return Error{"write buffer", 0,
                     "buffer is not host-mapped -- build it with uniformBuffer() or mapped()",
                     ErrorKind::InvalidArgument};
    }
    if (offset > size_ || bytes > size_ - offset) {
        return Error{"write buffer", 0,
                     std::to_string(bytes) + " bytes at offset " + std::to_string(offset) +
                         " overflow a " + std::to_string(size_) + "-byte buffer",
                     ErrorKind::InvalidArgument};
    }

    std::memcpy(static_cast<char*>(mapped_) + offset, data, static_cast<std::size_t>(bytes));

    // No-op on HOST_COHERENT memory.
    VkResult vr = vmaFlushAllocation(allocator_, allocation_, offset, bytes);
    if (vr != VK_SUCCESS) {
        return vulkanError("flush buffer", vr, "vmaFlushAllocation failed");
    }
    return {};
}

BufferBuilder::BufferBuilder(const Allocator& allocator)
    : allocator_(allocator.vmaAllocator()) {}

BufferBuilder& BufferBuilder::size(VkDeviceSize bytes) {
    size_ = bytes;
    return *this;
}

BufferBuilder& BufferBuilder::uniformBuffer() {
    usage_  = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    mapped_ = true;
    return *this;
}

BufferBuilder& BufferBuilder::storageBuffer() {
    usage_ = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    return *this;
}

BufferBuilder& BufferBuilder::stagingBuffer() {
    usage_  = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
    mapped_ = true;
    return *this;
}

BufferBuilder& BufferBuilder::usage(VkBufferUsageFlags flags) {
    usage_ = flags;
    return *this;
}

BufferBuilder& BufferBuilder::mapped() {
    mapped_ = true;
    return *this;
}

Result<Buffer> BufferBuilder::build() {
    if (size_ == 0) {
        return Error{"create buffer", 0,
                     "buffer size is 0 -- call size(bytes)", ErrorKind::InvalidArgument};
    }
    if (usage_ == 0) {
        return Error{"create buffer", 0,
                     "no usage flags -- call uniformBuffer(), storageBuffer(), etc.",
                     ErrorKind::InvalidArgument};
    }

    VkBufferCreateInfo bufCI{};
    bufCI.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufCI.size        = size_;
    bufCI.usage       = usage_;
    bufCI.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;

    if (mapped_) {
        allocCI.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                        VMA_ALLOCATION_CREATE_MAPPED_BIT;
    }

    Buffer buf;
    buf.allocator_ = allocator_;
    buf.size_      = size_;
    buf.usage_     = usage_;

    VmaAllocationInfo allocInfo{};
    VkResult vr = vmaCreateBuffer(allocator_, &bufCI, &allocCI,
                                  &buf.buffer_, &buf.allocation_, &allocInfo);
    if (vr != VK_SUCCESS) {
        buf.buffer_ = VK_NULL_HANDLE;
        return vulkanError("create buffer", vr, "vmaCreateBuffer failed");
    }

    if (mapped_) {
        buf.mapped_ = allocInfo.pMappedData;
    }

    return buf;
}

} // namespace vkbind
