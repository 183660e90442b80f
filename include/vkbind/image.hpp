#pragma once

#include <vkbind/error.hpp>
#include <vkbind/format.hpp>
#include <vkbind/format_marker.hpp>
#include <vkbind/result.hpp>
#include <vkbind/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <utility>

namespace vkbind {

class Allocator;

// 2D image with one view covering every mip level.
//
// Thread safety: immutable after construction.
class Image {
public:
    ~Image();
    Image(Image&&) noexcept;
    Image& operator=(Image&&) noexcept;
    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    [[nodiscard]] VkImage               native()      const { return image_; }
    [[nodiscard]] VkImage               vkImage()     const { return native(); }
    [[nodiscard]] VkImageView           vkImageView() const { return view_; }
    [[nodiscard]] Format                format()      const { return format_; }
    [[nodiscard]] VkFormat              vkFormat()    const { return toVkFormat(format_); }
    [[nodiscard]] VkImageUsageFlags     usage()       const { return usage_; }
    [[nodiscard]] VkExtent2D            extent()      const { return extent_; }
    [[nodiscard]] std::uint32_t         mipLevels()   const { return mipLevels_; }
    [[nodiscard]] VkSampleCountFlagBits samples()     const { return samples_; }

private:
    friend class ImageBuilder;
    Image() = default;
    void destroy();

    VmaAllocator          allocator_  = nullptr;
    VkDevice              device_     = VK_NULL_HANDLE;
    VkImage               image_      = VK_NULL_HANDLE;
    VkImageView           view_       = VK_NULL_HANDLE;
    VmaAllocation         allocation_ = nullptr;
    Format                format_     = Format::Undefined;
    VkImageUsageFlags     usage_      = 0;
    VkExtent2D            extent_     = {0, 0};
    std::uint32_t         mipLevels_  = 1;
    VkSampleCountFlagBits samples_    = VK_SAMPLE_COUNT_1_BIT;
};

// An Image whose format is part of its type. Only ImageBuilder::buildTyped
// makes one, so M::format always matches the image.
template <typename M>
class TypedImage {
    static_assert(isFormatMarker<M>, "TypedImage needs a vkbind::formats marker");

public:
    using Marker = M;
    static constexpr Format format = M::format;

    [[nodiscard]] const Image& image()       const { return image_; }
    [[nodiscard]] VkImage      native()      const { return image_.native(); }
    [[nodiscard]] VkImageView  vkImageView() const { return image_.vkImageView(); }
    [[nodiscard]] VkExtent2D   extent()      const { return image_.extent(); }

    // Gives up the static format.
    [[nodiscard]] Image release() && { return std::move(image_); }

private:
    friend class ImageBuilder;
    explicit TypedImage(Image&& image) : image_(std::move(image)) {}

    Image image_;
};

class ImageBuilder {
public:
    explicit ImageBuilder(const Allocator& allocator);

    ImageBuilder& size(std::uint32_t width, std::uint32_t height);
    ImageBuilder& format(Format fmt);

    template <typename M>
    ImageBuilder& format() {
        static_assert(isFormatMarker<M>, "format<M>() needs a vkbind::formats marker");
        return format(M::format);
    }

    // Convenience methods -- set usage for common patterns. The view aspect is
    // derived from the format's class.
    ImageBuilder& colorAttachment();       // COLOR_ATTACHMENT | SAMPLED
    ImageBuilder& depthAttachment();       // DEPTH_STENCIL_ATTACHMENT, defaults D32Sfloat
    ImageBuilder& sampled();               // SAMPLED | TRANSFER_DST
    ImageBuilder& storage();               // STORAGE | SAMPLED

    // Depth attachment with a format checked at compile time.
    template <typename M>
    ImageBuilder& depthAttachment() {
        static_assert(isDepthAttachmentMarker<M>,
                      "depthAttachment<M>() needs a Depth or DepthStencil format marker");
        depthAttachment();
        return format(M::format);
    }

    // Escape hatches
    ImageBuilder& usage(VkImageUsageFlags flags);
    ImageBuilder& addUsage(VkImageUsageFlags flags);
    ImageBuilder& samples(VkSampleCountFlagBits s);
    ImageBuilder& mipLevels(std::uint32_t levels);

    [[nodiscard]] Result<Image> build();

    template <typename M>
    [[nodiscard]] Result<TypedImage<M>> buildTyped() {
        static_assert(isFormatMarker<M>, "buildTyped<M>() needs a vkbind::formats marker");
        format(M::format);
        auto img = build();
        if (!img.ok()) return std::move(img).error();
        return TypedImage<M>(std::move(img).value());
    }

private:
    VmaAllocator          allocator_ = nullptr;
    VkDevice              device_    = VK_NULL_HANDLE;
    std::uint32_t         width_     = 0;
    std::uint32_t         height_    = 0;
    Format                format_    = Format::Undefined;
    VkImageUsageFlags     usage_     = 0;
    VkSampleCountFlagBits samples_   = VK_SAMPLE_COUNT_1_BIT;
    std::uint32_t         mipLevels_ = 1;
};

} // namespace vkbind
