#include <vkbind/buffer.hpp>
#include <vkbind/format_marker.hpp>

#include <cassert>
#include <cstdint>
#include <type_traits>

namespace fmt = vkbind::formats;
using vkbind::Format;
using vkbind::FormatClass;

// Markers agree with the runtime registry.
static_assert(fmt::R8G8B8A8Unorm::format == Format::R8G8B8A8Unorm);
static_assert(fmt::R8G8B8A8Unorm::vkFormat == VK_FORMAT_R8G8B8A8_UNORM);
static_assert(fmt::R8G8B8A8Unorm::formatClass == FormatClass::Float);
static_assert(fmt::D16Unorm::formatClass == vkbind::formatClass(Format::D16Unorm));
static_assert(fmt::ASTC_12x12SrgbBlock::formatClass == FormatClass::Compressed);

// Markers are zero-sized tags.
static_assert(std::is_empty_v<fmt::R32Uint>);

// Recognition
static_assert(vkbind::isFormatMarker<fmt::R32Uint>);
static_assert(!vkbind::isFormatMarker<int>);
static_assert(!vkbind::isFormatMarker<Format>);

// Class predicates
static_assert(vkbind::isFloatFormatMarker<fmt::R16G16Sfloat>);
static_assert(vkbind::isUintFormatMarker<fmt::R8G8B8A8Uint>);
static_assert(vkbind::isSintFormatMarker<fmt::R32G32Sint>);
static_assert(vkbind::isDepthFormatMarker<fmt::D32Sfloat>);
static_assert(vkbind::isStencilFormatMarker<fmt::S8Uint>);
static_assert(vkbind::isDepthStencilFormatMarker<fmt::D24Unorm_S8Uint>);
static_assert(vkbind::isCompressedFormatMarker<fmt::BC7SrgbBlock>);

static_assert(!vkbind::isUintFormatMarker<fmt::R32Sfloat>);
static_assert(!vkbind::isFloatFormatMarker<fmt::R32Uint>);
static_assert(!vkbind::isDepthFormatMarker<fmt::D24Unorm_S8Uint>);
static_assert(!vkbind::isFloatFormatMarker<int>);

// Depth attachments accept Depth and DepthStencil only.
static_assert(vkbind::isDepthAttachmentMarker<fmt::D16Unorm>);
static_assert(vkbind::isDepthAttachmentMarker<fmt::D32Sfloat_S8Uint>);
static_assert(!vkbind::isDepthAttachmentMarker<fmt::S8Uint>);
static_assert(!vkbind::isDepthAttachmentMarker<fmt::R32Sfloat>);

// Host element types
static_assert(vkbind::formatOf<std::uint32_t>() == Format::R32Uint);
static_assert(vkbind::formatOf<std::int16_t>() == Format::R16Sint);
static_assert(vkbind::formatOf<float>() == Format::R32Sfloat);
static_assert(vkbind::formatOf<float[4]>() == Format::R32G32B32A32Sfloat);
static_assert(std::is_same_v<vkbind::DataFormat<std::uint8_t>::Marker, fmt::R8Uint>);

// Typed buffers carry their element format in the type.
static_assert(vkbind::TypedBuffer<std::uint32_t>::format == Format::R32Uint);
static_assert(vkbind::TypedBuffer<float[4]>::format == Format::R32G32B32A32Sfloat);
static_assert(std::is_same_v<vkbind::TypedBuffer<std::int8_t>::Marker, fmt::R8Sint>);
static_assert(std::is_same_v<vkbind::TypedBuffer<double>::Element, double>);
static_assert(vkbind::isUintFormatMarker<vkbind::TypedBuffer<std::uint16_t>::Marker>);
static_assert(!std::is_constructible_v<vkbind::TypedBuffer<float>, vkbind::Buffer&&>);

namespace {

// The shape typed resources take: a marker parameter constrained by class.
template <typename M>
constexpr std::uint32_t uintTexelCode() {
    static_assert(vkbind::isUintFormatMarker<M>, "uint format required");
    return vkbind::toCode(M::format);
}

} // namespace

int main() {
    // Markers are usable as ordinary values too.
    {
        fmt::R8G8B8A8Srgb srgb;
        (void)srgb;
        assert(fmt::R8G8B8A8Srgb::format == Format::R8G8B8A8Srgb);
        assert(vkbind::formatName(fmt::D16Unorm::format) == "D16Unorm");
    }

    // Constrained templates take the marker's code
    {
        constexpr auto code = uintTexelCode<fmt::R32Uint>();
        static_assert(code == VK_FORMAT_R32_UINT);
        assert(code == 98);
    }

    return 0;
}
