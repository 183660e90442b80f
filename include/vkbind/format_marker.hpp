#pragma once

#include <vkbind/format.hpp>

#include <cstdint>
#include <type_traits>

namespace vkbind {

// Zero-sized compile-time tag naming one Format. Buffer and image types take a
// marker as a template parameter so their element format is part of their
// static type and mismatches fail to compile instead of failing at draw time.
//
// The set of markers is closed: FormatMarker<F> for the enumerators of Format,
// with the aliases in vkbind::formats. A marker's format and class come from
// kFormatTable, so they cannot disagree with the runtime registry.
template <Format F>
struct FormatMarker {
    static constexpr Format      format      = F;
    static constexpr FormatClass formatClass = vkbind::formatClass(F);
    static constexpr VkFormat    vkFormat    = toVkFormat(F);
};

template <typename T>
struct IsFormatMarker : std::false_type {};

template <Format F>
struct IsFormatMarker<FormatMarker<F>> : std::true_type {};

template <typename T>
inline constexpr bool isFormatMarker = IsFormatMarker<T>::value;

namespace detail {

template <typename T, FormatClass C>
[[nodiscard]] constexpr bool markerHasClass() {
    if constexpr (isFormatMarker<T>) {
        return T::formatClass == C;
    } else {
        return false;
    }
}

} // namespace detail

template <typename T>
inline constexpr bool isFloatFormatMarker = detail::markerHasClass<T, FormatClass::Float>();
template <typename T>
inline constexpr bool isUintFormatMarker = detail::markerHasClass<T, FormatClass::Uint>();
template <typename T>
inline constexpr bool isSintFormatMarker = detail::markerHasClass<T, FormatClass::Sint>();
template <typename T>
inline constexpr bool isDepthFormatMarker = detail::markerHasClass<T, FormatClass::Depth>();
template <typename T>
inline constexpr bool isStencilFormatMarker = detail::markerHasClass<T, FormatClass::Stencil>();
template <typename T>
inline constexpr bool isDepthStencilFormatMarker =
    detail::markerHasClass<T, FormatClass::DepthStencil>();
template <typename T>
inline constexpr bool isCompressedFormatMarker =
    detail::markerHasClass<T, FormatClass::Compressed>();

// Anything usable as a depth attachment: Depth or DepthStencil.
template <typename T>
inline constexpr bool isDepthAttachmentMarker =
    isDepthFormatMarker<T> || isDepthStencilFormatMarker<T>;

namespace formats {

using Undefined                = FormatMarker<Format::Undefined>;
using R4G4UnormPack8           = FormatMarker<Format::R4G4UnormPack8>;
using R4G4B4A4UnormPack16      = FormatMarker<Format::R4G4B4A4UnormPack16>;
using B4G4R4A4UnormPack16      = FormatMarker<Format::B4G4R4A4UnormPack16>;
using R5G6B5UnormPack16        = FormatMarker<Format::R5G6B5UnormPack16>;
using B5G6R5UnormPack16        = FormatMarker<Format::B5G6R5UnormPack16>;
using R5G5B5A1UnormPack16      = FormatMarker<Format::R5G5B5A1UnormPack16>;
using B5G5R5A1UnormPack16      = FormatMarker<Format::B5G5R5A1UnormPack16>;
using A1R5G5B5UnormPack16      = FormatMarker<Format::A1R5G5B5UnormPack16>;
using R8Unorm                  = FormatMarker<Format::R8Unorm>;
using R8Snorm                  = FormatMarker<Format::R8Snorm>;
using R8Uscaled                = FormatMarker<Format::R8Uscaled>;
using R8Sscaled                = FormatMarker<Format::R8Sscaled>;
using R8Uint                   = FormatMarker<Format::R8Uint>;
using R8Sint                   = FormatMarker<Format::R8Sint>;
using R8Srgb                   = FormatMarker<Format::R8Srgb>;
using R8G8Unorm                = FormatMarker<Format::R8G8Unorm>;
using R8G8Snorm                = FormatMarker<Format::R8G8Snorm>;
using R8G8Uscaled              = FormatMarker<Format::R8G8Uscaled>;
using R8G8Sscaled              = FormatMarker<Format::R8G8Sscaled>;
using R8G8Uint                 = FormatMarker<Format::R8G8Uint>;
using R8G8Sint                 = FormatMarker<Format::R8G8Sint>;
using R8G8Srgb                 = FormatMarker<Format::R8G8Srgb>;
using R8G8B8Unorm              = FormatMarker<Format::R8G8B8Unorm>;
using R8G8B8Snorm              = FormatMarker<Format::R8G8B8Snorm>;
using R8G8B8Uscaled            = FormatMarker<Format::R8G8B8Uscaled>;
using R8G8B8Sscaled            = FormatMarker<Format::R8G8B8Sscaled>;
using R8G8B8Uint               = FormatMarker<Format::R8G8B8Uint>;
using R8G8B8Sint               = FormatMarker<Format::R8G8B8Sint>;
using R8G8B8Srgb               = FormatMarker<Format::R8G8B8Srgb>;
using B8G8R8Unorm              = FormatMarker<Format::B8G8R8Unorm>;
using B8G8R8Snorm              = FormatMarker<Format::B8G8R8Snorm>;
using B8G8R8Uscaled            = FormatMarker<Format::B8G8R8Uscaled>;
using B8G8R8Sscaled            = FormatMarker<Format::B8G8R8Sscaled>;
using B8G8R8Uint               = FormatMarker<Format::B8G8R8Uint>;
using B8G8R8Sint               = FormatMarker<Format::B8G8R8Sint>;
using B8G8R8Srgb               = FormatMarker<Format::B8G8R8Srgb>;
using R8G8B8A8Unorm            = FormatMarker<Format::R8G8B8A8Unorm>;
using R8G8B8A8Snorm            = FormatMarker<Format::R8G8B8A8Snorm>;
using R8G8B8A8Uscaled          = FormatMarker<Format::R8G8B8A8Uscaled>;
using R8G8B8A8Sscaled          = FormatMarker<Format::R8G8B8A8Sscaled>;
using R8G8B8A8Uint             = FormatMarker<Format::R8G8B8A8Uint>;
using R8G8B8A8Sint             = FormatMarker<Format::R8G8B8A8Sint>;
using R8G8B8A8Srgb             = FormatMarker<Format::R8G8B8A8Srgb>;
using B8G8R8A8Unorm            = FormatMarker<Format::B8G8R8A8Unorm>;
using B8G8R8A8Snorm            = FormatMarker<Format::B8G8R8A8Snorm>;
using B8G8R8A8Uscaled          = FormatMarker<Format::B8G8R8A8Uscaled>;
using B8G8R8A8Sscaled          = FormatMarker<Format::B8G8R8A8Sscaled>;
using B8G8R8A8Uint             = FormatMarker<Format::B8G8R8A8Uint>;
using B8G8R8A8Sint             = FormatMarker<Format::B8G8R8A8Sint>;
using B8G8R8A8Srgb             = FormatMarker<Format::B8G8R8A8Srgb>;
using A8B8G8R8UnormPack32      = FormatMarker<Format::A8B8G8R8UnormPack32>;
using A8B8G8R8SnormPack32      = FormatMarker<Format::A8B8G8R8SnormPack32>;
using A8B8G8R8UscaledPack32    = FormatMarker<Format::A8B8G8R8UscaledPack32>;
using A8B8G8R8SscaledPack32    = FormatMarker<Format::A8B8G8R8SscaledPack32>;
using A8B8G8R8UintPack32       = FormatMarker<Format::A8B8G8R8UintPack32>;
using A8B8G8R8SintPack32       = FormatMarker<Format::A8B8G8R8SintPack32>;
using A8B8G8R8SrgbPack32       = FormatMarker<Format::A8B8G8R8SrgbPack32>;
using A2R10G10B10UnormPack32   = FormatMarker<Format::A2R10G10B10UnormPack32>;
using A2R10G10B10SnormPack32   = FormatMarker<Format::A2R10G10B10SnormPack32>;
using A2R10G10B10UscaledPack32 = FormatMarker<Format::A2R10G10B10UscaledPack32>;
using A2R10G10B10SscaledPack32 = FormatMarker<Format::A2R10G10B10SscaledPack32>;
using A2R10G10B10UintPack32    = FormatMarker<Format::A2R10G10B10UintPack32>;
using A2R10G10B10SintPack32    = FormatMarker<Format::A2R10G10B10SintPack32>;
using A2B10G10R10UnormPack32   = FormatMarker<Format::A2B10G10R10UnormPack32>;
using A2B10G10R10SnormPack32   = FormatMarker<Format::A2B10G10R10SnormPack32>;
using A2B10G10R10UscaledPack32 = FormatMarker<Format::A2B10G10R10UscaledPack32>;
using A2B10G10R10SscaledPack32 = FormatMarker<Format::A2B10G10R10SscaledPack32>;
using A2B10G10R10UintPack32    = FormatMarker<Format::A2B10G10R10UintPack32>;
using A2B10G10R10SintPack32    = FormatMarker<Format::A2B10G10R10SintPack32>;
using R16Unorm                 = FormatMarker<Format::R16Unorm>;
using R16Snorm                 = FormatMarker<Format::R16Snorm>;
using R16Uscaled               = FormatMarker<Format::R16Uscaled>;
using R16Sscaled               = FormatMarker<Format::R16Sscaled>;
using R16Uint                  = FormatMarker<Format::R16Uint>;
using R16Sint                  = FormatMarker<Format::R16Sint>;
using R16Sfloat                = FormatMarker<Format::R16Sfloat>;
using R16G16Unorm              = FormatMarker<Format::R16G16Unorm>;
using R16G16Snorm              = FormatMarker<Format::R16G16Snorm>;
using R16G16Uscaled            = FormatMarker<Format::R16G16Uscaled>;
using R16G16Sscaled            = FormatMarker<Format::R16G16Sscaled>;
using R16G16Uint               = FormatMarker<Format::R16G16Uint>;
using R16G16Sint               = FormatMarker<Format::R16G16Sint>;
using R16G16Sfloat             = FormatMarker<Format::R16G16Sfloat>;
using R16G16B16Unorm           = FormatMarker<Format::R16G16B16Unorm>;
using R16G16B16Snorm           = FormatMarker<Format::R16G16B16Snorm>;
using R16G16B16Uscaled         = FormatMarker<Format::R16G16B16Uscaled>;
using R16G16B16Sscaled         = FormatMarker<Format::R16G16B16Sscaled>;
using R16G16B16Uint            = FormatMarker<Format::R16G16B16Uint>;
using R16G16B16Sint            = FormatMarker<Format::R16G16B16Sint>;
using R16G16B16Sfloat          = FormatMarker<Format::R16G16B16Sfloat>;
using R16G16B16A16Unorm        = FormatMarker<Format::R16G16B16A16Unorm>;
using R16G16B16A16Snorm        = FormatMarker<Format::R16G16B16A16Snorm>;
using R16G16B16A16Uscaled      = FormatMarker<Format::R16G16B16A16Uscaled>;
using R16G16B16A16Sscaled      = FormatMarker<Format::R16G16B16A16Sscaled>;
using R16G16B16A16Uint         = FormatMarker<Format::R16G16B16A16Uint>;
using R16G16B16A16Sint         = FormatMarker<Format::R16G16B16A16Sint>;
using R16G16B16A16Sfloat       = FormatMarker<Format::R16G16B16A16Sfloat>;
using R32Uint                  = FormatMarker<Format::R32Uint>;
using R32Sint                  = FormatMarker<Format::R32Sint>;
using R32Sfloat                = FormatMarker<Format::R32Sfloat>;
using R32G32Uint               = FormatMarker<Format::R32G32Uint>;
using R32G32Sint               = FormatMarker<Format::R32G32Sint>;
using R32G32Sfloat             = FormatMarker<Format::R32G32Sfloat>;
using R32G32B32Uint            = FormatMarker<Format::R32G32B32Uint>;
using R32G32B32Sint            = FormatMarker<Format::R32G32B32Sint>;
using R32G32B32Sfloat          = FormatMarker<Format::R32G32B32Sfloat>;
using R32G32B32A32Uint         = FormatMarker<Format::R32G32B32A32Uint>;
using R32G32B32A32Sint         = FormatMarker<Format::R32G32B32A32Sint>;
using R32G32B32A32Sfloat       = FormatMarker<Format::R32G32B32A32Sfloat>;
using R64Uint                  = FormatMarker<Format::R64Uint>;
using R64Sint                  = FormatMarker<Format::R64Sint>;
using R64Sfloat                = FormatMarker<Format::R64Sfloat>;
using R64G64Uint               = FormatMarker<Format::R64G64Uint>;
using R64G64Sint               = FormatMarker<Format::R64G64Sint>;
using R64G64Sfloat             = FormatMarker<Format::R64G64Sfloat>;
using R64G64B64Uint            = FormatMarker<Format::R64G64B64Uint>;
using R64G64B64Sint            = FormatMarker<Format::R64G64B64Sint>;
using R64G64B64Sfloat          = FormatMarker<Format::R64G64B64Sfloat>;
using R64G64B64A64Uint         = FormatMarker<Format::R64G64B64A64Uint>;
using R64G64B64A64Sint         = FormatMarker<Format::R64G64B64A64Sint>;
using R64G64B64A64Sfloat       = FormatMarker<Format::R64G64B64A64Sfloat>;
using B10G11R11UfloatPack32    = FormatMarker<Format::B10G11R11UfloatPack32>;
using E5B9G9R9UfloatPack32     = FormatMarker<Format::E5B9G9R9UfloatPack32>;
using D16Unorm                 = FormatMarker<Format::D16Unorm>;
using X8_D24UnormPack32        = FormatMarker<Format::X8_D24UnormPack32>;
using D32Sfloat                = FormatMarker<Format::D32Sfloat>;
using S8Uint                   = FormatMarker<Format::S8Uint>;
using D16Unorm_S8Uint          = FormatMarker<Format::D16Unorm_S8Uint>;
using D24Unorm_S8Uint          = FormatMarker<Format::D24Unorm_S8Uint>;
using D32Sfloat_S8Uint         = FormatMarker<Format::D32Sfloat_S8Uint>;
using BC1_RGBUnormBlock        = FormatMarker<Format::BC1_RGBUnormBlock>;
using BC1_RGBSrgbBlock         = FormatMarker<Format::BC1_RGBSrgbBlock>;
using BC1_RGBAUnormBlock       = FormatMarker<Format::BC1_RGBAUnormBlock>;
using BC1_RGBASrgbBlock        = FormatMarker<Format::BC1_RGBASrgbBlock>;
using BC2UnormBlock            = FormatMarker<Format::BC2UnormBlock>;
using BC2SrgbBlock             = FormatMarker<Format::BC2SrgbBlock>;
using BC3UnormBlock            = FormatMarker<Format::BC3UnormBlock>;
using BC3SrgbBlock             = FormatMarker<Format::BC3SrgbBlock>;
using BC4UnormBlock            = FormatMarker<Format::BC4UnormBlock>;
using BC4SnormBlock            = FormatMarker<Format::BC4SnormBlock>;
using BC5UnormBlock            = FormatMarker<Format::BC5UnormBlock>;
using BC5SnormBlock            = FormatMarker<Format::BC5SnormBlock>;
using BC6HUfloatBlock          = FormatMarker<Format::BC6HUfloatBlock>;
using BC6HSfloatBlock          = FormatMarker<Format::BC6HSfloatBlock>;
using BC7UnormBlock            = FormatMarker<Format::BC7UnormBlock>;
using BC7SrgbBlock             = FormatMarker<Format::BC7SrgbBlock>;
using ETC2_R8G8B8UnormBlock    = FormatMarker<Format::ETC2_R8G8B8UnormBlock>;
using ETC2_R8G8B8SrgbBlock     = FormatMarker<Format::ETC2_R8G8B8SrgbBlock>;
using ETC2_R8G8B8A1UnormBlock  = FormatMarker<Format::ETC2_R8G8B8A1UnormBlock>;
using ETC2_R8G8B8A1SrgbBlock   = FormatMarker<Format::ETC2_R8G8B8A1SrgbBlock>;
using ETC2_R8G8B8A8UnormBlock  = FormatMarker<Format::ETC2_R8G8B8A8UnormBlock>;
using ETC2_R8G8B8A8SrgbBlock   = FormatMarker<Format::ETC2_R8G8B8A8SrgbBlock>;
using EAC_R11UnormBlock        = FormatMarker<Format::EAC_R11UnormBlock>;
using EAC_R11SnormBlock        = FormatMarker<Format::EAC_R11SnormBlock>;
using EAC_R11G11UnormBlock     = FormatMarker<Format::EAC_R11G11UnormBlock>;
using EAC_R11G11SnormBlock     = FormatMarker<Format::EAC_R11G11SnormBlock>;
using ASTC_4x4UnormBlock       = FormatMarker<Format::ASTC_4x4UnormBlock>;
using ASTC_4x4SrgbBlock        = FormatMarker<Format::ASTC_4x4SrgbBlock>;
using ASTC_5x4UnormBlock       = FormatMarker<Format::ASTC_5x4UnormBlock>;
using ASTC_5x4SrgbBlock        = FormatMarker<Format::ASTC_5x4SrgbBlock>;
using ASTC_5x5UnormBlock       = FormatMarker<Format::ASTC_5x5UnormBlock>;
using ASTC_5x5SrgbBlock        = FormatMarker<Format::ASTC_5x5SrgbBlock>;
using ASTC_6x5UnormBlock       = FormatMarker<Format::ASTC_6x5UnormBlock>;
using ASTC_6x5SrgbBlock        = FormatMarker<Format::ASTC_6x5SrgbBlock>;
using ASTC_6x6UnormBlock       = FormatMarker<Format::ASTC_6x6UnormBlock>;
using ASTC_6x6SrgbBlock        = FormatMarker<Format::ASTC_6x6SrgbBlock>;
using ASTC_8x5UnormBlock       = FormatMarker<Format::ASTC_8x5UnormBlock>;
using ASTC_8x5SrgbBlock        = FormatMarker<Format::ASTC_8x5SrgbBlock>;
using ASTC_8x6UnormBlock       = FormatMarker<Format::ASTC_8x6UnormBlock>;
using ASTC_8x6SrgbBlock        = FormatMarker<Format::ASTC_8x6SrgbBlock>;
using ASTC_8x8UnormBlock       = FormatMarker<Format::ASTC_8x8UnormBlock>;
using ASTC_8x8SrgbBlock        = FormatMarker<Format::ASTC_8x8SrgbBlock>;
using ASTC_10x5UnormBlock      = FormatMarker<Format::ASTC_10x5UnormBlock>;
using ASTC_10x5SrgbBlock       = FormatMarker<Format::ASTC_10x5SrgbBlock>;
using ASTC_10x6UnormBlock      = FormatMarker<Format::ASTC_10x6UnormBlock>;
using ASTC_10x6SrgbBlock       = FormatMarker<Format::ASTC_10x6SrgbBlock>;
using ASTC_10x8UnormBlock      = FormatMarker<Format::ASTC_10x8UnormBlock>;
using ASTC_10x8SrgbBlock       = FormatMarker<Format::ASTC_10x8SrgbBlock>;
using ASTC_10x10UnormBlock     = FormatMarker<Format::ASTC_10x10UnormBlock>;
using ASTC_10x10SrgbBlock      = FormatMarker<Format::ASTC_10x10SrgbBlock>;
using ASTC_12x10UnormBlock     = FormatMarker<Format::ASTC_12x10UnormBlock>;
using ASTC_12x10SrgbBlock      = FormatMarker<Format::ASTC_12x10SrgbBlock>;
using ASTC_12x12UnormBlock     = FormatMarker<Format::ASTC_12x12UnormBlock>;
using ASTC_12x12SrgbBlock      = FormatMarker<Format::ASTC_12x12SrgbBlock>;

} // namespace formats

// Host element type -> format. Only the types below are mapped; asking for
// anything else is a compile error rather than a silently wrong format.
template <typename T>
struct DataFormat {
    static_assert(sizeof(T) == 0, "no Format is registered for this element type");
};

template <> struct DataFormat<std::uint8_t>  { using Marker = formats::R8Uint; };
template <> struct DataFormat<std::int8_t>   { using Marker = formats::R8Sint; };
template <> struct DataFormat<std::uint16_t> { using Marker = formats::R16Uint; };
template <> struct DataFormat<std::int16_t>  { using Marker = formats::R16Sint; };
template <> struct DataFormat<std::uint32_t> { using Marker = formats::R32Uint; };
template <> struct DataFormat<std::int32_t>  { using Marker = formats::R32Sint; };
template <> struct DataFormat<std::uint64_t> { using Marker = formats::R64Uint; };
template <> struct DataFormat<std::int64_t>  { using Marker = formats::R64Sint; };
template <> struct DataFormat<float>         { using Marker = formats::R32Sfloat; };
template <> struct DataFormat<double>        { using Marker = formats::R64Sfloat; };
template <> struct DataFormat<float[2]>      { using Marker = formats::R32G32Sfloat; };
template <> struct DataFormat<float[3]>      { using Marker = formats::R32G32B32Sfloat; };
template <> struct DataFormat<float[4]>      { using Marker = formats::R32G32B32A32Sfloat; };

template <typename T>
[[nodiscard]] constexpr Format formatOf() {
    return DataFormat<T>::Marker::format;
}

} // namespace vkbind
