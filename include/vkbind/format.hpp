#pragma once

#include <vulkan/vulkan.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vkbind {

// Every core Vulkan 1.0 format, valued with its VkFormat code.
//
// Suffixes: Unorm/Snorm are normalized integers read as floats in [0,1] / [-1,1];
// Uscaled/Sscaled are integers converted to float without rescaling;
// Uint/Sint are read as integers; Ufloat/Sfloat are floating point;
// Srgb is Unorm with an sRGB transfer on the color channels (alpha untouched).
enum class Format : std::uint32_t {
    Undefined                = VK_FORMAT_UNDEFINED,
    R4G4UnormPack8           = VK_FORMAT_R4G4_UNORM_PACK8,
    R4G4B4A4UnormPack16      = VK_FORMAT_R4G4B4A4_UNORM_PACK16,
    B4G4R4A4UnormPack16      = VK_FORMAT_B4G4R4A4_UNORM_PACK16,
    R5G6B5UnormPack16        = VK_FORMAT_R5G6B5_UNORM_PACK16,
    B5G6R5UnormPack16        = VK_FORMAT_B5G6R5_UNORM_PACK16,
    R5G5B5A1UnormPack16      = VK_FORMAT_R5G5B5A1_UNORM_PACK16,
    B5G5R5A1UnormPack16      = VK_FORMAT_B5G5R5A1_UNORM_PACK16,
    A1R5G5B5UnormPack16      = VK_FORMAT_A1R5G5B5_UNORM_PACK16,
    R8Unorm                  = VK_FORMAT_R8_UNORM,
    R8Snorm                  = VK_FORMAT_R8_SNORM,
    R8Uscaled                = VK_FORMAT_R8_USCALED,
    R8Sscaled                = VK_FORMAT_R8_SSCALED,
    R8Uint                   = VK_FORMAT_R8_UINT,
    R8Sint                   = VK_FORMAT_R8_SINT,
    R8Srgb                   = VK_FORMAT_R8_SRGB,
    R8G8Unorm                = VK_FORMAT_R8G8_UNORM,
    R8G8Snorm                = VK_FORMAT_R8G8_SNORM,
    R8G8Uscaled              = VK_FORMAT_R8G8_USCALED,
    R8G8Sscaled              = VK_FORMAT_R8G8_SSCALED,
    R8G8Uint                 = VK_FORMAT_R8G8_UINT,
    R8G8Sint                 = VK_FORMAT_R8G8_SINT,
    R8G8Srgb                 = VK_FORMAT_R8G8_SRGB,
    R8G8B8Unorm              = VK_FORMAT_R8G8B8_UNORM,
    R8G8B8Snorm              = VK_FORMAT_R8G8B8_SNORM,
    R8G8B8Uscaled            = VK_FORMAT_R8G8B8_USCALED,
    R8G8B8Sscaled            = VK_FORMAT_R8G8B8_SSCALED,
    R8G8B8Uint               = VK_FORMAT_R8G8B8_UINT,
    R8G8B8Sint               = VK_FORMAT_R8G8B8_SINT,
    R8G8B8Srgb               = VK_FORMAT_R8G8B8_SRGB,
    B8G8R8Unorm              = VK_FORMAT_B8G8R8_UNORM,
    B8G8R8Snorm              = VK_FORMAT_B8G8R8_SNORM,
    B8G8R8Uscaled            = VK_FORMAT_B8G8R8_USCALED,
    B8G8R8Sscaled            = VK_FORMAT_B8G8R8_SSCALED,
    B8G8R8Uint               = VK_FORMAT_B8G8R8_UINT,
    B8G8R8Sint               = VK_FORMAT_B8G8R8_SINT,
    B8G8R8Srgb               = VK_FORMAT_B8G8R8_SRGB,
    R8G8B8A8Unorm            = VK_FORMAT_R8G8B8A8_UNORM,
    R8G8B8A8Snorm            = VK_FORMAT_R8G8B8A8_SNORM,
    R8G8B8A8Uscaled          = VK_FORMAT_R8G8B8A8_USCALED,
    R8G8B8A8Sscaled          = VK_FORMAT_R8G8B8A8_SSCALED,
    R8G8B8A8Uint             = VK_FORMAT_R8G8B8A8_UINT,
    R8G8B8A8Sint             = VK_FORMAT_R8G8B8A8_SINT,
    R8G8B8A8Srgb             = VK_FORMAT_R8G8B8A8_SRGB,
    B8G8R8A8Unorm            = VK_FORMAT_B8G8R8A8_UNORM,
    B8G8R8A8Snorm            = VK_FORMAT_B8G8R8A8_SNORM,
    B8G8R8A8Uscaled          = VK_FORMAT_B8G8R8A8_USCALED,
    B8G8R8A8Sscaled          = VK_FORMAT_B8G8R8A8_SSCALED,
    B8G8R8A8Uint             = VK_FORMAT_B8G8R8A8_UINT,
    B8G8R8A8Sint             = VK_FORMAT_B8G8R8A8_SINT,
    B8G8R8A8Srgb             = VK_FORMAT_B8G8R8A8_SRGB,
    A8B8G8R8UnormPack32      = VK_FORMAT_A8B8G8R8_UNORM_PACK32,
    A8B8G8R8SnormPack32      = VK_FORMAT_A8B8G8R8_SNORM_PACK32,
    A8B8G8R8UscaledPack32    = VK_FORMAT_A8B8G8R8_USCALED_PACK32,
    A8B8G8R8SscaledPack32    = VK_FORMAT_A8B8G8R8_SSCALED_PACK32,
    A8B8G8R8UintPack32       = VK_FORMAT_A8B8G8R8_UINT_PACK32,
    A8B8G8R8SintPack32       = VK_FORMAT_A8B8G8R8_SINT_PACK32,
    A8B8G8R8SrgbPack32       = VK_FORMAT_A8B8G8R8_SRGB_PACK32,
    A2R10G10B10UnormPack32   = VK_FORMAT_A2R10G10B10_UNORM_PACK32,
    A2R10G10B10SnormPack32   = VK_FORMAT_A2R10G10B10_SNORM_PACK32,
    A2R10G10B10UscaledPack32 = VK_FORMAT_A2R10G10B10_USCALED_PACK32,
    A2R10G10B10SscaledPack32 = VK_FORMAT_A2R10G10B10_SSCALED_PACK32,
    A2R10G10B10UintPack32    = VK_FORMAT_A2R10G10B10_UINT_PACK32,
    A2R10G10B10SintPack32    = VK_FORMAT_A2R10G10B10_SINT_PACK32,
    A2B10G10R10UnormPack32   = VK_FORMAT_A2B10G10R10_UNORM_PACK32,
    A2B10G10R10SnormPack32   = VK_FORMAT_A2B10G10R10_SNORM_PACK32,
    A2B10G10R10UscaledPack32 = VK_FORMAT_A2B10G10R10_USCALED_PACK32,
    A2B10G10R10SscaledPack32 = VK_FORMAT_A2B10G10R10_SSCALED_PACK32,
    A2B10G10R10UintPack32    = VK_FORMAT_A2B10G10R10_UINT_PACK32,
    A2B10G10R10SintPack32    = VK_FORMAT_A2B10G10R10_SINT_PACK32,
    R16Unorm                 = VK_FORMAT_R16_UNORM,
    R16Snorm                 = VK_FORMAT_R16_SNORM,
    R16Uscaled               = VK_FORMAT_R16_USCALED,
    R16Sscaled               = VK_FORMAT_R16_SSCALED,
    R16Uint                  = VK_FORMAT_R16_UINT,
    R16Sint                  = VK_FORMAT_R16_SINT,
    R16Sfloat                = VK_FORMAT_R16_SFLOAT,
    R16G16Unorm              = VK_FORMAT_R16G16_UNORM,
    R16G16Snorm              = VK_FORMAT_R16G16_SNORM,
    R16G16Uscaled            = VK_FORMAT_R16G16_USCALED,
    R16G16Sscaled            = VK_FORMAT_R16G16_SSCALED,
    R16G16Uint               = VK_FORMAT_R16G16_UINT,
    R16G16Sint               = VK_FORMAT_R16G16_SINT,
    R16G16Sfloat             = VK_FORMAT_R16G16_SFLOAT,
    R16G16B16Unorm           = VK_FORMAT_R16G16B16_UNORM,
    R16G16B16Snorm           = VK_FORMAT_R16G16B16_SNORM,
    R16G16B16Uscaled         = VK_FORMAT_R16G16B16_USCALED,
    R16G16B16Sscaled         = VK_FORMAT_R16G16B16_SSCALED,
    R16G16B16Uint            = VK_FORMAT_R16G16B16_UINT,
    R16G16B16Sint            = VK_FORMAT_R16G16B16_SINT,
    R16G16B16Sfloat          = VK_FORMAT_R16G16B16_SFLOAT,
    R16G16B16A16Unorm        = VK_FORMAT_R16G16B16A16_UNORM,
    R16G16B16A16Snorm        = VK_FORMAT_R16G16B16A16_SNORM,
    R16G16B16A16Uscaled      = VK_FORMAT_R16G16B16A16_USCALED,
    R16G16B16A16Sscaled      = VK_FORMAT_R16G16B16A16_SSCALED,
    R16G16B16A16Uint         = VK_FORMAT_R16G16B16A16_UINT,
    R16G16B16A16Sint         = VK_FORMAT_R16G16B16A16_SINT,
    R16G16B16A16Sfloat       = VK_FORMAT_R16G16B16A16_SFLOAT,
    R32Uint                  = VK_FORMAT_R32_UINT,
    R32Sint                  = VK_FORMAT_R32_SINT,
    R32Sfloat                = VK_FORMAT_R32_SFLOAT,
    R32G32Uint               = VK_FORMAT_R32G32_UINT,
    R32G32Sint               = VK_FORMAT_R32G32_SINT,
    R32G32Sfloat             = VK_FORMAT_R32G32_SFLOAT,
    R32G32B32Uint            = VK_FORMAT_R32G32B32_UINT,
    R32G32B32Sint            = VK_FORMAT_R32G32B32_SINT,
    R32G32B32Sfloat          = VK_FORMAT_R32G32B32_SFLOAT,
    R32G32B32A32Uint         = VK_FORMAT_R32G32B32A32_UINT,
    R32G32B32A32Sint         = VK_FORMAT_R32G32B32A32_SINT,
    R32G32B32A32Sfloat       = VK_FORMAT_R32G32B32A32_SFLOAT,
    R64Uint                  = VK_FORMAT_R64_UINT,
    R64Sint                  = VK_FORMAT_R64_SINT,
    R64Sfloat                = VK_FORMAT_R64_SFLOAT,
    R64G64Uint               = VK_FORMAT_R64G64_UINT,
    R64G64Sint               = VK_FORMAT_R64G64_SINT,
    R64G64Sfloat             = VK_FORMAT_R64G64_SFLOAT,
    R64G64B64Uint            = VK_FORMAT_R64G64B64_UINT,
    R64G64B64Sint            = VK_FORMAT_R64G64B64_SINT,
    R64G64B64Sfloat          = VK_FORMAT_R64G64B64_SFLOAT,
    R64G64B64A64Uint         = VK_FORMAT_R64G64B64A64_UINT,
    R64G64B64A64Sint         = VK_FORMAT_R64G64B64A64_SINT,
    R64G64B64A64Sfloat       = VK_FORMAT_R64G64B64A64_SFLOAT,
    B10G11R11UfloatPack32    = VK_FORMAT_B10G11R11_UFLOAT_PACK32,
    E5B9G9R9UfloatPack32     = VK_FORMAT_E5B9G9R9_UFLOAT_PACK32,
    D16Unorm                 = VK_FORMAT_D16_UNORM,
    X8_D24UnormPack32        = VK_FORMAT_X8_D24_UNORM_PACK32,
    D32Sfloat                = VK_FORMAT_D32_SFLOAT,
    S8Uint                   = VK_FORMAT_S8_UINT,
    D16Unorm_S8Uint          = VK_FORMAT_D16_UNORM_S8_UINT,
    D24Unorm_S8Uint          = VK_FORMAT_D24_UNORM_S8_UINT,
    D32Sfloat_S8Uint         = VK_FORMAT_D32_SFLOAT_S8_UINT,
    BC1_RGBUnormBlock        = VK_FORMAT_BC1_RGB_UNORM_BLOCK,
    BC1_RGBSrgbBlock         = VK_FORMAT_BC1_RGB_SRGB_BLOCK,
    BC1_RGBAUnormBlock       = VK_FORMAT_BC1_RGBA_UNORM_BLOCK,
    BC1_RGBASrgbBlock        = VK_FORMAT_BC1_RGBA_SRGB_BLOCK,
    BC2UnormBlock            = VK_FORMAT_BC2_UNORM_BLOCK,
    BC2SrgbBlock             = VK_FORMAT_BC2_SRGB_BLOCK,
    BC3UnormBlock            = VK_FORMAT_BC3_UNORM_BLOCK,
    BC3SrgbBlock             = VK_FORMAT_BC3_SRGB_BLOCK,
    BC4UnormBlock            = VK_FORMAT_BC4_UNORM_BLOCK,
    BC4SnormBlock            = VK_FORMAT_BC4_SNORM_BLOCK,
    BC5UnormBlock            = VK_FORMAT_BC5_UNORM_BLOCK,
    BC5SnormBlock            = VK_FORMAT_BC5_SNORM_BLOCK,
    BC6HUfloatBlock          = VK_FORMAT_BC6H_UFLOAT_BLOCK,
    BC6HSfloatBlock          = VK_FORMAT_BC6H_SFLOAT_BLOCK,
    BC7UnormBlock            = VK_FORMAT_BC7_UNORM_BLOCK,
    BC7SrgbBlock             = VK_FORMAT_BC7_SRGB_BLOCK,
    ETC2_R8G8B8UnormBlock    = VK_FORMAT_ETC2_R8G8B8_UNORM_BLOCK,
    ETC2_R8G8B8SrgbBlock     = VK_FORMAT_ETC2_R8G8B8_SRGB_BLOCK,
    ETC2_R8G8B8A1UnormBlock  = VK_FORMAT_ETC2_R8G8B8A1_UNORM_BLOCK,
    ETC2_R8G8B8A1SrgbBlock   = VK_FORMAT_ETC2_R8G8B8A1_SRGB_BLOCK,
    ETC2_R8G8B8A8UnormBlock  = VK_FORMAT_ETC2_R8G8B8A8_UNORM_BLOCK,
    ETC2_R8G8B8A8SrgbBlock   = VK_FORMAT_ETC2_R8G8B8A8_SRGB_BLOCK,
    EAC_R11UnormBlock        = VK_FORMAT_EAC_R11_UNORM_BLOCK,
    EAC_R11SnormBlock        = VK_FORMAT_EAC_R11_SNORM_BLOCK,
    EAC_R11G11UnormBlock     = VK_FORMAT_EAC_R11G11_UNORM_BLOCK,
    EAC_R11G11SnormBlock     = VK_FORMAT_EAC_R11G11_SNORM_BLOCK,
    ASTC_4x4UnormBlock       = VK_FORMAT_ASTC_4x4_UNORM_BLOCK,
    ASTC_4x4SrgbBlock        = VK_FORMAT_ASTC_4x4_SRGB_BLOCK,
    ASTC_5x4UnormBlock       = VK_FORMAT_ASTC_5x4_UNORM_BLOCK,
    ASTC_5x4SrgbBlock        = VK_FORMAT_ASTC_5x4_SRGB_BLOCK,
    ASTC_5x5UnormBlock       = VK_FORMAT_ASTC_5x5_UNORM_BLOCK,
    ASTC_5x5SrgbBlock        = VK_FORMAT_ASTC_5x5_SRGB_BLOCK,
    ASTC_6x5UnormBlock       = VK_FORMAT_ASTC_6x5_UNORM_BLOCK,
    ASTC_6x5SrgbBlock        = VK_FORMAT_ASTC_6x5_SRGB_BLOCK,
    ASTC_6x6UnormBlock       = VK_FORMAT_ASTC_6x6_UNORM_BLOCK,
    ASTC_6x6SrgbBlock        = VK_FORMAT_ASTC_6x6_SRGB_BLOCK,
    ASTC_8x5UnormBlock       = VK_FORMAT_ASTC_8x5_UNORM_BLOCK,
    ASTC_8x5SrgbBlock        = VK_FORMAT_ASTC_8x5_SRGB_BLOCK,
    ASTC_8x6UnormBlock       = VK_FORMAT_ASTC_8x6_UNORM_BLOCK,
    ASTC_8x6SrgbBlock        = VK_FORMAT_ASTC_8x6_SRGB_BLOCK,
    ASTC_8x8UnormBlock       = VK_FORMAT_ASTC_8x8_UNORM_BLOCK,
    ASTC_8x8SrgbBlock        = VK_FORMAT_ASTC_8x8_SRGB_BLOCK,
    ASTC_10x5UnormBlock      = VK_FORMAT_ASTC_10x5_UNORM_BLOCK,
    ASTC_10x5SrgbBlock       = VK_FORMAT_ASTC_10x5_SRGB_BLOCK,
    ASTC_10x6UnormBlock      = VK_FORMAT_ASTC_10x6_UNORM_BLOCK,
    ASTC_10x6SrgbBlock       = VK_FORMAT_ASTC_10x6_SRGB_BLOCK,
    ASTC_10x8UnormBlock      = VK_FORMAT_ASTC_10x8_UNORM_BLOCK,
    ASTC_10x8SrgbBlock       = VK_FORMAT_ASTC_10x8_SRGB_BLOCK,
    ASTC_10x10UnormBlock     = VK_FORMAT_ASTC_10x10_UNORM_BLOCK,
    ASTC_10x10SrgbBlock      = VK_FORMAT_ASTC_10x10_SRGB_BLOCK,
    ASTC_12x10UnormBlock     = VK_FORMAT_ASTC_12x10_UNORM_BLOCK,
    ASTC_12x10SrgbBlock      = VK_FORMAT_ASTC_12x10_SRGB_BLOCK,
    ASTC_12x12UnormBlock     = VK_FORMAT_ASTC_12x12_UNORM_BLOCK,
    ASTC_12x12SrgbBlock      = VK_FORMAT_ASTC_12x12_SRGB_BLOCK,
};

// Numeric interpretation of a format's data. Depth, stencil and block-compressed
// formats get their own classes because they cannot be used as plain color data.
enum class FormatClass : std::uint8_t {
    Float,
    Uint,
    Sint,
    Depth,
    Stencil,
    DepthStencil,
    Compressed,
};

struct FormatInfo {
    Format           format;
    FormatClass      formatClass;
    std::string_view name;
};

inline constexpr std::size_t kFormatCount = 185;

// Sorted by code. Every lookup below is a search in this table.
inline constexpr std::array<FormatInfo, kFormatCount> kFormatTable = {{
    {Format::Undefined, FormatClass::Float, "Undefined"},
    {Format::R4G4UnormPack8, FormatClass::Float, "R4G4UnormPack8"},
    {Format::R4G4B4A4UnormPack16, FormatClass::Float, "R4G4B4A4UnormPack16"},
    {Format::B4G4R4A4UnormPack16, FormatClass::Float, "B4G4R4A4UnormPack16"},
    {Format::R5G6B5UnormPack16, FormatClass::Float, "R5G6B5UnormPack16"},
    {Format::B5G6R5UnormPack16, FormatClass::Float, "B5G6R5UnormPack16"},
    {Format::R5G5B5A1UnormPack16, FormatClass::Float, "R5G5B5A1UnormPack16"},
    {Format::B5G5R5A1UnormPack16, FormatClass::Float, "B5G5R5A1UnormPack16"},
    {Format::A1R5G5B5UnormPack16, FormatClass::Float, "A1R5G5B5UnormPack16"},
    {Format::R8Unorm, FormatClass::Float, "R8Unorm"},
    {Format::R8Snorm, FormatClass::Float, "R8Snorm"},
    {Format::R8Uscaled, FormatClass::Float, "R8Uscaled"},
    {Format::R8Sscaled, FormatClass::Float, "R8Sscaled"},
    {Format::R8Uint, FormatClass::Uint, "R8Uint"},
    {Format::R8Sint, FormatClass::Sint, "R8Sint"},
    {Format::R8Srgb, FormatClass::Float, "R8Srgb"},
    {Format::R8G8Unorm, FormatClass::Float, "R8G8Unorm"},
    {Format::R8G8Snorm, FormatClass::Float, "R8G8Snorm"},
    {Format::R8G8Uscaled, FormatClass::Float, "R8G8Uscaled"},
    {Format::R8G8Sscaled, FormatClass::Float, "R8G8Sscaled"},
    {Format::R8G8Uint, FormatClass::Uint, "R8G8Uint"},
    {Format::R8G8Sint, FormatClass::Sint, "R8G8Sint"},
    {Format::R8G8Srgb, FormatClass::Float, "R8G8Srgb"},
    {Format::R8G8B8Unorm, FormatClass::Float, "R8G8B8Unorm"},
    {Format::R8G8B8Snorm, FormatClass::Float, "R8G8B8Snorm"},
    {Format::R8G8B8Uscaled, FormatClass::Float, "R8G8B8Uscaled"},
    {Format::R8G8B8Sscaled, FormatClass::Float, "R8G8B8Sscaled"},
    {Format::R8G8B8Uint, FormatClass::Uint, "R8G8B8Uint"},
    {Format::R8G8B8Sint, FormatClass::Sint, "R8G8B8Sint"},
    {Format::R8G8B8Srgb, FormatClass::Float, "R8G8B8Srgb"},
    {Format::B8G8R8Unorm, FormatClass::Float, "B8G8R8Unorm"},
    {Format::B8G8R8Snorm, FormatClass::Float, "B8G8R8Snorm"},
    {Format::B8G8R8Uscaled, FormatClass::Float, "B8G8R8Uscaled"},
    {Format::B8G8R8Sscaled, FormatClass::Float, "B8G8R8Sscaled"},
    {Format::B8G8R8Uint, FormatClass::Uint, "B8G8R8Uint"},
    {Format::B8G8R8Sint, FormatClass::Sint, "B8G8R8Sint"},
    {Format::B8G8R8Srgb, FormatClass::Float, "B8G8R8Srgb"},
    {Format::R8G8B8A8Unorm, FormatClass::Float, "R8G8B8A8Unorm"},
    {Format::R8G8B8A8Snorm, FormatClass::Float, "R8G8B8A8Snorm"},
    {Format::R8G8B8A8Uscaled, FormatClass::Float, "R8G8B8A8Uscaled"},
    {Format::R8G8B8A8Sscaled, FormatClass::Float, "R8G8B8A8Sscaled"},
    {Format::R8G8B8A8Uint, FormatClass::Uint, "R8G8B8A8Uint"},
    {Format::R8G8B8A8Sint, FormatClass::Sint, "R8G8B8A8Sint"},
    {Format::R8G8B8A8Srgb, FormatClass::Float, "R8G8B8A8Srgb"},
    {Format::B8G8R8A8Unorm, FormatClass::Float, "B8G8R8A8Unorm"},
    {Format::B8G8R8A8Snorm, FormatClass::Float, "B8G8R8A8Snorm"},
    {Format::B8G8R8A8Uscaled, FormatClass::Float, "B8G8R8A8Uscaled"},
    {Format::B8G8R8A8Sscaled, FormatClass::Float, "B8G8R8A8Sscaled"},
    {Format::B8G8R8A8Uint, FormatClass::Uint, "B8G8R8A8Uint"},
    {Format::B8G8R8A8Sint, FormatClass::Sint, "B8G8R8A8Sint"},
    {Format::B8G8R8A8Srgb, FormatClass::Float, "B8G8R8A8Srgb"},
    {Format::A8B8G8R8UnormPack32, FormatClass::Float, "A8B8G8R8UnormPack32"},
    {Format::A8B8G8R8SnormPack32, FormatClass::Float, "A8B8G8R8SnormPack32"},
    {Format::A8B8G8R8UscaledPack32, FormatClass::Float, "A8B8G8R8UscaledPack32"},
    {Format::A8B8G8R8SscaledPack32, FormatClass::Float, "A8B8G8R8SscaledPack32"},
    {Format::A8B8G8R8UintPack32, FormatClass::Uint, "A8B8G8R8UintPack32"},
    {Format::A8B8G8R8SintPack32, FormatClass::Sint, "A8B8G8R8SintPack32"},
    {Format::A8B8G8R8SrgbPack32, FormatClass::Float, "A8B8G8R8SrgbPack32"},
    {Format::A2R10G10B10UnormPack32, FormatClass::Float, "A2R10G10B10UnormPack32"},
    {Format::A2R10G10B10SnormPack32, FormatClass::Float, "A2R10G10B10SnormPack32"},
    {Format::A2R10G10B10UscaledPack32, FormatClass::Float, "A2R10G10B10UscaledPack32"},
    {Format::A2R10G10B10SscaledPack32, FormatClass::Float, "A2R10G10B10SscaledPack32"},
    {Format::A2R10G10B10UintPack32, FormatClass::Uint, "A2R10G10B10UintPack32"},
    {Format::A2R10G10B10SintPack32, FormatClass::Sint, "A2R10G10B10SintPack32"},
    {Format::A2B10G10R10UnormPack32, FormatClass::Float, "A2B10G10R10UnormPack32"},
    {Format::A2B10G10R10SnormPack32, FormatClass::Float, "A2B10G10R10SnormPack32"},
    {Format::A2B10G10R10UscaledPack32, FormatClass::Float, "A2B10G10R10UscaledPack32"},
    {Format::A2B10G10R10SscaledPack32, FormatClass::Float, "A2B10G10R10SscaledPack32"},
    {Format::A2B10G10R10UintPack32, FormatClass::Uint, "A2B10G10R10UintPack32"},
    {Format::A2B10G10R10SintPack32, FormatClass::Sint, "A2B10G10R10SintPack32"},
    {Format::R16Unorm, FormatClass::Float, "R16Unorm"},
    {Format::R16Snorm, FormatClass::Float, "R16Snorm"},
    {Format::R16Uscaled, FormatClass::Float, "R16Uscaled"},
    {Format::R16Sscaled, FormatClass::Float, "R16Sscaled"},
    {Format::R16Uint, FormatClass::Uint, "R16Uint"},
    {Format::R16Sint, FormatClass::Sint, "R16Sint"},
    {Format::R16Sfloat, FormatClass::Float, "R16Sfloat"},
    {Format::R16G16Unorm, FormatClass::Float, "R16G16Unorm"},
    {Format::R16G16Snorm, FormatClass::Float, "R16G16Snorm"},
    {Format::R16G16Uscaled, FormatClass::Float, "R16G16Uscaled"},
    {Format::R16G16Sscaled, FormatClass::Float, "R16G16Sscaled"},
    {Format::R16G16Uint, FormatClass::Uint, "R16G16Uint"},
    {Format::R16G16Sint, FormatClass::Sint, "R16G16Sint"},
    {Format::R16G16Sfloat, FormatClass::Float, "R16G16Sfloat"},
    {Format::R16G16B16Unorm, FormatClass::Float, "R16G16B16Unorm"},
    {Format::R16G16B16Snorm, FormatClass::Float, "R16G16B16Snorm"},
    {Format::R16G16B16Uscaled, FormatClass::Float, "R16G16B16Uscaled"},
    {Format::R16G16B16Sscaled, FormatClass::Float, "R16G16B16Sscaled"},
    {Format::R16G16B16Uint, FormatClass::Uint, "R16G16B16Uint"},
    {Format::R16G16B16Sint, FormatClass::Sint, "R16G16B16Sint"},
    {Format::R16G16B16Sfloat, FormatClass::Float, "R16G16B16Sfloat"},
    {Format::R16G16B16A16Unorm, FormatClass::Float, "R16G16B16A16Unorm"},
    {Format::R16G16B16A16Snorm, FormatClass::Float, "R16G16B16A16Snorm"},
    {Format::R16G16B16A16Uscaled, FormatClass::Float, "R16G16B16A16Uscaled"},
    {Format::R16G16B16A16Sscaled, FormatClass::Float, "R16G16B16A16Sscaled"},
    {Format::R16G16B16A16Uint, FormatClass::Uint, "R16G16B16A16Uint"},
    {Format::R16G16B16A16Sint, FormatClass::Sint, "R16G16B16A16Sint"},
    {Format::R16G16B16A16Sfloat, FormatClass::Float, "R16G16B16A16Sfloat"},
    {Format::R32Uint, FormatClass::Uint, "R32Uint"},
    {Format::R32Sint, FormatClass::Sint, "R32Sint"},
    {Format::R32Sfloat, FormatClass::Float, "R32Sfloat"},
    {Format::R32G32Uint, FormatClass::Uint, "R32G32Uint"},
    {Format::R32G32Sint, FormatClass::Sint, "R32G32Sint"},
    {Format::R32G32Sfloat, FormatClass::Float, "R32G32Sfloat"},
    {Format::R32G32B32Uint, FormatClass::Uint, "R32G32B32Uint"},
    {Format::R32G32B32Sint, FormatClass::Sint, "R32G32B32Sint"},
    {Format::R32G32B32Sfloat, FormatClass::Float, "R32G32B32Sfloat"},
    {Format::R32G32B32A32Uint, FormatClass::Uint, "R32G32B32A32Uint"},
    {Format::R32G32B32A32Sint, FormatClass::Sint, "R32G32B32A32Sint"},
    {Format::R32G32B32A32Sfloat, FormatClass::Float, "R32G32B32A32Sfloat"},
    {Format::R64Uint, FormatClass::Uint, "R64Uint"},
    {Format::R64Sint, FormatClass::Sint, "R64Sint"},
    {Format::R64Sfloat, FormatClass::Float, "R64Sfloat"},
    {Format::R64G64Uint, FormatClass::Uint, "R64G64Uint"},
    {Format::R64G64Sint, FormatClass::Sint, "R64G64Sint"},
    {Format::R64G64Sfloat, FormatClass::Float, "R64G64Sfloat"},
    {Format::R64G64B64Uint, FormatClass::Uint, "R64G64B64Uint"},
    {Format::R64G64B64Sint, FormatClass::Sint, "R64G64B64Sint"},
    {Format::R64G64B64Sfloat, FormatClass::Float, "R64G64B64Sfloat"},
    {Format::R64G64B64A64Uint, FormatClass::Uint, "R64G64B64A64Uint"},
    {Format::R64G64B64A64Sint, FormatClass::Sint, "R64G64B64A64Sint"},
    {Format::R64G64B64A64Sfloat, FormatClass::Float, "R64G64B64A64Sfloat"},
    {Format::B10G11R11UfloatPack32, FormatClass::Float, "B10G11R11UfloatPack32"},
    {Format::E5B9G9R9UfloatPack32, FormatClass::Float, "E5B9G9R9UfloatPack32"},
    {Format::D16Unorm, FormatClass::Depth, "D16Unorm"},
    {Format::X8_D24UnormPack32, FormatClass::Depth, "X8_D24UnormPack32"},
    {Format::D32Sfloat, FormatClass::Depth, "D32Sfloat"},
    {Format::S8Uint, FormatClass::Stencil, "S8Uint"},
    {Format::D16Unorm_S8Uint, FormatClass::DepthStencil, "D16Unorm_S8Uint"},
    {Format::D24Unorm_S8Uint, FormatClass::DepthStencil, "D24Unorm_S8Uint"},
    {Format::D32Sfloat_S8Uint, FormatClass::DepthStencil, "D32Sfloat_S8Uint"},
    {Format::BC1_RGBUnormBlock, FormatClass::Compressed, "BC1_RGBUnormBlock"},
    {Format::BC1_RGBSrgbBlock, FormatClass::Compressed, "BC1_RGBSrgbBlock"},
    {Format::BC1_RGBAUnormBlock, FormatClass::Compressed, "BC1_RGBAUnormBlock"},
    {Format::BC1_RGBASrgbBlock, FormatClass::Compressed, "BC1_RGBASrgbBlock"},
    {Format::BC2UnormBlock, FormatClass::Compressed, "BC2UnormBlock"},
    {Format::BC2SrgbBlock, FormatClass::Compressed, "BC2SrgbBlock"},
    {Format::BC3UnormBlock, FormatClass::Compressed, "BC3UnormBlock"},
    {Format::BC3SrgbBlock, FormatClass::Compressed, "BC3SrgbBlock"},
    {Format::BC4UnormBlock, FormatClass::Compressed, "BC4UnormBlock"},
    {Format::BC4SnormBlock, FormatClass::Compressed, "BC4SnormBlock"},
    {Format::BC5UnormBlock, FormatClass::Compressed, "BC5UnormBlock"},
    {Format::BC5SnormBlock, FormatClass::Compressed, "BC5SnormBlock"},
    {Format::BC6HUfloatBlock, FormatClass::Compressed, "BC6HUfloatBlock"},
    {Format::BC6HSfloatBlock, FormatClass::Compressed, "BC6HSfloatBlock"},
    {Format::BC7UnormBlock, FormatClass::Compressed, "BC7UnormBlock"},
    {Format::BC7SrgbBlock, FormatClass::Compressed, "BC7SrgbBlock"},
    {Format::ETC2_R8G8B8UnormBlock, FormatClass::Compressed, "ETC2_R8G8B8UnormBlock"},
    {Format::ETC2_R8G8B8SrgbBlock, FormatClass::Compressed, "ETC2_R8G8B8SrgbBlock"},
    {Format::ETC2_R8G8B8A1UnormBlock, FormatClass::Compressed, "ETC2_R8G8B8A1UnormBlock"},
    {Format::ETC2_R8G8B8A1SrgbBlock, FormatClass::Compressed, "ETC2_R8G8B8A1SrgbBlock"},
    {Format::ETC2_R8G8B8A8UnormBlock, FormatClass::Compressed, "ETC2_R8G8B8A8UnormBlock"},
    {Format::ETC2_R8G8B8A8SrgbBlock, FormatClass::Compressed, "ETC2_R8G8B8A8SrgbBlock"},
    {Format::EAC_R11UnormBlock, FormatClass::Compressed, "EAC_R11UnormBlock"},
    {Format::EAC_R11SnormBlock, FormatClass::Compressed, "EAC_R11SnormBlock"},
    {Format::EAC_R11G11UnormBlock, FormatClass::Compressed, "EAC_R11G11UnormBlock"},
    {Format::EAC_R11G11SnormBlock, FormatClass::Compressed, "EAC_R11G11SnormBlock"},
    {Format::ASTC_4x4UnormBlock, FormatClass::Compressed, "ASTC_4x4UnormBlock"},
    {Format::ASTC_4x4SrgbBlock, FormatClass::Compressed, "ASTC_4x4SrgbBlock"},
    {Format::ASTC_5x4UnormBlock, FormatClass::Compressed, "ASTC_5x4UnormBlock"},
    {Format::ASTC_5x4SrgbBlock, FormatClass::Compressed, "ASTC_5x4SrgbBlock"},
    {Format::ASTC_5x5UnormBlock, FormatClass::Compressed, "ASTC_5x5UnormBlock"},
    {Format::ASTC_5x5SrgbBlock, FormatClass::Compressed, "ASTC_5x5SrgbBlock"},
    {Format::ASTC_6x5UnormBlock, FormatClass::Compressed, "ASTC_6x5UnormBlock"},
    {Format::ASTC_6x5SrgbBlock, FormatClass::Compressed, "ASTC_6x5SrgbBlock"},
    {Format::ASTC_6x6UnormBlock, FormatClass::Compressed, "ASTC_6x6UnormBlock"},
    {Format::ASTC_6x6SrgbBlock, FormatClass::Compressed, "ASTC_6x6SrgbBlock"},
    {Format::ASTC_8x5UnormBlock, FormatClass::Compressed, "ASTC_8x5UnormBlock"},
    {Format::ASTC_8x5SrgbBlock, FormatClass::Compressed, "ASTC_8x5SrgbBlock"},
    {Format::ASTC_8x6UnormBlock, FormatClass::Compressed, "ASTC_8x6UnormBlock"},
    {Format::ASTC_8x6SrgbBlock, FormatClass::Compressed, "ASTC_8x6SrgbBlock"},
    {Format::ASTC_8x8UnormBlock, FormatClass::Compressed, "ASTC_8x8UnormBlock"},
    {Format::ASTC_8x8SrgbBlock, FormatClass::Compressed, "ASTC_8x8SrgbBlock"},
    {Format::ASTC_10x5UnormBlock, FormatClass::Compressed, "ASTC_10x5UnormBlock"},
    {Format::ASTC_10x5SrgbBlock, FormatClass::Compressed, "ASTC_10x5SrgbBlock"},
    {Format::ASTC_10x6UnormBlock, FormatClass::Compressed, "ASTC_10x6UnormBlock"},
    {Format::ASTC_10x6SrgbBlock, FormatClass::Compressed, "ASTC_10x6SrgbBlock"},
    {Format::ASTC_10x8UnormBlock, FormatClass::Compressed, "ASTC_10x8UnormBlock"},
    {Format::ASTC_10x8SrgbBlock, FormatClass::Compressed, "ASTC_10x8SrgbBlock"},
    {Format::ASTC_10x10UnormBlock, FormatClass::Compressed, "ASTC_10x10UnormBlock"},
    {Format::ASTC_10x10SrgbBlock, FormatClass::Compressed, "ASTC_10x10SrgbBlock"},
    {Format::ASTC_12x10UnormBlock, FormatClass::Compressed, "ASTC_12x10UnormBlock"},
    {Format::ASTC_12x10SrgbBlock, FormatClass::Compressed, "ASTC_12x10SrgbBlock"},
    {Format::ASTC_12x12UnormBlock, FormatClass::Compressed, "ASTC_12x12UnormBlock"},
    {Format::ASTC_12x12SrgbBlock, FormatClass::Compressed, "ASTC_12x12SrgbBlock"},
}};

namespace detail {

[[nodiscard]] constexpr const FormatInfo* findFormat(std::uint32_t code) {
    auto it = std::lower_bound(kFormatTable.begin(), kFormatTable.end(), code,
        [](const FormatInfo& info, std::uint32_t c) {
            return static_cast<std::uint32_t>(info.format) < c;
        });
    if (it == kFormatTable.end() || static_cast<std::uint32_t>(it->format) != code) {
        return nullptr;
    }
    return &*it;
}

} // namespace detail

[[nodiscard]] constexpr std::uint32_t toCode(Format f) {
    return static_cast<std::uint32_t>(f);
}

[[nodiscard]] constexpr VkFormat toVkFormat(Format f) {
    return static_cast<VkFormat>(f);
}

// Partial inverse of toCode(). Codes outside the table (extension formats,
// garbage) yield nullopt; callers treat them as unsupported.
[[nodiscard]] constexpr std::optional<Format> formatFromCode(std::uint32_t code) {
    const FormatInfo* info = detail::findFormat(code);
    if (info == nullptr) return std::nullopt;
    return info->format;
}

[[nodiscard]] constexpr std::optional<Format> formatFromVk(VkFormat vk) {
    return formatFromCode(static_cast<std::uint32_t>(vk));
}

// Total over the Format enumerators: every one has a table row. A Format cast
// from an unregistered code is a precondition violation; validate raw codes
// with formatFromCode() first.
[[nodiscard]] constexpr FormatClass formatClass(Format f) {
    const FormatInfo* info = detail::findFormat(toCode(f));
    assert(info != nullptr && "formatClass() on an unregistered Format value");
    return info->formatClass;
}

[[nodiscard]] constexpr std::string_view formatName(Format f) {
    const FormatInfo* info = detail::findFormat(toCode(f));
    assert(info != nullptr && "formatName() on an unregistered Format value");
    return info->name;
}

[[nodiscard]] constexpr bool hasDepth(Format f) {
    FormatClass c = formatClass(f);
    return c == FormatClass::Depth || c == FormatClass::DepthStencil;
}

[[nodiscard]] constexpr bool hasStencil(Format f) {
    FormatClass c = formatClass(f);
    return c == FormatClass::Stencil || c == FormatClass::DepthStencil;
}

[[nodiscard]] constexpr bool isCompressed(Format f) {
    return formatClass(f) == FormatClass::Compressed;
}

[[nodiscard]] constexpr const std::array<FormatInfo, kFormatCount>& allFormats() {
    return kFormatTable;
}

[[nodiscard]] std::string_view formatClassName(FormatClass c);

} // namespace vkbind
