#include <vkbind/format.hpp>

#include <string_view>

namespace vkbind {

static_assert(formatFromCode(toCode(Format::Undefined)) == Format::Undefined);
static_assert(formatFromCode(toCode(Format::ASTC_12x12SrgbBlock)) == Format::ASTC_12x12SrgbBlock);
static_assert(formatClass(Format::D16Unorm) == FormatClass::Depth);
static_assert(!formatFromCode(static_cast<std::uint32_t>(kFormatCount)).has_value());

std::string_view formatClassName(FormatClass c) {
    switch (c) {
    case FormatClass::Float:        return "float";
    case FormatClass::Uint:         return "uint";
    case FormatClass::Sint:         return "sint";
    case FormatClass::Depth:        return "depth";
    case FormatClass::Stencil:      return "stencil";
    case FormatClass::DepthStencil: return "depth-stencil";
    case FormatClass::Compressed:   return "compressed";
    }
    return "unknown";
}

} // namespace vkbind
