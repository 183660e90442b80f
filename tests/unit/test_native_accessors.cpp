#include <vkbind/allocator.hpp>
#include <vkbind/buffer.hpp>
#include <vkbind/descriptor_pool.hpp>
#include <vkbind/descriptor_set.hpp>
#include <vkbind/descriptor_set_layout.hpp>
#include <vkbind/device.hpp>
#include <vkbind/image.hpp>
#include <vkbind/instance.hpp>
#include <vkbind/pipeline_layout.hpp>

#include <memory>
#include <type_traits>

namespace {

template <typename T, typename Handle, typename = void> struct NativeIs : std::false_type {};

template <typename T, typename Handle>
struct NativeIs<T, Handle, std::void_t<decltype(std::declval<const T&>().native())>>
    : std::bool_constant<std::is_same_v<
          std::remove_cv_t<std::remove_reference_t<decltype(std::declval<const T&>().native())>>,
          Handle>> {};

} // namespace

static_assert(NativeIs<vkbind::Allocator, VmaAllocator>::value);
static_assert(NativeIs<vkbind::Instance, VkInstance>::value);
static_assert(NativeIs<vkbind::Device, VkDevice>::value);
static_assert(NativeIs<vkbind::Buffer, VkBuffer>::value);
static_assert(NativeIs<vkbind::Image, VkImage>::value);
static_assert(NativeIs<vkbind::TypedImage<vkbind::formats::D16Unorm>, VkImage>::value);
static_assert(NativeIs<vkbind::DescriptorSetLayout, VkDescriptorSetLayout>::value);
static_assert(NativeIs<vkbind::DescriptorPool, VkDescriptorPool>::value);
static_assert(NativeIs<vkbind::DescriptorSet, VkDescriptorSet>::value);
static_assert(NativeIs<vkbind::PipelineLayout, VkPipelineLayout>::value);

// Owners of a single device object are move-only.
static_assert(!std::is_copy_constructible_v<vkbind::Instance>);
static_assert(std::is_nothrow_move_constructible_v<vkbind::Device>);
static_assert(std::is_nothrow_move_constructible_v<vkbind::Buffer>);
static_assert(!std::is_copy_constructible_v<vkbind::Image>);

// Shared objects are neither copyable nor movable; they live behind shared_ptr.
static_assert(!std::is_copy_constructible_v<vkbind::DescriptorPool>);
static_assert(!std::is_move_constructible_v<vkbind::DescriptorSet>);
static_assert(!std::is_copy_assignable_v<vkbind::PipelineLayout>);

// Typed images carry their format statically.
static_assert(vkbind::TypedImage<vkbind::formats::D16Unorm>::format == vkbind::Format::D16Unorm);

int main() { return 0; }
