#pragma once

#include <vkbind/error.hpp>
#include <vkbind/result.hpp>

#include <vkbind/format.hpp>
#include <vkbind/format_marker.hpp>
#include <vkbind/shader_stages.hpp>
#include <vkbind/descriptor_desc.hpp>
#include <vkbind/descriptor_set_desc.hpp>
#include <vkbind/pipeline_layout_desc.hpp>
#include <vkbind/depth_stencil.hpp>

#include <vkbind/instance.hpp>
#include <vkbind/device.hpp>
#include <vkbind/allocator.hpp>
#include <vkbind/buffer.hpp>
#include <vkbind/image.hpp>
#include <vkbind/descriptor_set_layout.hpp>
#include <vkbind/descriptor_pool.hpp>
#include <vkbind/descriptor_writer.hpp>
#include <vkbind/descriptor_set.hpp>
#include <vkbind/pipeline_layout.hpp>
