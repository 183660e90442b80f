#include <vkbind/vkbind.hpp>
#include <vulkan/vulkan.h>

#define GLM_FORCE_DEPTH_ZERO_TO_ONE
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

// Headless setup of the resources a teapot renderer binds: a view/projection
// uniform buffer in a one-binding descriptor set, a D16 depth attachment whose
// format is part of its type, and the depth test that goes with it.

static constexpr std::uint32_t WIDTH  = 1244;
static constexpr std::uint32_t HEIGHT = 699;

// std140: two mat4, 128 bytes.
struct TeapotUBO {
    glm::mat4 worldview;
    glm::mat4 proj;
};

int main() {
    auto instance = vkbind::InstanceBuilder{}
        .appName("teapot")
        .requireVulkan(1, 1)
        .validation(vkbind::Validation::On)
        .build()
        .orThrow();

    auto device = vkbind::DeviceBuilder(instance)
        .preferDiscreteGpu()
        .build()
        .orThrow();

    std::printf("GPU: %s\n", device.gpuName());

    auto allocator = vkbind::Allocator::create(instance, device).orThrow();

    auto depth = vkbind::ImageBuilder(allocator)
        .size(WIDTH, HEIGHT)
        .depthAttachment<vkbind::formats::D16Unorm>()
        .buildTyped<vkbind::formats::D16Unorm>()
        .orThrow();

    // The teapot model uses OpenGL's lower-left origin, so Y is flipped.
    TeapotUBO ubo{};
    glm::mat4 view = glm::lookAt(glm::vec3(0.3f, 0.3f, 1.0f), glm::vec3(0.0f),
                                 glm::vec3(0.0f, -1.0f, 0.0f));
    glm::mat4 scale = glm::scale(glm::mat4(1.0f), glm::vec3(0.01f));
    ubo.worldview = view * scale;
    ubo.proj = glm::perspective(glm::radians(90.0f),
                                static_cast<float>(WIDTH) / static_cast<float>(HEIGHT),
                                0.01f, 100.0f);

    auto uniformBuffer = std::make_shared<vkbind::Buffer>(
        vkbind::BufferBuilder(allocator).size(sizeof(TeapotUBO)).uniformBuffer().build().orThrow());
    uniformBuffer->write(ubo).orThrow();

    auto setDesc = vkbind::DescriptorSetDesc::create({
        {0, vkbind::DescriptorType::UniformBuffer, 1, vkbind::ShaderStages::allGraphics()},
    }).orThrow();

    auto setLayout      = vkbind::DescriptorSetLayout::create(device, setDesc).orThrow();
    auto pipelineLayout = vkbind::PipelineLayout::create(device, {setLayout}).orThrow();
    auto pool           = vkbind::DescriptorPool::create(device).orThrow();

    vkbind::DescriptorBindings bindings;
    bindings.push_back({0, vkbind::DescriptorBind::uniformBuffer(uniformBuffer)});
    auto set = vkbind::DescriptorSet::create(pool, setLayout, std::move(bindings)).orThrow();

    auto depthState = vkbind::DepthStencil::simpleDepthTest();
    depthState.validateFor(decltype(depth)::format).orThrow();
    VkPipelineDepthStencilStateCreateInfo depthCI = depthState.toVk();

    auto handles = pipelineLayout->decodeDescriptorSets({set}).orThrow();

    std::printf("depth attachment: %ux%u %s\n", depth.extent().width, depth.extent().height,
                std::string(vkbind::formatName(decltype(depth)::format)).c_str());
    std::printf("depth test: %s, compare op %d\n",
                depthCI.depthTestEnable ? "on" : "off", static_cast<int>(depthCI.depthCompareOp));
    std::printf("pipeline layout: %u set(s), set 0 has %u descriptor(s)\n",
                pipelineLayout->setCount(), setLayout->desc().descriptorCount());
    std::printf("descriptor set: %zu handle(s) ready to bind\n", handles.size());
    std::printf("descriptor pool: %u/%u sets, %u/%u uniform buffers\n",
                pool->allocatedSetCount(), pool->maxSets(),
                pool->allocatedDescriptorCount(vkbind::DescriptorType::UniformBuffer),
                pool->quota(vkbind::DescriptorType::UniformBuffer));

    device.waitIdle();
    return 0;
}
