// Vulkan Device Test
// Headless VulkanRenderDevice: resource creation, bind groups, a graph frame and
// pipeline validation. Skips when the machine has no usable Vulkan 1.3 device.

#include "TestHarness.hpp"
#include "renderer/graph/NodeContext.hpp"
#include "renderer/graph/RenderGraph.hpp"
#include "renderer/graph/RenderGraphBuilder.hpp"
#include "renderer/vulkan/VulkanRenderDevice.hpp"
#include "ecs/World.hpp"

using namespace ember;
using namespace ember::test;

// Test 1: capabilities after init
void testCapabilities(VulkanRenderDevice& device) {
    section(1, "Capabilities");

    EMBER_CHECK(device.isInitialized());
    EMBER_CHECK(!device.getDeviceName().empty());
    EMBER_CHECK(device.limits().maxTextureDimension2D >= 4096);
    EMBER_CHECK(device.limits().maxBindGroups >= 4);
    EMBER_CHECK(device.supportsColorTarget(TextureFormat::RGBA8Unorm));
    EMBER_CHECK(!device.supportsColorTarget(TextureFormat::Undefined));
    fmt::print("  Device: {}\n", device.getDeviceName().c_str());
}

// Test 2: direct resource creation and destruction
void testResources(VulkanRenderDevice& device) {
    section(2, "Resources");

    TextureDesc textureDesc;
    textureDesc.label = "vk_color";
    textureDesc.width = 256;
    textureDesc.height = 128;
    textureDesc.format = TextureFormat::RGBA8Unorm;
    textureDesc.usage = TextureUsage::Sampled | TextureUsage::ColorAttachment;
    Texture texture = device.createTexture(textureDesc);
    EMBER_CHECK(texture.image != kNullRawHandle);
    EMBER_CHECK(texture.view != kNullRawHandle);
    EMBER_CHECK(texture.width == 256 && texture.height == 128);

    BufferDesc bufferDesc;
    bufferDesc.label = "vk_uniforms";
    bufferDesc.size = 256;
    bufferDesc.usage = BufferUsage::Uniform;
    bufferDesc.hostVisible = true;
    Buffer buffer = device.createBuffer(bufferDesc);
    EMBER_CHECK(buffer.buffer != kNullRawHandle);
    EMBER_CHECK(buffer.mapped != nullptr);

    SamplerDesc samplerDesc;
    samplerDesc.label = "vk_sampler";
    Sampler sampler = device.createSampler(samplerDesc);
    EMBER_CHECK(sampler.sampler != kNullRawHandle);

    RawHandle layout = device.createBindGroupLayout(BindGroupLayoutDesc::sequential(
        "vk_layout", ShaderStage::Fragment,
        {BindingType::SampledTexture, BindingType::Sampler, BindingType::UniformBuffer}));
    EMBER_CHECK(layout != kNullRawHandle);

    eastl::vector<BindGroupBinding> bindings;
    bindings.push_back(BindGroupBinding{0, BindingType::SampledTexture, texture.view, 0, 0});
    bindings.push_back(BindGroupBinding{1, BindingType::Sampler, sampler.sampler, 0, 0});
    bindings.push_back(BindGroupBinding{2, BindingType::UniformBuffer, buffer.buffer, 0, 64});
    BindGroup group = device.createBindGroup("vk_group", layout, bindings);
    EMBER_CHECK(group.set != kNullRawHandle);
    EMBER_CHECK(group.layout == layout);

    // An unknown layout is a device error
    EMBER_CHECK_THROWS(device.createBindGroup("vk_orphan", RawHandle{0x1234}, bindings), DeviceError);

    device.destroyBindGroup(group);
    device.destroyBindGroupLayout(layout);
    device.destroySampler(sampler);
    device.destroyBuffer(buffer);
    device.destroyTexture(texture);
}

// Test 3: one graph frame realized on the Vulkan device
void testGraphFrame(VulkanRenderDevice& device) {
    section(3, "Graph frame");

    World world;
    entt::entity view = world.createEntity();
    RenderGraph graph;
    graph.init(&device, &world);

    RawHandle layout = device.createBindGroupLayout(BindGroupLayoutDesc::sequential(
        "vk_graph_layout", ShaderStage::Fragment, {BindingType::SampledTexture, BindingType::Sampler}));

    RawHandle seenView = kNullRawHandle;
    RawHandle seenSet = kNullRawHandle;
    {
        RenderGraphBuilder b = graph.builder(view);

        TextureDesc desc;
        desc.label = "vk_graph_color";
        desc.width = 64;
        desc.height = 64;
        desc.format = TextureFormat::RGBA16Float;
        desc.usage = TextureUsage::Sampled | TextureUsage::ColorAttachment;
        auto color = b.newResource<Texture>(desc);

        SamplerDesc samplerDesc;
        samplerDesc.label = "vk_graph_sampler";
        auto sampler = b.newResource<Sampler>(samplerDesc);

        BindGroupDesc groupDesc;
        groupDesc.label = "vk_graph_group";
        groupDesc.layout = layout;
        groupDesc.entries.push_back(BindGroupEntry::texture(0, color));
        groupDesc.entries.push_back(BindGroupEntry::sampler(1, sampler));
        BindGroupId group = b.newBindGroup(groupDesc);

        b.markRetain("vk_history", color);
        b.addNode("sample", renderDeps(read(color), uses(group)),
                  [&seenView, &seenSet, color, group](NodeContext& ctx, RenderDevice&) {
                      seenView = ctx.get(color).view;
                      seenSet = ctx.getBindGroup(group).set;
                  });
    }

    graph.realizeQueued();
    graph.run();
    graph.reset();
    EMBER_CHECK(seenView != kNullRawHandle);
    EMBER_CHECK(seenSet != kNullRawHandle);

    // Retained texture comes back next frame
    {
        RenderGraphBuilder b = graph.builder(view);
        auto history = b.getRetained<Texture>("vk_history");
        EMBER_CHECK(history.has_value());
        if (history) {
            RawHandle historyView = kNullRawHandle;
            auto handle = *history;
            b.addNode("history", renderDeps(read(handle)), [&historyView, handle](NodeContext& ctx, RenderDevice&) {
                historyView = ctx.get(handle).view;
            });
            graph.realizeQueued();
            graph.run();
            EMBER_CHECK(historyView == seenView);
        } else {
            graph.realizeQueued();
            graph.run();
        }
    }
    graph.reset();

    graph.cleanup();
    device.destroyBindGroupLayout(layout);
}

// Test 4: pipeline validation failures are reported, not thrown
void testPipelineValidation(VulkanRenderDevice& device) {
    section(4, "Pipeline validation");

    RenderPipelineDesc noModule;
    noModule.label = "vk_no_module";
    PipelineCompileResult missing = device.createRenderPipeline(noModule);
    EMBER_CHECK(!missing.success);
    EMBER_CHECK(missing.error.code == PipelineErrorCode::InvalidShaderModule);

    auto module = eastl::make_shared<ShaderModule>();
    module->label = "vk_garbage";
    module->spirv = {0xdeadbeefu, 0u, 0u, 0u, 0u};

    RenderPipelineDesc garbage;
    garbage.label = "vk_garbage_pipeline";
    garbage.vertex.module = module;
    PipelineCompileResult invalid = device.createRenderPipeline(garbage);
    EMBER_CHECK(!invalid.success);
    EMBER_CHECK(invalid.error.code == PipelineErrorCode::InvalidShaderModule);
}

int main() {
    fmt::print("========================================\n");
    fmt::print("Vulkan Device Test Suite\n");
    fmt::print("========================================\n");

    VulkanRenderDevice device;
    try {
        device.init();
    } catch (const RuntimeError& e) {
        // DeviceError included, e.g. allocator creation
        fmt::print("Skipping: {}\n", e.what().c_str());
        return 0;
    } catch (const vk::SystemError& e) {
        fmt::print("Skipping: Vulkan unavailable ({})\n", e.what());
        return 0;
    }

    testCapabilities(device);
    testResources(device);
    testGraphFrame(device);
    testPipelineValidation(device);

    device.cleanup();
    return finish("VulkanDevice");
}
