#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vk_mem_alloc.h>
#include <EASTL/hash_map.h>
#include <EASTL/string.h>
#include <EASTL/vector.h>

#include "renderer/device/RenderDevice.hpp"

namespace ember {

/**
 * @brief Headless Vulkan 1.3 RenderDevice
 *
 * Owns instance, physical and logical device, one graphics queue, the VMA
 * allocator and a descriptor pool. Raw handles handed to the graph are the
 * 64-bit Vulkan object handles; VMA allocations stay inside the device.
 */
class VulkanRenderDevice : public RenderDevice {
public:
    VulkanRenderDevice() = default;
    ~VulkanRenderDevice() override;

    VulkanRenderDevice(const VulkanRenderDevice&) = delete;
    VulkanRenderDevice& operator=(const VulkanRenderDevice&) = delete;

    // Throws RuntimeError when no device with dynamic rendering and a graphics queue exists
    void init(bool enableValidation = false);
    void cleanup();
    bool isInitialized() const { return allocator != VK_NULL_HANDLE; }

    Texture createTexture(const TextureDesc& desc) override;
    Buffer createBuffer(const BufferDesc& desc) override;
    Sampler createSampler(const SamplerDesc& desc) override;
    RawHandle createBindGroupLayout(const BindGroupLayoutDesc& desc) override;
    BindGroup createBindGroup(const eastl::string& label, RawHandle layout,
                              const eastl::vector<BindGroupBinding>& bindings) override;
    PipelineCompileResult createRenderPipeline(const RenderPipelineDesc& desc) override;

    void destroyTexture(const Texture& texture) override;
    void destroyBuffer(const Buffer& buffer) override;
    void destroySampler(const Sampler& sampler) override;
    void destroyBindGroupLayout(RawHandle layout) override;
    void destroyBindGroup(const BindGroup& bindGroup) override;
    void destroyRenderPipeline(const RenderPipeline& pipeline) override;

    const DeviceLimits& limits() const override { return deviceLimits; }
    DeviceFeatures features() const override { return deviceFeatures; }
    bool supportsColorTarget(TextureFormat format) const override;

    vk::Device getDevice() const { return *device; }
    vk::Queue getGraphicsQueue() const { return *graphicsQueue; }
    VmaAllocator getAllocator() const { return allocator; }
    const eastl::string& getDeviceName() const { return deviceName; }

private:
    void createInstance(bool enableValidation);
    void pickPhysicalDevice();
    void createLogicalDevice();
    void createAllocator();
    void createDescriptorPool();
    void queryCapabilities();

    bool isDeviceSuitable(const vk::raii::PhysicalDevice& candidate) const;

    PipelineError validateStage(const ShaderStageDesc& stage, const char* stageName) const;

    vk::raii::Context context;
    vk::raii::Instance instance{nullptr};
    vk::raii::PhysicalDevice physicalDevice{nullptr};
    vk::raii::Device device{nullptr};
    vk::raii::Queue graphicsQueue{nullptr};
    vk::raii::DescriptorPool descriptorPool{nullptr};
    VmaAllocator allocator = VK_NULL_HANDLE;

    uint32_t graphicsFamily = 0;
    eastl::string deviceName;
    DeviceLimits deviceLimits;
    DeviceFeatures deviceFeatures = DeviceFeatures::None;

    // VkImage / VkBuffer -> allocation
    eastl::hash_map<RawHandle, VmaAllocation> allocations;
    // Layout entries, needed to pick descriptor types when writing sets
    eastl::hash_map<RawHandle, eastl::vector<BindGroupLayoutEntry>> layoutEntries;
};

} // namespace ember
