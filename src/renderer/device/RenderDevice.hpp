#pragma once

#include <EASTL/string.h>
#include <EASTL/vector.h>

#include "GpuTypes.hpp"
#include "PipelineTypes.hpp"

namespace ember {

/**
 * @brief Device collaborator used by the render graph
 *
 * All resource realization and pipeline compilation route through this
 * interface. Creation failures throw DeviceError; pipeline compilation
 * reports failures through PipelineCompileResult.
 *
 * Implementations:
 * - VulkanRenderDevice: Vulkan-Hpp + VMA
 * - MockRenderDevice (tests): in-memory tokens
 */
class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    virtual Texture createTexture(const TextureDesc& desc) = 0;
    virtual Buffer createBuffer(const BufferDesc& desc) = 0;
    virtual Sampler createSampler(const SamplerDesc& desc) = 0;
    virtual RawHandle createBindGroupLayout(const BindGroupLayoutDesc& desc) = 0;
    virtual BindGroup createBindGroup(const eastl::string& label, RawHandle layout,
                                      const eastl::vector<BindGroupBinding>& bindings) = 0;
    virtual PipelineCompileResult createRenderPipeline(const RenderPipelineDesc& desc) = 0;

    virtual void destroyTexture(const Texture& texture) = 0;
    virtual void destroyBuffer(const Buffer& buffer) = 0;
    virtual void destroySampler(const Sampler& sampler) = 0;
    virtual void destroyBindGroupLayout(RawHandle layout) = 0;
    virtual void destroyBindGroup(const BindGroup& bindGroup) = 0;
    virtual void destroyRenderPipeline(const RenderPipeline& pipeline) = 0;

    virtual const DeviceLimits& limits() const = 0;
    virtual DeviceFeatures features() const = 0;
    virtual bool supportsColorTarget(TextureFormat format) const = 0;
};

} // namespace ember
