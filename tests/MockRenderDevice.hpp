// MockRenderDevice - in-memory RenderDevice for tests
// Hands out incrementing tokens instead of GPU objects and records every
// create/destroy so tests can check what the graph released.

#pragma once

#include <EASTL/hash_set.h>
#include <initializer_list>
#include <EASTL/shared_ptr.h>
#include <EASTL/string.h>
#include <EASTL/vector.h>

#include "renderer/device/RenderDevice.hpp"

namespace ember::test {

struct DeviceCounters {
    uint32_t texturesCreated = 0;
    uint32_t texturesDestroyed = 0;
    uint32_t buffersCreated = 0;
    uint32_t buffersDestroyed = 0;
    uint32_t samplersCreated = 0;
    uint32_t samplersDestroyed = 0;
    uint32_t layoutsCreated = 0;
    uint32_t layoutsDestroyed = 0;
    uint32_t bindGroupsCreated = 0;
    uint32_t bindGroupsDestroyed = 0;
    uint32_t pipelinesCreated = 0;
    uint32_t pipelinesDestroyed = 0;
    uint32_t pipelineFailures = 0;
};

class MockRenderDevice : public RenderDevice {
public:
    MockRenderDevice();

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

    // Next texture/buffer creation throws DeviceError
    void failNextTexture() { textureFailures++; }
    void failNextBuffer() { bufferFailures++; }

    void setUnsupportedTarget(TextureFormat format) { unsupportedTargets.insert(static_cast<uint8_t>(format)); }
    void setFeatures(DeviceFeatures features) { deviceFeatures = features; }
    DeviceLimits& mutableLimits() { return deviceLimits; }

    const DeviceCounters& counters() const { return stats; }
    bool isAlive(RawHandle token) const { return alive.find(token) != alive.end(); }
    size_t aliveCount() const { return alive.size(); }

    // Bindings of the last bind group created
    const eastl::vector<BindGroupBinding>& lastBindings() const { return recentBindings; }
    // Descriptors of every pipeline compiled, in order
    const eastl::vector<RenderPipelineDesc>& compiledPipelines() const { return compiled; }

    // Builds a minimal fragment module with one empty function per entry
    // point. Each def becomes a specialization constant id in declaration order.
    static eastl::shared_ptr<const ShaderModule> makeShaderModule(const eastl::string& label,
                                                                 std::initializer_list<const char*> entryPoints,
                                                                 std::initializer_list<const char*> defs = {});

private:
    RawHandle nextToken();
    void retire(RawHandle token, uint32_t& counter);

    PipelineError validateStage(const ShaderStageDesc& stage) const;

    RawHandle tokenCounter = 0;
    eastl::hash_set<RawHandle> alive;
    eastl::hash_set<uint8_t> unsupportedTargets;
    uint32_t textureFailures = 0;
    uint32_t bufferFailures = 0;

    DeviceLimits deviceLimits;
    DeviceFeatures deviceFeatures = DeviceFeatures::None;
    DeviceCounters stats;
    eastl::vector<BindGroupBinding> recentBindings;
    eastl::vector<RenderPipelineDesc> compiled;
};

} // namespace ember::test
