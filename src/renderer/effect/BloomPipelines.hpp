#pragma once

#include <EASTL/functional.h>
#include <EASTL/optional.h>
#include <EASTL/shared_ptr.h>

#include "ecs/ViewComponents.hpp"
#include "renderer/device/RenderDevice.hpp"
#include "renderer/pipeline/SpecializedCache.hpp"

namespace ember {

class World;

// Bloom mip chain format
constexpr TextureFormat kBloomTextureFormat = TextureFormat::RG11B10Float;

// Fullscreen-triangle vertex stage shared by post-processing pipelines (world resource)
struct FullscreenShader {
    ShaderStageDesc vertex;
};

// Compiled bloom fragment shader (world resource)
struct BloomShader {
    eastl::shared_ptr<const ShaderModule> module;
};

struct BloomDownsamplingKey {
    bool prefilter = false;
    bool firstDownsample = false;
    bool uniformScale = false;

    bool operator==(const BloomDownsamplingKey& other) const {
        return prefilter == other.prefilter && firstDownsample == other.firstDownsample &&
               uniformScale == other.uniformScale;
    }
};

struct BloomUpsamplingKey {
    BloomCompositeMode compositeMode = BloomCompositeMode::EnergyConserving;
    bool finalPipeline = false;

    bool operator==(const BloomUpsamplingKey& other) const {
        return compositeMode == other.compositeMode && finalPipeline == other.finalPipeline;
    }
};

} // namespace ember

namespace eastl {
    template<>
    struct hash<ember::BloomDownsamplingKey> {
        size_t operator()(const ember::BloomDownsamplingKey& key) const noexcept {
            return (static_cast<size_t>(key.prefilter) << 2) | (static_cast<size_t>(key.firstDownsample) << 1) |
                   static_cast<size_t>(key.uniformScale);
        }
    };

    template<>
    struct hash<ember::BloomUpsamplingKey> {
        size_t operator()(const ember::BloomUpsamplingKey& key) const noexcept {
            return (static_cast<size_t>(key.compositeMode) << 1) | static_cast<size_t>(key.finalPipeline);
        }
    };
}

namespace ember {

// Every flag maps to its own shader def, so each key is its own canonical form
struct BloomDownsamplingSpecializer {
    using Key = BloomDownsamplingKey;
    SpecializeOutcome<Key> specialize(const Key& key, RenderPipelineDesc& desc) const;
};

struct BloomUpsamplingSpecializer {
    using Key = BloomUpsamplingKey;
    SpecializeOutcome<Key> specialize(const Key& key, RenderPipelineDesc& desc) const;
};

// View components attached by the prepare functions
struct BloomDownsamplingPipelineIds {
    CachedPipelineId main = kInvalidPipelineId;
    CachedPipelineId first = kInvalidPipelineId;
};

struct BloomUpsamplingPipelineIds {
    CachedPipelineId main = kInvalidPipelineId;
    CachedPipelineId finalPass = kInvalidPipelineId;
};

// World resource: layout with a texture, a sampler and dynamic-offset uniforms
class BloomDownsamplingPipeline {
public:
    // Requires FullscreenShader and BloomShader world resources
    static BloomDownsamplingPipeline fromWorld(World& world, RenderDevice& device);

    BloomDownsamplingPipeline(RawHandle layout, Sampler linearSampler, RenderPipelineDesc baseDescriptor);

    void release(RenderDevice& device);

    RawHandle bindGroupLayout = kNullRawHandle;
    Sampler sampler;
    SpecializedCache<BloomDownsamplingSpecializer> specializedCache;
};

class BloomUpsamplingPipeline {
public:
    static BloomUpsamplingPipeline fromWorld(World& world, RenderDevice& device);

    BloomUpsamplingPipeline(RawHandle layout, RenderPipelineDesc baseDescriptor);

    void release(RenderDevice& device);

    RawHandle bindGroupLayout = kNullRawHandle;
    SpecializedCache<BloomUpsamplingSpecializer> specializedCache;
};

// Specialize both downsampling pipelines for every view with BloomSettings
// and attach BloomDownsamplingPipelineIds. Stops at the first failure.
eastl::optional<PipelineError> prepareDownsamplingPipelines(World& world, PipelineCache& cache);

// Same for BloomUpsamplingPipelineIds
eastl::optional<PipelineError> prepareUpsamplingPipelines(World& world, PipelineCache& cache);

} // namespace ember
