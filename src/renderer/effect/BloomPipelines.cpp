#include "BloomPipelines.hpp"
#include "ecs/World.hpp"
#include "core/Exception.hpp"
#include "core/Log.hpp"

namespace ember {

namespace {

template<typename Resource>
Resource& requireWorldResource(World& world, const char* name) {
    Resource* resource = world.getResource<Resource>();
    if (!resource) {
        Log::critical("Bloom", "World resource '{}' is not present", name);
        throw GraphError(GraphErrorKind::MissingWorldResource, eastl::string("Missing world resource: ") + name);
    }
    return *resource;
}

BindGroupLayoutDesc bloomLayoutDesc(const eastl::string& label) {
    auto desc = BindGroupLayoutDesc::sequential(label, ShaderStage::Fragment, {
        BindingType::SampledTexture,  // Input texture
        BindingType::Sampler,
        BindingType::UniformBuffer    // Bloom uniforms
    });
    desc.entries[2].hasDynamicOffset = true;
    return desc;
}

} // anonymous namespace

SpecializeOutcome<BloomDownsamplingKey> BloomDownsamplingSpecializer::specialize(const Key& key, RenderPipelineDesc& desc) const {
    desc.label = key.firstDownsample ? "bloom_downsampling_pipeline_first" : "bloom_downsampling_pipeline";

    if (!desc.fragment) {
        return SpecializeOutcome<Key>::failure(PipelineErrorCode::MissingFragmentState,
                                               "Bloom downsampling descriptor has no fragment stage");
    }

    FragmentState& fragment = *desc.fragment;
    fragment.entryPoint = key.firstDownsample ? "downsample_first" : "downsample";

    if (key.firstDownsample) {
        fragment.shaderDefs.push_back("FIRST_DOWNSAMPLE");
    }
    if (key.prefilter) {
        fragment.shaderDefs.push_back("USE_THRESHOLD");
    }
    if (key.uniformScale) {
        fragment.shaderDefs.push_back("UNIFORM_SCALE");
    }

    return SpecializeOutcome<Key>::ok(key);
}

SpecializeOutcome<BloomUpsamplingKey> BloomUpsamplingSpecializer::specialize(const Key& key, RenderPipelineDesc& desc) const {
    if (!desc.fragment) {
        return SpecializeOutcome<Key>::failure(PipelineErrorCode::MissingFragmentState,
                                               "Bloom upsampling descriptor has no fragment stage");
    }

    BlendComponent colorBlend;
    switch (key.compositeMode) {
        case BloomCompositeMode::EnergyConserving:
            // Per-mip blend factors are supplied as blend constants when the pass runs
            colorBlend = BlendComponent{BlendFactor::Constant, BlendFactor::OneMinusConstant, BlendOperation::Add};
            break;
        case BloomCompositeMode::Additive:
            colorBlend = BlendComponent{BlendFactor::Constant, BlendFactor::One, BlendOperation::Add};
            break;
    }

    ColorTargetState target;
    target.format = key.finalPipeline ? ViewTarget::kHdrFormat : kBloomTextureFormat;
    target.blend = BlendState{colorBlend, BlendComponent{BlendFactor::Zero, BlendFactor::One, BlendOperation::Add}};
    target.writeMask = ColorWrites::All;

    desc.fragment->setTarget(0, target);
    return SpecializeOutcome<Key>::ok(key);
}

BloomDownsamplingPipeline::BloomDownsamplingPipeline(RawHandle layout, Sampler linearSampler, RenderPipelineDesc baseDescriptor)
    : bindGroupLayout(layout)
    , sampler(linearSampler)
    , specializedCache(BloomDownsamplingSpecializer{}, eastl::move(baseDescriptor)) {
}

BloomDownsamplingPipeline BloomDownsamplingPipeline::fromWorld(World& world, RenderDevice& device) {
    const auto& fullscreen = requireWorldResource<FullscreenShader>(world, "FullscreenShader");
    const auto& shader = requireWorldResource<BloomShader>(world, "BloomShader");

    RawHandle layout = device.createBindGroupLayout(bloomLayoutDesc("bloom_downsampling_bind_group_layout_with_settings"));

    SamplerDesc samplerDesc;
    samplerDesc.label = "bloom_sampler";
    samplerDesc.minFilter = FilterMode::Linear;
    samplerDesc.magFilter = FilterMode::Linear;
    samplerDesc.addressModeU = AddressMode::ClampToEdge;
    samplerDesc.addressModeV = AddressMode::ClampToEdge;
    Sampler sampler = device.createSampler(samplerDesc);

    RenderPipelineDesc base;
    base.layout.push_back(layout);
    base.vertex = fullscreen.vertex;

    FragmentState fragment;
    fragment.module = shader.module;
    fragment.targets.push_back(ColorTargetState{kBloomTextureFormat, eastl::nullopt, ColorWrites::All});
    base.fragment = fragment;

    Log::debug("Bloom", "Downsampling pipeline base descriptor ready");
    return BloomDownsamplingPipeline(layout, sampler, eastl::move(base));
}

void BloomDownsamplingPipeline::release(RenderDevice& device) {
    if (bindGroupLayout != kNullRawHandle) {
        device.destroyBindGroupLayout(bindGroupLayout);
        bindGroupLayout = kNullRawHandle;
    }
    if (sampler.sampler != kNullRawHandle) {
        device.destroySampler(sampler);
        sampler = Sampler{};
    }
}

BloomUpsamplingPipeline::BloomUpsamplingPipeline(RawHandle layout, RenderPipelineDesc baseDescriptor)
    : bindGroupLayout(layout)
    , specializedCache(BloomUpsamplingSpecializer{}, eastl::move(baseDescriptor)) {
}

BloomUpsamplingPipeline BloomUpsamplingPipeline::fromWorld(World& world, RenderDevice& device) {
    const auto& fullscreen = requireWorldResource<FullscreenShader>(world, "FullscreenShader");
    const auto& shader = requireWorldResource<BloomShader>(world, "BloomShader");

    RawHandle layout = device.createBindGroupLayout(bloomLayoutDesc("bloom_upsampling_bind_group_layout"));

    RenderPipelineDesc base;
    base.label = "bloom_upsampling_pipeline";
    base.layout.push_back(layout);
    base.vertex = fullscreen.vertex;

    FragmentState fragment;
    fragment.module = shader.module;
    fragment.entryPoint = "upsample";
    base.fragment = fragment;

    Log::debug("Bloom", "Upsampling pipeline base descriptor ready");
    return BloomUpsamplingPipeline(layout, eastl::move(base));
}

void BloomUpsamplingPipeline::release(RenderDevice& device) {
    if (bindGroupLayout != kNullRawHandle) {
        device.destroyBindGroupLayout(bindGroupLayout);
        bindGroupLayout = kNullRawHandle;
    }
}

eastl::optional<PipelineError> prepareDownsamplingPipelines(World& world, PipelineCache& cache) {
    auto& pipeline = requireWorldResource<BloomDownsamplingPipeline>(world, "BloomDownsamplingPipeline");

    for (auto entity : world.view<BloomSettings>()) {
        const auto& bloom = world.getComponent<BloomSettings>(entity);
        const bool prefilter = bloom.usesPrefilter();
        const bool uniformScale = bloom.hasUniformScale();

        PipelineResult main = pipeline.specializedCache.specialize(cache, BloomDownsamplingKey{prefilter, false, uniformScale});
        if (!main.success) {
            return main.error;
        }

        PipelineResult first = pipeline.specializedCache.specialize(cache, BloomDownsamplingKey{prefilter, true, uniformScale});
        if (!first.success) {
            return first.error;
        }

        world.addComponent<BloomDownsamplingPipelineIds>(entity, BloomDownsamplingPipelineIds{main.id, first.id});
    }
    return eastl::nullopt;
}

eastl::optional<PipelineError> prepareUpsamplingPipelines(World& world, PipelineCache& cache) {
    auto& pipeline = requireWorldResource<BloomUpsamplingPipeline>(world, "BloomUpsamplingPipeline");

    for (auto entity : world.view<BloomSettings>()) {
        const auto& bloom = world.getComponent<BloomSettings>(entity);

        PipelineResult main = pipeline.specializedCache.specialize(cache, BloomUpsamplingKey{bloom.compositeMode, false});
        if (!main.success) {
            return main.error;
        }

        PipelineResult finalPass = pipeline.specializedCache.specialize(cache, BloomUpsamplingKey{bloom.compositeMode, true});
        if (!finalPass.success) {
            return finalPass.error;
        }

        world.addComponent<BloomUpsamplingPipelineIds>(entity, BloomUpsamplingPipelineIds{main.id, finalPass.id});
    }
    return eastl::nullopt;
}

} // namespace ember
