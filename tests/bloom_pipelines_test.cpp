// Bloom Pipelines Test
// Down/upsampling specialization keys, canonicalization and per-view preparation

#include "TestHarness.hpp"
#include "MockRenderDevice.hpp"
#include "renderer/effect/BloomPipelines.hpp"
#include "ecs/World.hpp"

using namespace ember;
using namespace ember::test;

namespace {

void insertBloomShaders(World& world, std::initializer_list<const char*> fragmentEntryPoints) {
    FullscreenShader fullscreen;
    fullscreen.vertex.module = MockRenderDevice::makeShaderModule("fullscreen_vertex", {"main"});
    world.insertResource(fullscreen);
    world.insertResource(BloomShader{MockRenderDevice::makeShaderModule(
        "bloom", fragmentEntryPoints, {"FIRST_DOWNSAMPLE", "USE_THRESHOLD", "UNIFORM_SCALE"})});
}

void insertBloomShaders(World& world) {
    insertBloomShaders(world, {"downsample_first", "downsample", "upsample"});
}

BloomSettings thresholdBloom() {
    BloomSettings settings;
    settings.prefilter.threshold = 1.2f;
    settings.prefilter.thresholdSoftness = 0.3f;
    return settings;
}

} // namespace

// Test 1: downsampling descriptors per key
void testDownsamplingSpecializer() {
    section(1, "Downsampling specializer");

    World world;
    MockRenderDevice device;
    insertBloomShaders(world);
    BloomDownsamplingPipeline pipeline = BloomDownsamplingPipeline::fromWorld(world, device);

    EMBER_CHECK(device.counters().layoutsCreated == 1);
    EMBER_CHECK(device.counters().samplersCreated == 1);
    EMBER_CHECK(pipeline.specializedCache.baseDescriptor().layout.size() == 1);

    BloomDownsamplingSpecializer specializer;

    RenderPipelineDesc first = pipeline.specializedCache.baseDescriptor();
    auto firstOutcome = specializer.specialize(BloomDownsamplingKey{true, true, true}, first);
    EMBER_CHECK(firstOutcome.success);
    EMBER_CHECK(first.label == "bloom_downsampling_pipeline_first");
    EMBER_CHECK(first.fragment->entryPoint == "downsample_first");
    EMBER_CHECK(first.fragment->hasDef("FIRST_DOWNSAMPLE"));
    EMBER_CHECK(first.fragment->hasDef("USE_THRESHOLD"));
    EMBER_CHECK(first.fragment->hasDef("UNIFORM_SCALE"));
    EMBER_CHECK(first.fragment->targets[0].format == kBloomTextureFormat);
    EMBER_CHECK(!first.fragment->targets[0].blend.has_value());
    EMBER_CHECK(firstOutcome.canonicalKey == (BloomDownsamplingKey{true, true, true}));

    RenderPipelineDesc main = pipeline.specializedCache.baseDescriptor();
    auto mainOutcome = specializer.specialize(BloomDownsamplingKey{true, false, false}, main);
    EMBER_CHECK(main.label == "bloom_downsampling_pipeline");
    EMBER_CHECK(main.fragment->entryPoint == "downsample");
    EMBER_CHECK(main.fragment->shaderDefs.size() == 1);
    EMBER_CHECK(main.fragment->hasDef("USE_THRESHOLD"));
    EMBER_CHECK(!main.fragment->hasDef("FIRST_DOWNSAMPLE"));
    EMBER_CHECK(mainOutcome.canonicalKey == (BloomDownsamplingKey{true, false, false}));

    RenderPipelineDesc plain = pipeline.specializedCache.baseDescriptor();
    specializer.specialize(BloomDownsamplingKey{false, false, false}, plain);
    EMBER_CHECK(plain.fragment->shaderDefs.empty());

    pipeline.release(device);
    EMBER_CHECK(device.aliveCount() == 0);
}

// Test 2: a descriptor without a fragment stage cannot be specialized
void testMissingFragment() {
    section(2, "Missing fragment state");

    RenderPipelineDesc desc;
    desc.label = "vertex_only";

    BloomDownsamplingSpecializer down;
    auto downOutcome = down.specialize(BloomDownsamplingKey{}, desc);
    EMBER_CHECK(!downOutcome.success);
    EMBER_CHECK(downOutcome.error.code == PipelineErrorCode::MissingFragmentState);

    BloomUpsamplingSpecializer up;
    auto upOutcome = up.specialize(BloomUpsamplingKey{}, desc);
    EMBER_CHECK(!upOutcome.success);
    EMBER_CHECK(upOutcome.error.code == PipelineErrorCode::MissingFragmentState);
}

// Test 3: memoization and distinct handles for distinct flags
void testDownsamplingMemoization() {
    section(3, "Downsampling memoization");

    World world;
    MockRenderDevice device;
    PipelineCache cache(&device);
    insertBloomShaders(world);
    BloomDownsamplingPipeline pipeline = BloomDownsamplingPipeline::fromWorld(world, device);
    auto& specialized = pipeline.specializedCache;

    PipelineResult firstA = specialized.specialize(cache, BloomDownsamplingKey{false, true, true});
    PipelineResult firstB = specialized.specialize(cache, BloomDownsamplingKey{false, true, true});
    PipelineResult notFirst = specialized.specialize(cache, BloomDownsamplingKey{false, false, true});
    EMBER_CHECK(firstA.success && firstB.success && notFirst.success);
    EMBER_CHECK(firstA.id == firstB.id);
    EMBER_CHECK(firstA.id != notFirst.id);

    // Prefilter selects a distinct pipeline on every pass
    PipelineResult notFirstPrefilter = specialized.specialize(cache, BloomDownsamplingKey{true, false, true});
    PipelineResult firstPrefilter = specialized.specialize(cache, BloomDownsamplingKey{true, true, true});
    EMBER_CHECK(notFirstPrefilter.success && firstPrefilter.success);
    EMBER_CHECK(notFirstPrefilter.id != notFirst.id);
    EMBER_CHECK(firstPrefilter.id != firstA.id);
    EMBER_CHECK(notFirstPrefilter.id != firstPrefilter.id);

    const RenderPipelineDesc* prefiltered = cache.getPipelineDescriptor(notFirstPrefilter.id);
    EMBER_CHECK(prefiltered && prefiltered->fragment->hasDef("USE_THRESHOLD"));
    EMBER_CHECK(prefiltered && !prefiltered->fragment->hasDef("FIRST_DOWNSAMPLE"));

    EMBER_CHECK(specialized.uniquePipelineCount() == 4);
    EMBER_CHECK(device.counters().pipelinesCreated == 4);

    pipeline.release(device);
}

// Test 4: upsampling blend and target format per key
void testUpsamplingSpecializer() {
    section(4, "Upsampling specializer");

    World world;
    MockRenderDevice device;
    insertBloomShaders(world);
    BloomUpsamplingPipeline pipeline = BloomUpsamplingPipeline::fromWorld(world, device);
    BloomUpsamplingSpecializer specializer;

    RenderPipelineDesc energy = pipeline.specializedCache.baseDescriptor();
    EMBER_CHECK(energy.label == "bloom_upsampling_pipeline");
    EMBER_CHECK(specializer.specialize(BloomUpsamplingKey{BloomCompositeMode::EnergyConserving, false}, energy).success);
    const ColorTargetState& energyTarget = energy.fragment->targets[0];
    EMBER_CHECK(energy.fragment->entryPoint == "upsample");
    EMBER_CHECK(energyTarget.format == kBloomTextureFormat);
    EMBER_CHECK(energyTarget.blend.has_value());
    if (energyTarget.blend) {
        EMBER_CHECK(energyTarget.blend->color ==
                    (BlendComponent{BlendFactor::Constant, BlendFactor::OneMinusConstant, BlendOperation::Add}));
        EMBER_CHECK(energyTarget.blend->alpha ==
                    (BlendComponent{BlendFactor::Zero, BlendFactor::One, BlendOperation::Add}));
    }

    RenderPipelineDesc additive = pipeline.specializedCache.baseDescriptor();
    specializer.specialize(BloomUpsamplingKey{BloomCompositeMode::Additive, true}, additive);
    const ColorTargetState& additiveTarget = additive.fragment->targets[0];
    EMBER_CHECK(additiveTarget.format == ViewTarget::kHdrFormat);
    EMBER_CHECK(additiveTarget.blend &&
                additiveTarget.blend->color ==
                    (BlendComponent{BlendFactor::Constant, BlendFactor::One, BlendOperation::Add}));
    EMBER_CHECK(additiveTarget.writeMask == ColorWrites::All);

    pipeline.release(device);
    EMBER_CHECK(device.aliveCount() == 0);
}

// Test 5: prepare attaches pipeline ids to every bloom view
void testPrepareViews() {
    section(5, "Prepare views");

    World world;
    MockRenderDevice device;
    PipelineCache cache(&device);
    insertBloomShaders(world);
    world.insertResource(BloomDownsamplingPipeline::fromWorld(world, device));
    world.insertResource(BloomUpsamplingPipeline::fromWorld(world, device));

    entt::entity thresholdView = world.createEntity();
    world.addComponent<BloomSettings>(thresholdView, thresholdBloom());

    BloomSettings additiveSettings;
    additiveSettings.compositeMode = BloomCompositeMode::Additive;
    additiveSettings.scale = glm::vec2(1.5f, 1.0f);
    entt::entity additiveView = world.createEntity();
    world.addComponent<BloomSettings>(additiveView, additiveSettings);

    entt::entity plainView = world.createEntity();

    EMBER_CHECK(!prepareDownsamplingPipelines(world, cache).has_value());
    EMBER_CHECK(!prepareUpsamplingPipelines(world, cache).has_value());

    EMBER_CHECK(world.hasComponent<BloomDownsamplingPipelineIds>(thresholdView));
    EMBER_CHECK(world.hasComponent<BloomUpsamplingPipelineIds>(additiveView));
    EMBER_CHECK(!world.hasComponent<BloomDownsamplingPipelineIds>(plainView));
    EMBER_CHECK(!world.hasComponent<BloomUpsamplingPipelineIds>(plainView));

    const auto& thresholdDown = world.getComponent<BloomDownsamplingPipelineIds>(thresholdView);
    const auto& additiveDown = world.getComponent<BloomDownsamplingPipelineIds>(additiveView);
    EMBER_CHECK(thresholdDown.main != thresholdDown.first);
    EMBER_CHECK(thresholdDown.first != additiveDown.first);  // Threshold on, uniform scale vs not

    const RenderPipelineDesc* firstDesc = cache.getPipelineDescriptor(thresholdDown.first);
    EMBER_CHECK(firstDesc && firstDesc->fragment->hasDef("USE_THRESHOLD"));
    EMBER_CHECK(firstDesc && firstDesc->fragment->hasDef("UNIFORM_SCALE"));
    const RenderPipelineDesc* thresholdMain = cache.getPipelineDescriptor(thresholdDown.main);
    EMBER_CHECK(thresholdMain && thresholdMain->fragment->hasDef("USE_THRESHOLD"));
    const RenderPipelineDesc* additiveFirst = cache.getPipelineDescriptor(additiveDown.first);
    EMBER_CHECK(additiveFirst && !additiveFirst->fragment->hasDef("USE_THRESHOLD"));
    EMBER_CHECK(additiveFirst && !additiveFirst->fragment->hasDef("UNIFORM_SCALE"));

    const auto& thresholdUp = world.getComponent<BloomUpsamplingPipelineIds>(thresholdView);
    const auto& additiveUp = world.getComponent<BloomUpsamplingPipelineIds>(additiveView);
    EMBER_CHECK(thresholdUp.main != thresholdUp.finalPass);
    EMBER_CHECK(thresholdUp.finalPass != additiveUp.finalPass);
    EMBER_CHECK(cache.getPipelineDescriptor(thresholdUp.finalPass)->fragment->targets[0].format ==
                ViewTarget::kHdrFormat);

    // Preparing again reuses every pipeline
    size_t compiled = cache.pipelineCount();
    EMBER_CHECK(!prepareDownsamplingPipelines(world, cache).has_value());
    EMBER_CHECK(!prepareUpsamplingPipelines(world, cache).has_value());
    EMBER_CHECK(cache.pipelineCount() == compiled);

    world.getResource<BloomDownsamplingPipeline>()->release(device);
    world.getResource<BloomUpsamplingPipeline>()->release(device);
}

// Test 6: compile errors surface from prepare as typed results
void testPrepareErrors() {
    section(6, "Prepare errors");

    World world;
    MockRenderDevice device;
    PipelineCache cache(&device);

    // Shader without the first-downsample entry point
    insertBloomShaders(world, {"downsample", "upsample"});
    world.insertResource(BloomDownsamplingPipeline::fromWorld(world, device));

    entt::entity view = world.createEntity();
    world.addComponent<BloomSettings>(view, BloomSettings{});

    auto error = prepareDownsamplingPipelines(world, cache);
    EMBER_CHECK(error.has_value());
    EMBER_CHECK(error && error->code == PipelineErrorCode::MissingEntryPoint);
    EMBER_CHECK(!world.hasComponent<BloomDownsamplingPipelineIds>(view));

    // Upsampling pipeline never inserted
    EMBER_CHECK_GRAPH_ERROR(prepareUpsamplingPipelines(world, cache), GraphErrorKind::MissingWorldResource);

    world.getResource<BloomDownsamplingPipeline>()->release(device);
}

// Test 7: pipelines need their shaders in the world
void testMissingShaders() {
    section(7, "Missing shaders");

    World world;
    MockRenderDevice device;
    EMBER_CHECK_GRAPH_ERROR(BloomDownsamplingPipeline::fromWorld(world, device), GraphErrorKind::MissingWorldResource);

    FullscreenShader fullscreen;
    fullscreen.vertex.module = MockRenderDevice::makeShaderModule("fullscreen_vertex", {"main"});
    world.insertResource(fullscreen);
    EMBER_CHECK_GRAPH_ERROR(BloomUpsamplingPipeline::fromWorld(world, device), GraphErrorKind::MissingWorldResource);
    EMBER_CHECK(device.counters().layoutsCreated == 0);
}

int main() {
    fmt::print("========================================\n");
    fmt::print("Bloom Pipelines Test Suite\n");
    fmt::print("========================================\n");

    testDownsamplingSpecializer();
    testMissingFragment();
    testDownsamplingMemoization();
    testUpsamplingSpecializer();
    testPrepareViews();
    testPrepareErrors();
    testMissingShaders();

    return finish("BloomPipelines");
}
