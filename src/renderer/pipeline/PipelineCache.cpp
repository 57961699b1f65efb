#include "PipelineCache.hpp"
#include "core/Log.hpp"

namespace ember {

PipelineCache::~PipelineCache() {
    cleanup();
}

PipelineCache::PipelineCache(PipelineCache&& other) noexcept
    : device(other.device), pipelines(eastl::move(other.pipelines)) {
    other.device = nullptr;
    other.pipelines.clear();
}

PipelineCache& PipelineCache::operator=(PipelineCache&& other) noexcept {
    if (this != &other) {
        cleanup();
        device = other.device;
        pipelines = eastl::move(other.pipelines);
        other.device = nullptr;
        other.pipelines.clear();
    }
    return *this;
}

void PipelineCache::init(RenderDevice* renderDevice) {
    device = renderDevice;
}

void PipelineCache::cleanup() {
    if (!device) {
        return;
    }
    for (const auto& cached : pipelines) {
        device->destroyRenderPipeline(cached.pipeline);
    }
    if (!pipelines.empty()) {
        Log::debug("Pipeline", "Released {} pipelines", pipelines.size());
    }
    pipelines.clear();
    device = nullptr;
}

PipelineResult PipelineCache::compileRenderPipeline(const RenderPipelineDesc& desc) {
    if (!device) {
        return PipelineResult::failure(PipelineError{PipelineErrorCode::PipelineCreationFailed,
                                                     "PipelineCache used before init()"});
    }

    PipelineCompileResult result = device->createRenderPipeline(desc);
    if (!result.success) {
        Log::error("Pipeline", "Failed to compile '{}': {} ({})", desc.label.c_str(),
                   toString(result.error.code), result.error.message.c_str());
        return PipelineResult::failure(result.error);
    }

    CachedPipelineId id = static_cast<CachedPipelineId>(pipelines.size());
    pipelines.push_back(CachedPipeline{desc, result.pipeline});
    Log::debug("Pipeline", "Compiled '{}' as pipeline {}", desc.label.c_str(), id);
    return PipelineResult::ok(id);
}

const RenderPipeline* PipelineCache::getRenderPipeline(CachedPipelineId id) const {
    return id < pipelines.size() ? &pipelines[id].pipeline : nullptr;
}

const RenderPipelineDesc* PipelineCache::getPipelineDescriptor(CachedPipelineId id) const {
    return id < pipelines.size() ? &pipelines[id].descriptor : nullptr;
}

} // namespace ember
