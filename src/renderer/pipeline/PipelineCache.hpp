#pragma once

#include <EASTL/vector.h>
#include <cstdint>

#include "renderer/device/RenderDevice.hpp"

namespace ember {

using CachedPipelineId = uint32_t;
constexpr CachedPipelineId kInvalidPipelineId = UINT32_MAX;

struct PipelineResult {
    bool success = false;
    CachedPipelineId id = kInvalidPipelineId;
    PipelineError error;

    static PipelineResult ok(CachedPipelineId id) {
        return PipelineResult{true, id, {}};
    }
    static PipelineResult failure(const PipelineError& error) {
        return PipelineResult{false, kInvalidPipelineId, error};
    }
};

/**
 * @brief Owns every compiled render pipeline
 *
 * Pipelines are compiled synchronously through the RenderDevice and
 * addressed by a dense CachedPipelineId. Failed compilations get no id.
 * Stored in the World so node closures can resolve ids at execution time.
 */
class PipelineCache {
public:
    PipelineCache() = default;
    explicit PipelineCache(RenderDevice* device) { init(device); }
    ~PipelineCache();

    PipelineCache(const PipelineCache&) = delete;
    PipelineCache& operator=(const PipelineCache&) = delete;
    PipelineCache(PipelineCache&& other) noexcept;
    PipelineCache& operator=(PipelineCache&& other) noexcept;

    void init(RenderDevice* device);
    void cleanup();

    PipelineResult compileRenderPipeline(const RenderPipelineDesc& desc);

    const RenderPipeline* getRenderPipeline(CachedPipelineId id) const;
    const RenderPipelineDesc* getPipelineDescriptor(CachedPipelineId id) const;

    size_t pipelineCount() const { return pipelines.size(); }

private:
    struct CachedPipeline {
        RenderPipelineDesc descriptor;
        RenderPipeline pipeline;
    };

    RenderDevice* device = nullptr;
    eastl::vector<CachedPipeline> pipelines;
};

} // namespace ember
