#pragma once

#include <EASTL/hash_map.h>

#include "PipelineCache.hpp"
#include "core/Log.hpp"

namespace ember {

// What a specializer hands back: the canonical form of the key it was given
// (keys that produce the same descriptor canonicalize to the same value), or
// the reason the descriptor could not be specialized.
template<typename Key>
struct SpecializeOutcome {
    bool success = false;
    Key canonicalKey{};
    PipelineError error;

    static SpecializeOutcome ok(const Key& key) {
        return SpecializeOutcome{true, key, {}};
    }
    static SpecializeOutcome failure(PipelineErrorCode code, const eastl::string& message) {
        return SpecializeOutcome{false, Key{}, PipelineError{code, message}};
    }
};

/**
 * @brief Memoizes pipelines derived from one base descriptor
 *
 * Specializer requirements:
 *   using Key = ...;  // equality comparable, eastl::hash specialized
 *   SpecializeOutcome<Key> specialize(const Key& key, RenderPipelineDesc& desc) const;
 *
 * A key is looked up as given first, then by its canonical form, so keys
 * that differ only in ignored fields share a pipeline. Failures are
 * returned to the caller and not memoized.
 */
template<typename Specializer>
class SpecializedCache {
public:
    using Key = typename Specializer::Key;

    SpecializedCache(Specializer specializer, RenderPipelineDesc baseDescriptor)
        : specializer(eastl::move(specializer)), base(eastl::move(baseDescriptor)) {}

    PipelineResult specialize(PipelineCache& cache, const Key& key) {
        if (auto it = specialized.find(key); it != specialized.end()) {
            return PipelineResult::ok(it->second);
        }

        RenderPipelineDesc desc = base;
        SpecializeOutcome<Key> outcome = specializer.specialize(key, desc);
        if (!outcome.success) {
            Log::error("Pipeline", "Specialization of '{}' failed: {} ({})", base.label.c_str(),
                       toString(outcome.error.code), outcome.error.message.c_str());
            return PipelineResult::failure(outcome.error);
        }

        if (auto it = canonical.find(outcome.canonicalKey); it != canonical.end()) {
            specialized[key] = it->second;
            return PipelineResult::ok(it->second);
        }

        PipelineResult result = cache.compileRenderPipeline(desc);
        if (!result.success) {
            return result;
        }

        canonical[outcome.canonicalKey] = result.id;
        specialized[key] = result.id;
        return result;
    }

    const RenderPipelineDesc& baseDescriptor() const { return base; }
    size_t uniquePipelineCount() const { return canonical.size(); }

private:
    Specializer specializer;
    RenderPipelineDesc base;
    eastl::hash_map<Key, CachedPipelineId> specialized;
    eastl::hash_map<Key, CachedPipelineId> canonical;
};

} // namespace ember
