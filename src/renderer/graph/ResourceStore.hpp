#pragma once

#include <EASTL/hash_map.h>
#include <EASTL/map.h>
#include <EASTL/optional.h>
#include <EASTL/string.h>
#include <cstdint>

#include "RenderResource.hpp"
#include "core/Exception.hpp"
#include "core/Log.hpp"

namespace ember {

/**
 * @brief Per-kind storage owned by the RenderGraph
 *
 * current:         this frame's realized resources, by slot index
 * queued:          deferred initializers awaiting realizeQueued, by slot index
 * lastFrame:       resources carried over from the previous frame, by label
 * resourcesToSave: current-frame indices to promote into lastFrame at reset
 * adopted:         current-frame indices that came out of lastFrame
 *
 * An index lives in at most one of current/queued. Retention is a strict
 * one-frame window: a lastFrame entry not re-marked during a frame is
 * released at that frame's reset.
 */
template<typename R>
class ResourceStore {
public:
    using Traits = RenderResourceTraits<R>;
    using Descriptor = typename Traits::Descriptor;
    using Meta = ResourceMeta<R>;

    ResourceStore() = default;
    ResourceStore(const ResourceStore&) = delete;
    ResourceStore& operator=(const ResourceStore&) = delete;

    void insert(uint16_t index, ResourceInit<R> init) {
        if (current.find(index) != current.end() || queued.find(index) != queued.end()) {
            Log::critical("ResourceStore", "{} index {} inserted twice in one frame", toString(Traits::kKind), index);
            throw GraphError(GraphErrorKind::DuplicateInsert,
                             eastl::string(toString(Traits::kKind)) + " index inserted twice in one frame");
        }

        if (init.isEager()) {
            current[index] = eastl::move(init.eagerMeta());
            Log::trace("ResourceStore", "{} {} inserted (eager)", toString(Traits::kKind), index);
        } else {
            queued[index] = eastl::move(init.deferredInit());
            Log::trace("ResourceStore", "{} {} queued", toString(Traits::kKind), index);
        }
    }

    // Realizes queued initializers in index order. If an initializer throws,
    // everything realized before it stays in current and the rest stay queued.
    void realizeQueued(World& world, RenderDevice& device) {
        while (!queued.empty()) {
            auto it = queued.begin();
            uint16_t index = it->first;
            QueuedResource<R> pending = eastl::move(it->second);
            queued.erase(it);

            Meta meta = pending.init(world, device);
            if (!meta.descriptor && pending.descriptor) {
                meta.descriptor = eastl::move(pending.descriptor);
            }
            current[index] = eastl::move(meta);
            Log::trace("ResourceStore", "{} {} realized", toString(Traits::kKind), index);
        }
    }

    // Realized meta only; queued and unknown indices resolve to nullptr
    Meta* get(uint16_t index) {
        auto it = current.find(index);
        return it != current.end() ? &it->second : nullptr;
    }

    const Meta* get(uint16_t index) const {
        auto it = current.find(index);
        return it != current.end() ? &it->second : nullptr;
    }

    bool isQueued(uint16_t index) const { return queued.find(index) != queued.end(); }
    bool contains(uint16_t index) const { return current.find(index) != current.end() || isQueued(index); }

    // Known descriptor of a current or queued resource
    const Descriptor* getDescriptor(uint16_t index) const {
        if (auto it = current.find(index); it != current.end()) {
            return it->second.descriptor ? &*it->second.descriptor : nullptr;
        }
        if (auto it = queued.find(index); it != queued.end()) {
            return it->second.descriptor ? &*it->second.descriptor : nullptr;
        }
        return nullptr;
    }

    // A label marks at most one index; re-marking a label replaces the prior mark
    void markRetain(uint16_t index, const eastl::string& label) {
        static_assert(Traits::kRetainable, "resource kind cannot be retained across frames");

        for (auto it = resourcesToSave.begin(); it != resourcesToSave.end();) {
            if (it->second == label && it->first != index) {
                Log::debug("ResourceStore", "Retain label '{}' moved from {} {} to {}",
                           label.c_str(), toString(Traits::kKind), it->first, index);
                it = resourcesToSave.erase(it);
            } else {
                ++it;
            }
        }
        resourcesToSave[index] = label;
    }

    const Meta* getRetained(const eastl::string& label) const {
        auto it = lastFrame.find(label);
        return it != lastFrame.end() ? &it->second : nullptr;
    }

    // Moves the meta retained under label into current at index. It returns
    // to lastFrame if the frame is aborted.
    bool adoptRetained(uint16_t index, const eastl::string& label) {
        auto it = lastFrame.find(label);
        if (it == lastFrame.end()) {
            return false;
        }
        insert(index, ResourceInit<R>::eager(eastl::move(it->second)));
        lastFrame.erase(it);
        adopted[index] = label;
        return true;
    }

    void reset(RenderDevice& device) {
        eastl::hash_map<eastl::string, Meta> promoted;

        for (const auto& mark : resourcesToSave) {
            const uint16_t index = mark.first;
            const eastl::string& label = mark.second;
            auto it = current.find(index);
            if (it == current.end()) {
                Log::warn("ResourceStore", "{} {} marked for retention as '{}' but never realized",
                          toString(Traits::kKind), index, label.c_str());
                continue;
            }
            promoted[label] = eastl::move(it->second);
            current.erase(it);
            Log::trace("ResourceStore", "{} {} retained as '{}'", toString(Traits::kKind), index, label.c_str());
        }

        releaseAll(device, current);
        releaseAll(device, lastFrame);

        lastFrame = eastl::move(promoted);
        current.clear();
        queued.clear();
        resourcesToSave.clear();
        adopted.clear();
    }

    // Drops the frame in progress; lastFrame is left as it was
    void abort(RenderDevice& device) {
        for (const auto& adoption : adopted) {
            auto it = current.find(adoption.first);
            if (it != current.end()) {
                lastFrame[adoption.second] = eastl::move(it->second);
                current.erase(it);
            }
        }
        adopted.clear();

        releaseAll(device, current);
        queued.clear();
        resourcesToSave.clear();
    }

    void clear(RenderDevice& device) {
        abort(device);
        releaseAll(device, lastFrame);
        lastFrame.clear();
    }

    size_t currentCount() const { return current.size(); }
    size_t queuedCount() const { return queued.size(); }
    size_t retainedCount() const { return lastFrame.size(); }
    size_t markedCount() const { return resourcesToSave.size(); }

private:
    template<typename Map>
    static void releaseAll(RenderDevice& device, Map& metas) {
        for (auto& entry : metas) {
            if (entry.second.owned) {
                Traits::release(device, entry.second.resource);
            }
        }
        metas.clear();
    }

    eastl::hash_map<uint16_t, Meta> current;
    eastl::map<uint16_t, QueuedResource<R>> queued;
    eastl::hash_map<eastl::string, Meta> lastFrame;
    eastl::hash_map<uint16_t, eastl::string> resourcesToSave;
    eastl::hash_map<uint16_t, eastl::string> adopted;  // Current indices taken from lastFrame
};

} // namespace ember
