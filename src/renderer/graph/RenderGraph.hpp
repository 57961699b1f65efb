#pragma once

#include <entt/entt.hpp>
#include <EASTL/functional.h>
#include <EASTL/string.h>
#include <EASTL/vector.h>
#include <cstdint>
#include <type_traits>

#include "RenderDependencies.hpp"
#include "RenderResource.hpp"
#include "ResourceSlotTable.hpp"
#include "ResourceStore.hpp"
#include "core/Config.hpp"

namespace ember {

class World;
class RenderGraphBuilder;
class NodeContext;

enum class GraphPhase : uint8_t {
    Idle,
    Building,
    Realizing,
    Executing,
    Resetting
};

constexpr const char* toString(GraphPhase phase) {
    switch (phase) {
        case GraphPhase::Idle:      return "Idle";
        case GraphPhase::Building:  return "Building";
        case GraphPhase::Realizing: return "Realizing";
        case GraphPhase::Executing: return "Executing";
        case GraphPhase::Resetting: return "Resetting";
    }
    return "Unknown";
}

using NodeFunction = eastl::function<void(NodeContext&, RenderDevice&)>;

struct RenderNode {
    eastl::string name;
    RenderDependencies dependencies;  // Immutable once attached
    entt::entity view = entt::null;
    NodeFunction function;
};

/**
 * @brief Frame-scoped resource graph
 *
 * Owns one ResourceStore per resource kind and the slot table that hands
 * out resource ids. Each frame runs:
 *
 *   Idle -> Building   builder(view), once or more per view
 *   Building -> Realizing -> Executing   realizeQueued()
 *   Executing           run(), nodes in declaration order
 *   Executing -> Resetting -> Idle   reset(), promotes retained resources
 *
 * Calling an operation outside its phase throws GraphError(PhaseViolation).
 * abortFrame() drops a partially built or failed frame from any phase.
 */
class RenderGraph {
public:
    RenderGraph() = default;
    ~RenderGraph();

    RenderGraph(const RenderGraph&) = delete;
    RenderGraph& operator=(const RenderGraph&) = delete;

    void init(RenderDevice* renderDevice, World* renderWorld, const GraphConfig& config = {});
    void cleanup();

    RenderGraphBuilder builder(entt::entity view);
    void realizeQueued();
    void run();
    void reset();
    void abortFrame();

    // Build for every view, realize, run and reset. Aborts the frame and
    // rethrows if any step throws.
    void runFrame(const eastl::vector<entt::entity>& views,
                  const eastl::function<void(RenderGraphBuilder&)>& buildFn);

    GraphPhase phase() const { return currentPhase; }
    uint64_t frameIndex() const { return frameCounter; }
    size_t nodeCount() const { return nodes.size(); }
    bool isInitialized() const { return device != nullptr; }

    RenderDevice& getDevice() const { return *device; }
    World& getWorld() const { return *world; }
    const ResourceSlotTable& slotTable() const { return slots; }

    template<typename R>
    ResourceStore<R>& store() {
        if constexpr (std::is_same_v<R, Texture>) {
            return textures;
        } else if constexpr (std::is_same_v<R, Buffer>) {
            return buffers;
        } else if constexpr (std::is_same_v<R, Sampler>) {
            return samplers;
        } else {
            static_assert(std::is_same_v<R, BindGroup>, "unknown render resource kind");
            return bindGroups;
        }
    }

    template<typename R>
    const ResourceStore<R>& store() const {
        return const_cast<RenderGraph*>(this)->store<R>();
    }

private:
    friend class RenderGraphBuilder;
    friend class NodeContext;

    void requirePhase(GraphPhase expected, const char* operation) const;
    void beginBuilding();

    template<typename R>
    ResourceHandle<R> declare(ResourceInit<R> init) {
        ResourceId id = slots.allocate(RenderResourceTraits<R>::kKind);
        store<R>().insert(id.index, eastl::move(init));
        return makeResourceHandle<R>(id);
    }

    template<typename R>
    void requireLiveHandle(const ResourceHandle<R>& handle, const char* operation) const {
        if (!slots.validate(handle.id(), RenderResourceTraits<R>::kKind)) {
            throwStaleHandle(handle.id(), operation);
        }
    }

    void throwStaleHandle(ResourceId id, const char* operation) const;

    void attachNode(RenderNode node);
    BindGroupId declareBindGroup(BindGroupDesc desc);
    ResourceMeta<BindGroup> realizeBindGroup(const BindGroupDesc& desc) const;
    RawHandle resolveBindingResource(const BindGroupEntry& entry, const eastl::string& label) const;

    RenderDevice* device = nullptr;
    World* world = nullptr;
    GraphConfig graphConfig;

    GraphPhase currentPhase = GraphPhase::Idle;
    uint64_t frameCounter = 0;

    ResourceSlotTable slots;
    ResourceStore<Texture> textures;
    ResourceStore<Buffer> buffers;
    ResourceStore<Sampler> samplers;
    ResourceStore<BindGroup> bindGroups;

    eastl::vector<RenderNode> nodes;
};

} // namespace ember
