#include "RenderGraph.hpp"
#include "RenderGraphBuilder.hpp"
#include "NodeContext.hpp"
#include "core/Log.hpp"

#include <EASTL/algorithm.h>
#include <EASTL/hash_map.h>

namespace ember {

RenderGraph::~RenderGraph() {
    if (device) {
        cleanup();
    }
}

void RenderGraph::init(RenderDevice* renderDevice, World* renderWorld, const GraphConfig& config) {
    device = renderDevice;
    world = renderWorld;
    graphConfig = config;
    slots.configure(config);
    currentPhase = GraphPhase::Idle;
    Log::info("RenderGraph", "Initialized (max {} resources per frame, generation checks {})",
              slots.capacity(), config.validateHandleGenerations ? "on" : "off");
}

void RenderGraph::cleanup() {
    if (!device) {
        return;
    }

    // Bind groups reference the other kinds, so they go first
    bindGroups.clear(*device);
    samplers.clear(*device);
    buffers.clear(*device);
    textures.clear(*device);

    nodes.clear();
    slots.clear();
    currentPhase = GraphPhase::Idle;
    device = nullptr;
    world = nullptr;
    Log::info("RenderGraph", "Cleaned up");
}

RenderGraphBuilder RenderGraph::builder(entt::entity view) {
    beginBuilding();
    return RenderGraphBuilder(*this, view);
}

void RenderGraph::beginBuilding() {
    if (currentPhase == GraphPhase::Idle) {
        if (!device || !world) {
            Log::critical("RenderGraph", "Graph used before init()");
            throw GraphError(GraphErrorKind::PhaseViolation, "RenderGraph used before init()");
        }
        currentPhase = GraphPhase::Building;
        Log::trace("RenderGraph", "Frame {} building", frameCounter);
        return;
    }
    requirePhase(GraphPhase::Building, "builder");
}

void RenderGraph::realizeQueued() {
    requirePhase(GraphPhase::Building, "realizeQueued");
    currentPhase = GraphPhase::Realizing;

    // Bind groups resolve their entries against the other stores
    textures.realizeQueued(*world, *device);
    buffers.realizeQueued(*world, *device);
    samplers.realizeQueued(*world, *device);
    bindGroups.realizeQueued(*world, *device);

    currentPhase = GraphPhase::Executing;
}

void RenderGraph::run() {
    requirePhase(GraphPhase::Executing, "run");

    for (const RenderNode& node : nodes) {
        Log::trace("RenderGraph", "Executing node '{}'", node.name.c_str());
        NodeContext context(*this, node);
        node.function(context, *device);
    }
}

void RenderGraph::reset() {
    if (currentPhase == GraphPhase::Idle) {
        return;
    }
    requirePhase(GraphPhase::Executing, "reset");
    currentPhase = GraphPhase::Resetting;

    size_t realized = textures.currentCount() + buffers.currentCount() + samplers.currentCount() + bindGroups.currentCount();
    size_t retained = textures.markedCount() + buffers.markedCount();
    size_t nodeTotal = nodes.size();

    bindGroups.reset(*device);
    samplers.reset(*device);
    buffers.reset(*device);
    textures.reset(*device);

    nodes.clear();
    slots.beginFrame();

    if (graphConfig.logFrameStatistics) {
        Log::debug("RenderGraph", "Frame {}: {} nodes, {} realized, {} retained, {} dropped",
                   frameCounter, nodeTotal, realized, retained, realized - eastl::min(realized, retained));
    }

    ++frameCounter;
    currentPhase = GraphPhase::Idle;
}

void RenderGraph::abortFrame() {
    if (currentPhase == GraphPhase::Idle) {
        return;
    }

    Log::warn("RenderGraph", "Aborting frame {} during {}", frameCounter, toString(currentPhase));

    bindGroups.abort(*device);
    samplers.abort(*device);
    buffers.abort(*device);
    textures.abort(*device);

    nodes.clear();
    slots.beginFrame();
    currentPhase = GraphPhase::Idle;
}

void RenderGraph::runFrame(const eastl::vector<entt::entity>& views,
                           const eastl::function<void(RenderGraphBuilder&)>& buildFn) {
    requirePhase(GraphPhase::Idle, "runFrame");

    try {
        beginBuilding();
        for (entt::entity view : views) {
            RenderGraphBuilder frameBuilder = builder(view);
            buildFn(frameBuilder);
        }
        realizeQueued();
        run();
        reset();
    } catch (...) {
        abortFrame();
        throw;
    }
}

void RenderGraph::requirePhase(GraphPhase expected, const char* operation) const {
    if (currentPhase != expected) {
        Log::critical("RenderGraph", "'{}' requires phase {} but graph is {}", operation, toString(expected), toString(currentPhase));
        throw GraphError(GraphErrorKind::PhaseViolation,
                         eastl::string(operation) + " called during " + toString(currentPhase));
    }
}

void RenderGraph::throwStaleHandle(ResourceId id, const char* operation) const {
    Log::critical("RenderGraph", "'{}' got stale or unknown id (index {}, generation {})", operation, id.index, id.generation);
    throw GraphError(GraphErrorKind::StaleHandle, eastl::string(operation) + " got a stale or unknown resource id");
}

void RenderGraph::attachNode(RenderNode node) {
    const RenderDependencies& deps = node.dependencies;

    for (const BindGroupId& group : deps.bindGroups()) {
        if (!slots.validate(group.id, ResourceKind::BindGroup)) {
            throwStaleHandle(group.id, "addNode");
        }
    }

    // Nodes execute in attach order, so a node sees the slot as every earlier
    // node left it. Reads must carry the latest generation and writes the one
    // after it; repeated writes in one node chain from there. Checked against
    // a copy so a rejected node leaves the slot table untouched.
    if (slots.validatesGenerations()) {
        eastl::hash_map<uint16_t, uint16_t> nodeLatest;
        eastl::vector<ResourceId> pendingWrites(deps.writes().begin(), deps.writes().end());
        while (!pendingWrites.empty()) {
            size_t before = pendingWrites.size();
            for (auto it = pendingWrites.begin(); it != pendingWrites.end();) {
                if (!slots.isLive(it->index)) {
                    throwStaleHandle(*it, "addNode");
                }
                auto latest = nodeLatest.find(it->index);
                uint16_t current = latest != nodeLatest.end() ? latest->second : slots.latestGeneration(it->index);
                if (it->generation == static_cast<uint16_t>(current + 1)) {
                    nodeLatest[it->index] = it->generation;
                    it = pendingWrites.erase(it);
                } else {
                    ++it;
                }
            }
            if (pendingWrites.size() == before) {
                throwStaleHandle(pendingWrites.front(), "addNode");
            }
        }

        for (const ResourceId& id : deps.reads()) {
            bool current = slots.isLive(id.index) && id.generation == slots.latestGeneration(id.index);
            if (!current && deps.writes().find(id) == deps.writes().end()) {
                throwStaleHandle(id, "addNode");
            }
        }
    } else {
        for (const ResourceId& id : deps.writes()) {
            if (!slots.isLive(id.index)) {
                throwStaleHandle(id, "addNode");
            }
        }
        for (const ResourceId& id : deps.reads()) {
            if (!slots.isLive(id.index)) {
                throwStaleHandle(id, "addNode");
            }
        }
    }

    for (const ResourceId& id : deps.writes()) {
        slots.recordWrite(id);
    }

    Log::trace("RenderGraph", "Added node '{}' ({} reads, {} writes, {} bind groups)", node.name.c_str(),
               deps.reads().size(), deps.writes().size(), deps.bindGroups().size());
    nodes.push_back(eastl::move(node));
}

BindGroupId RenderGraph::declareBindGroup(BindGroupDesc desc) {
    for (const BindGroupEntry& entry : desc.entries) {
        if (!slots.validate(entry.id, entry.kind)) {
            throwStaleHandle(entry.id, "newBindGroup");
        }
    }

    eastl::string label = desc.label;
    DeferredResourceInit<BindGroup> init = [this, desc](World&, RenderDevice&) {
        return realizeBindGroup(desc);
    };
    ResourceId id = slots.allocate(ResourceKind::BindGroup);
    bindGroups.insert(id.index, ResourceInit<BindGroup>::deferred(eastl::move(init), eastl::move(desc)));

    Log::trace("RenderGraph", "Declared bind group {} '{}'", id.index, label.c_str());
    return BindGroupId{id};
}

ResourceMeta<BindGroup> RenderGraph::realizeBindGroup(const BindGroupDesc& desc) const {
    eastl::vector<BindGroupBinding> bindings;
    bindings.reserve(desc.entries.size());

    for (const BindGroupEntry& entry : desc.entries) {
        BindGroupBinding binding;
        binding.binding = entry.binding;
        binding.type = entry.type;
        binding.resource = resolveBindingResource(entry, desc.label);
        binding.offset = entry.offset;
        binding.size = entry.size;
        bindings.push_back(binding);
    }

    ResourceMeta<BindGroup> meta;
    meta.descriptor = desc;
    meta.resource = device->createBindGroup(desc.label, desc.layout, bindings);
    return meta;
}

RawHandle RenderGraph::resolveBindingResource(const BindGroupEntry& entry, const eastl::string& label) const {
    switch (entry.kind) {
        case ResourceKind::Texture:
            if (const auto* meta = textures.get(entry.id.index)) {
                return meta->resource.view;
            }
            break;
        case ResourceKind::Buffer:
            if (const auto* meta = buffers.get(entry.id.index)) {
                return meta->resource.buffer;
            }
            break;
        case ResourceKind::Sampler:
            if (const auto* meta = samplers.get(entry.id.index)) {
                return meta->resource.sampler;
            }
            break;
        case ResourceKind::BindGroup:
            break;
    }

    Log::critical("RenderGraph", "Bind group '{}' binding {} references unresolved {} {}",
                  label.c_str(), entry.binding, toString(entry.kind), entry.id.index);
    throw GraphError(GraphErrorKind::UnresolvedResource, "Bind group '" + label + "' references an unresolved resource");
}

} // namespace ember
