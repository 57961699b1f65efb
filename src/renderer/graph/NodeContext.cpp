#include "NodeContext.hpp"
#include "core/Log.hpp"

namespace ember {

NodeContext::NodeContext(const RenderGraph& g, const RenderNode& n)
    : ViewScope(g.getWorld(), n.view), graph(g), node(n) {
}

const BindGroup& NodeContext::getBindGroup(BindGroupId bindGroup) const {
    requireExecuting("getBindGroup");

    if (!node.dependencies.containsBindGroup(bindGroup)) {
        throwUndeclared(ResourceKind::BindGroup, bindGroup.id);
    }
    if (!graph.slots.validate(bindGroup.id, ResourceKind::BindGroup)) {
        graph.throwStaleHandle(bindGroup.id, "NodeContext::getBindGroup");
    }

    const ResourceMeta<BindGroup>* meta = graph.bindGroups.get(bindGroup.id.index);
    if (!meta) {
        throwUnresolved(ResourceKind::BindGroup, bindGroup.id);
    }
    return meta->resource;
}

const RenderPipeline* NodeContext::getPipeline(CachedPipelineId id) const {
    const PipelineCache* cache = getWorldResource<PipelineCache>();
    return cache ? cache->getRenderPipeline(id) : nullptr;
}

void NodeContext::requireExecuting(const char* operation) const {
    graph.requirePhase(GraphPhase::Executing, operation);
}

void NodeContext::throwUndeclared(ResourceKind kind, ResourceId id) const {
    Log::critical("NodeContext", "Node '{}' accessed undeclared {} (index {}, generation {})",
                  node.name.c_str(), toString(kind), id.index, id.generation);
    throw GraphError(GraphErrorKind::UndeclaredAccess,
                     "Node '" + node.name + "' accessed an undeclared " + toString(kind));
}

void NodeContext::throwUnresolved(ResourceKind kind, ResourceId id) const {
    Log::critical("NodeContext", "Node '{}' resolved {} {} before it was realized",
                  node.name.c_str(), toString(kind), id.index);
    throw GraphError(GraphErrorKind::UnresolvedResource,
                     "Node '" + node.name + "' resolved an unrealized " + toString(kind));
}

} // namespace ember
