#pragma once

#include "RenderGraph.hpp"
#include "ViewScope.hpp"
#include "renderer/pipeline/PipelineCache.hpp"

namespace ember {

/**
 * @brief Run-time view of the graph handed to one node
 *
 * Resolves handles only if the node declared them. Checks, in order:
 * the graph is Executing, the id is in the node's dependencies, the id is
 * live with an in-range generation, and the resource has been realized.
 * References returned here are valid until the frame is reset.
 */
class NodeContext : public ViewScope {
public:
    NodeContext(const RenderGraph& graph, const RenderNode& node);

    template<typename R>
    const R& get(const ResourceHandle<R>& handle) const {
        requireExecuting("get");

        if (!node.dependencies.containsResource(handle)) {
            throwUndeclared(RenderResourceTraits<R>::kKind, handle.id());
        }
        graph.requireLiveHandle(handle, "NodeContext::get");

        const ResourceMeta<R>* meta = graph.store<R>().get(handle.index());
        if (!meta) {
            throwUnresolved(RenderResourceTraits<R>::kKind, handle.id());
        }
        return meta->resource;
    }

    template<typename R>
    const typename RenderResourceTraits<R>::Descriptor* getDescriptorOf(const ResourceHandle<R>& handle) const {
        get(handle);
        return graph.store<R>().getDescriptor(handle.index());
    }

    const BindGroup& getBindGroup(BindGroupId bindGroup) const;

    // Compiled pipeline from the PipelineCache world resource, or nullptr
    const RenderPipeline* getPipeline(CachedPipelineId id) const;

    const eastl::string& nodeName() const { return node.name; }
    const RenderDependencies& dependencies() const { return node.dependencies; }

private:
    void requireExecuting(const char* operation) const;
    void throwUndeclared(ResourceKind kind, ResourceId id) const;
    void throwUnresolved(ResourceKind kind, ResourceId id) const;

    const RenderGraph& graph;
    const RenderNode& node;
};

} // namespace ember
