#pragma once

#include <EASTL/optional.h>
#include <EASTL/string.h>
#include <type_traits>

#include "RenderGraph.hpp"
#include "ViewScope.hpp"

namespace ember {

/**
 * @brief Construction-time handle for one view of the current frame
 *
 * Declares resources, bind groups and retention marks, and attaches nodes
 * with their dependency sets. Only valid while the graph is Building.
 */
class RenderGraphBuilder : public ViewScope {
public:
    RenderGraphBuilder(RenderGraph& graph, entt::entity view);

    // Deferred: created on the device during realizeQueued. The descriptor
    // is available to getDescriptorOf immediately.
    template<typename R>
    ResourceHandle<R> newResource(const typename RenderResourceTraits<R>::Descriptor& descriptor) {
        requireBuilding("newResource");
        using Descriptor = typename RenderResourceTraits<R>::Descriptor;

        DeferredResourceInit<R> init = [descriptor](World&, RenderDevice& device) {
            return ResourceMeta<R>{descriptor, RenderResourceTraits<R>::create(device, descriptor), true};
        };
        auto handle = graph.declare<R>(ResourceInit<R>::deferred(eastl::move(init), eastl::optional<Descriptor>(descriptor)));
        Log::trace("RenderGraph", "Declared {} {} '{}'", toString(RenderResourceTraits<R>::kKind),
                   handle.index(), descriptor.label.c_str());
        return handle;
    }

    // Eager: created now, without a descriptor. The id is reserved first so
    // an exhausted id space never leaves an untracked device object behind.
    template<typename R, typename CreateFn>
        requires std::is_invocable_r_v<R, CreateFn&, RenderDevice&>
    ResourceHandle<R> newResource(CreateFn&& create) {
        requireBuilding("newResource");
        ResourceId id = graph.slots.allocate(RenderResourceTraits<R>::kKind);
        ResourceMeta<R> meta;
        meta.resource = create(graph.getDevice());
        graph.store<R>().insert(id.index, ResourceInit<R>::eager(eastl::move(meta)));
        Log::trace("RenderGraph", "Created {} {} eagerly", toString(RenderResourceTraits<R>::kKind), id.index);
        return makeResourceHandle<R>(id);
    }

    template<typename R>
    ResourceHandle<R> newDeferredResource(DeferredResourceInit<R> init,
                                          eastl::optional<typename RenderResourceTraits<R>::Descriptor> knownDescriptor = eastl::nullopt) {
        requireBuilding("newDeferredResource");
        auto handle = graph.declare<R>(ResourceInit<R>::deferred(eastl::move(init), eastl::move(knownDescriptor)));
        Log::trace("RenderGraph", "Queued {} {}", toString(RenderResourceTraits<R>::kKind), handle.index());
        return handle;
    }

    // The graph never releases an imported resource
    template<typename R>
    ResourceHandle<R> importResource(const R& resource,
                                     eastl::optional<typename RenderResourceTraits<R>::Descriptor> descriptor = eastl::nullopt) {
        requireBuilding("importResource");
        ResourceMeta<R> meta{eastl::move(descriptor), resource, false};
        auto handle = graph.declare<R>(ResourceInit<R>::eager(eastl::move(meta)));
        Log::trace("RenderGraph", "Imported {} {}", toString(RenderResourceTraits<R>::kKind), handle.index());
        return handle;
    }

    template<typename R>
    const typename RenderResourceTraits<R>::Descriptor* getDescriptorOf(const ResourceHandle<R>& handle) const {
        graph.requireLiveHandle(handle, "getDescriptorOf");
        return graph.store<R>().getDescriptor(handle.index());
    }

    template<typename R>
    const typename RenderResourceTraits<R>::Descriptor& descriptorOf(const ResourceHandle<R>& handle) const {
        const auto* descriptor = getDescriptorOf(handle);
        if (!descriptor) {
            Log::critical("RenderGraph", "{} {} has no descriptor", toString(RenderResourceTraits<R>::kKind), handle.index());
            throw GraphError(GraphErrorKind::MissingDescriptor,
                             eastl::string(toString(RenderResourceTraits<R>::kKind)) + " has no descriptor");
        }
        return *descriptor;
    }

    // Carries the resource into the next frame under label
    template<typename R>
    void markRetain(const eastl::string& label, const ResourceHandle<R>& handle) {
        static_assert(RenderResourceTraits<R>::kRetainable, "resource kind cannot be retained across frames");
        requireBuilding("markRetain");
        graph.requireLiveHandle(handle, "markRetain");

        if (label.empty() || !graph.store<R>().contains(handle.index())) {
            Log::critical("RenderGraph", "Cannot retain {} {} as '{}'", toString(RenderResourceTraits<R>::kKind),
                          handle.index(), label.c_str());
            throw GraphError(GraphErrorKind::IllegalRetain, "Retention requires a non-empty label and a declared resource");
        }
        graph.store<R>().markRetain(handle.index(), label);
    }

    // Adopts the resource retained under label last frame. Empty on cold start.
    template<typename R>
    eastl::optional<ResourceHandle<R>> getRetained(const eastl::string& label) {
        static_assert(RenderResourceTraits<R>::kRetainable, "resource kind cannot be retained across frames");
        requireBuilding("getRetained");

        if (!graph.store<R>().getRetained(label)) {
            Log::debug("RenderGraph", "No retained {} '{}' (cold start)", toString(RenderResourceTraits<R>::kKind), label.c_str());
            return eastl::nullopt;
        }
        ResourceId id = graph.slots.allocate(RenderResourceTraits<R>::kKind);
        graph.store<R>().adoptRetained(id.index, label);
        Log::trace("RenderGraph", "Adopted retained {} '{}' as {}", toString(RenderResourceTraits<R>::kKind),
                   label.c_str(), id.index);
        return makeResourceHandle<R>(id);
    }

    BindGroupId newBindGroup(BindGroupDesc desc);

    RenderGraphBuilder& addNode(const eastl::string& name, RenderDependencies dependencies, NodeFunction function);

    DeviceFeatures features() const;
    const DeviceLimits& limits() const;

private:
    void requireBuilding(const char* operation) const;

    RenderGraph& graph;
};

} // namespace ember
