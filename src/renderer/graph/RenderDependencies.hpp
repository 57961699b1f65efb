#pragma once

#include <EASTL/hash_set.h>
#include <initializer_list>
#include <cstdint>

#include "RenderResource.hpp"

namespace ember {

struct RenderDependency {
    enum class Type : uint8_t {
        Read,
        ReadWrite,
        BindGroup
    };

    Type type = Type::Read;
    ResourceId id;
};

template<typename R>
RenderDependency read(const ResourceHandle<R>& handle) {
    return RenderDependency{RenderDependency::Type::Read, handle.id()};
}

// Advances the handle's generation. The returned dependency and the handle
// both denote the post-write version from here on.
template<typename R>
RenderDependency write(ResourceHandle<R>& handle) {
    static_assert(RenderResourceTraits<R>::kWritable, "resource kind cannot be declared as a write target");
    handle.advanceGeneration();
    return RenderDependency{RenderDependency::Type::ReadWrite, handle.id()};
}

inline RenderDependency uses(BindGroupId bindGroup) {
    return RenderDependency{RenderDependency::Type::BindGroup, bindGroup.id};
}

/**
 * @brief Declared footprint of one node
 *
 * Built additively before the node is attached to the graph, immutable once
 * attached. Serves as the access-control list for NodeContext resolution.
 *
 * Declare write dependencies in a statement of their own before capturing
 * the handle in the node closure, so the closure sees the post-write id.
 */
class RenderDependencies {
public:
    RenderDependencies() = default;

    static RenderDependencies of(std::initializer_list<RenderDependency> dependencies);

    RenderDependencies& add(const RenderDependency& dependency);
    RenderDependencies& addMany(std::initializer_list<RenderDependency> dependencies);

    template<typename Iterator>
    RenderDependencies& addMany(Iterator first, Iterator last) {
        for (; first != last; ++first) {
            add(*first);
        }
        return *this;
    }

    template<typename R>
    bool containsResource(const ResourceHandle<R>& handle) const {
        return containsResourceId(handle.id());
    }

    bool containsResourceId(ResourceId id) const;
    bool containsBindGroup(BindGroupId bindGroup) const;

    const eastl::hash_set<ResourceId>& reads() const { return readSet; }
    const eastl::hash_set<ResourceId>& writes() const { return writeSet; }
    const eastl::hash_set<BindGroupId>& bindGroups() const { return bindGroupSet; }

    bool empty() const { return readSet.empty() && writeSet.empty() && bindGroupSet.empty(); }

private:
    eastl::hash_set<ResourceId> readSet;
    eastl::hash_set<ResourceId> writeSet;
    eastl::hash_set<BindGroupId> bindGroupSet;
};

template<typename... Dependencies>
RenderDependencies renderDeps(Dependencies... dependencies) {
    return RenderDependencies::of({dependencies...});
}

} // namespace ember
