#pragma once

#include <entt/entt.hpp>
#include <EASTL/string.h>

#include "core/Exception.hpp"
#include "core/Log.hpp"
#include "ecs/World.hpp"

namespace ember {

// World and view lookups shared by RenderGraphBuilder and NodeContext
class ViewScope {
public:
    entt::entity viewId() const { return view; }
    World& world() const { return *worldRef; }

    template<typename T>
    T& worldResource() const {
        T* resource = worldRef->getResource<T>();
        if (!resource) {
            auto name = entt::type_id<T>().name();
            Log::critical("RenderGraph", "World resource '{}' is not present", name);
            throw GraphError(GraphErrorKind::MissingWorldResource,
                             eastl::string("Missing world resource: ") + eastl::string(name.data(), name.size()));
        }
        return *resource;
    }

    template<typename T>
    T* getWorldResource() const {
        return worldRef->getResource<T>();
    }

    template<typename Component>
    bool viewContains() const {
        return worldRef->hasComponent<Component>(view);
    }

    template<typename Component>
    const Component* viewGet() const {
        return worldRef->tryGetComponent<Component>(view);
    }

protected:
    ViewScope(World& world, entt::entity viewEntity) : worldRef(&world), view(viewEntity) {}

    World* worldRef;
    entt::entity view;
};

} // namespace ember
