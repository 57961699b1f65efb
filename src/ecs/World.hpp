#pragma once

#include <entt/entt.hpp>
#include <EASTL/utility.h>

namespace ember {

// Entity/component world. Views are entities; process-wide singletons
// ("world resources") live in the registry context.
class World {
public:
    World() = default;
    ~World() = default;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    entt::entity createEntity() {
        return registry.create();
    }

    void destroyEntity(entt::entity entity) {
        registry.destroy(entity);
    }

    template<typename Component, typename... Args>
    Component& addComponent(entt::entity entity, Args&&... args) {
        return registry.emplace_or_replace<Component>(entity, eastl::forward<Args>(args)...);
    }

    template<typename Component>
    void removeComponent(entt::entity entity) {
        registry.remove<Component>(entity);
    }

    template<typename Component>
    bool hasComponent(entt::entity entity) const {
        return registry.valid(entity) && registry.all_of<Component>(entity);
    }

    template<typename Component>
    Component& getComponent(entt::entity entity) {
        return registry.get<Component>(entity);
    }

    template<typename Component>
    const Component& getComponent(entt::entity entity) const {
        return registry.get<Component>(entity);
    }

    template<typename Component>
    const Component* tryGetComponent(entt::entity entity) const {
        return registry.valid(entity) ? registry.try_get<Component>(entity) : nullptr;
    }

    template<typename... Components>
    auto view() {
        return registry.view<Components...>();
    }

    template<typename... Components>
    auto view() const {
        return registry.view<Components...>();
    }

    // World resources
    template<typename Resource>
    Resource& insertResource(Resource resource) {
        return registry.ctx().insert_or_assign(eastl::move(resource));
    }

    template<typename Resource, typename... Args>
    Resource& emplaceResource(Args&&... args) {
        registry.ctx().erase<Resource>();
        return registry.ctx().emplace<Resource>(eastl::forward<Args>(args)...);
    }

    template<typename Resource>
    Resource* getResource() {
        return registry.ctx().find<Resource>();
    }

    template<typename Resource>
    const Resource* getResource() const {
        return registry.ctx().find<Resource>();
    }

    template<typename Resource>
    bool hasResource() const {
        return registry.ctx().contains<Resource>();
    }

    template<typename Resource>
    void removeResource() {
        registry.ctx().erase<Resource>();
    }

    bool isEntityValid(entt::entity entity) const {
        return registry.valid(entity);
    }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    entt::registry registry;
};

} // namespace ember
