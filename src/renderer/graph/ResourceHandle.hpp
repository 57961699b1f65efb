#pragma once

#include <cstdint>
#include <EASTL/functional.h>

namespace ember {

// Slot index plus generation. The generation advances with every write
// declared against the slot, so two ids are equal only if both fields match.
struct ResourceId {
    uint16_t index = 0;
    uint16_t generation = 0;

    constexpr bool operator==(const ResourceId& other) const noexcept {
        return index == other.index && generation == other.generation;
    }
    constexpr bool operator!=(const ResourceId& other) const noexcept { return !(*this == other); }
};

constexpr uint32_t packResourceId(ResourceId id) noexcept {
    return (static_cast<uint32_t>(id.index) << 16) | id.generation;
}

struct RenderDependency;
template<typename R> class ResourceHandle;
template<typename R> ResourceHandle<R> makeResourceHandle(ResourceId id);
template<typename R> RenderDependency write(ResourceHandle<R>& handle);

// Non-owning, copyable capability token bound to one resource kind at compile time
template<typename R>
class ResourceHandle {
public:
    using Resource = R;

    ResourceHandle() = default;

    const ResourceId& id() const noexcept { return resourceId; }
    uint16_t index() const noexcept { return resourceId.index; }
    uint16_t generation() const noexcept { return resourceId.generation; }

    bool operator==(const ResourceHandle& other) const noexcept { return resourceId == other.resourceId; }
    bool operator!=(const ResourceHandle& other) const noexcept { return resourceId != other.resourceId; }

private:
    friend ResourceHandle makeResourceHandle<R>(ResourceId id);
    friend RenderDependency write<R>(ResourceHandle<R>& handle);

    explicit ResourceHandle(ResourceId id) : resourceId(id) {}

    void advanceGeneration() noexcept { ++resourceId.generation; }

    ResourceId resourceId;
};

template<typename R>
ResourceHandle<R> makeResourceHandle(ResourceId id) {
    return ResourceHandle<R>(id);
}

// Bind groups are tracked by identity within a dependency set
struct BindGroupId {
    ResourceId id;

    constexpr bool operator==(const BindGroupId& other) const noexcept { return id == other.id; }
    constexpr bool operator!=(const BindGroupId& other) const noexcept { return id != other.id; }
};

} // namespace ember

namespace eastl {
    template<>
    struct hash<ember::ResourceId> {
        size_t operator()(const ember::ResourceId& id) const noexcept {
            return static_cast<size_t>(ember::packResourceId(id));
        }
    };

    template<>
    struct hash<ember::BindGroupId> {
        size_t operator()(const ember::BindGroupId& group) const noexcept {
            return static_cast<size_t>(ember::packResourceId(group.id));
        }
    };
}
